#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace hostlink::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "hostlink_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    // Config that passes validate_agent_config as-is
    static HostlinkConfig valid_agent() {
        HostlinkConfig config;
        config.agent.user_id = "alice";
        return config;
    }
};

// ============================================================================
// Loading
// ============================================================================

TEST_F(ConfigTest, EmptyFileKeepsDefaults) {
    std::string config_path = create_config_file("empty.yaml", "{}\n");
    HostlinkConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.bridge.websocket.port, 3001);
    EXPECT_EQ(config.bridge.request_timeout_ms, 30000);
    EXPECT_EQ(config.bridge.max_inflight_per_user, 64u);
    EXPECT_EQ(config.bridge.idle_timeout_ms, 75000);
    EXPECT_EQ(config.agent.reconnect.base_delay_ms, 3000);
    EXPECT_EQ(config.agent.reconnect.max_delay_ms, 30000);
    EXPECT_EQ(config.agent.reconnect.max_attempts, 10);
    EXPECT_EQ(config.daemon.http.bind, "127.0.0.1");
    EXPECT_EQ(config.daemon.http.port, 4001);
}

TEST_F(ConfigTest, BridgeSection) {
    std::string config_content = R"(
bridge:
  websocket:
    bind: 0.0.0.0
    port: 9001
    path: /ws/agents
  api:
    port: 9000
    cors_allowed_origins: http://localhost:*
    thread_pool_size: 16
  request_timeout_ms: 5000
  max_inflight_per_user: 8
  sweep_interval_ms: 50
  idle_timeout_ms: 20000
  daemon_url: http://127.0.0.1:4999
)";

    std::string config_path = create_config_file("bridge.yaml", config_content);
    HostlinkConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.bridge.websocket.port, 9001);
    EXPECT_EQ(config.bridge.websocket.path, "/ws/agents");
    EXPECT_EQ(config.bridge.api.port, 9000);
    ASSERT_EQ(config.bridge.api.cors_allowed_origins.size(), 1u);
    EXPECT_EQ(config.bridge.api.cors_allowed_origins[0], "http://localhost:*");
    EXPECT_EQ(config.bridge.api.thread_pool_size, 16);
    EXPECT_EQ(config.bridge.request_timeout_ms, 5000);
    EXPECT_EQ(config.bridge.max_inflight_per_user, 8u);
    EXPECT_EQ(config.bridge.sweep_interval_ms, 50);
    EXPECT_EQ(config.bridge.idle_timeout_ms, 20000);
    EXPECT_EQ(config.bridge.daemon_url, "http://127.0.0.1:4999");

    EXPECT_TRUE(validate_bridge_config(config, error)) << error;
}

TEST_F(ConfigTest, AgentAndDaemonSections) {
    std::string config_content = R"(
logging:
  level: debug

agent:
  server_url: wss://bridge.example.com
  user_id: alice
  auth_token: secret
  heartbeat_interval_ms: 15000
  workers: 2
  reconnect:
    base_delay_ms: 500
    max_delay_ms: 4000
    max_attempts: 3
  index:
    enabled: false
    max_depth: 1
  exec:
    shell: /bin/bash
    default_timeout_ms: 1000
    max_output_bytes: 4096

daemon:
  port: 4555
  cors_allowed_origins:
    - http://localhost:3000
    - https://app.example.com
  audit_log_capacity: 50
)";

    std::string config_path = create_config_file("agent.yaml", config_content);
    HostlinkConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.logging.level, "debug");
    EXPECT_EQ(config.agent.server_url, "wss://bridge.example.com");
    EXPECT_EQ(config.agent.user_id, "alice");
    EXPECT_EQ(config.agent.auth_token, "secret");
    EXPECT_EQ(config.agent.heartbeat_interval_ms, 15000);
    EXPECT_EQ(config.agent.workers, 2);
    EXPECT_EQ(config.agent.reconnect.base_delay_ms, 500);
    EXPECT_EQ(config.agent.reconnect.max_attempts, 3);
    EXPECT_FALSE(config.agent.index.enabled);
    EXPECT_EQ(config.agent.exec.shell, "/bin/bash");
    EXPECT_EQ(config.agent.exec.max_output_bytes, 4096u);
    EXPECT_EQ(config.daemon.http.port, 4555);
    EXPECT_EQ(config.daemon.http.cors_allowed_origins.size(), 2u);
    EXPECT_EQ(config.daemon.audit_log_capacity, 50u);

    EXPECT_TRUE(validate_agent_config(config, error)) << error;
}

TEST_F(ConfigTest, UnknownTopLevelKeysAreIgnored) {
    std::string config_path = create_config_file("unknown.yaml", "providers: []\nagent:\n  user_id: bob\n");
    HostlinkConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.agent.user_id, "bob");
}

TEST_F(ConfigTest, MissingFileFails) {
    HostlinkConfig config;
    std::string error;
    EXPECT_FALSE(load_config((temp_dir / "absent.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYamlFails) {
    std::string config_path = create_config_file("bad.yaml", "agent: [unclosed\n");
    HostlinkConfig config;
    std::string error;
    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, WrongTypeFails) {
    std::string config_path = create_config_file("type.yaml", "bridge:\n  request_timeout_ms: soon\n");
    HostlinkConfig config;
    std::string error;
    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_FALSE(error.empty());
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigTest, InvalidLogLevel) {
    LoggingConfig logging;
    logging.level = "verbose";
    std::string error;
    EXPECT_FALSE(validate_logging_config(logging, error));
    EXPECT_NE(error.find("verbose"), std::string::npos);
}

TEST_F(ConfigTest, BridgeValidation) {
    std::string error;
    HostlinkConfig config;
    EXPECT_TRUE(validate_bridge_config(config, error)) << error;

    config.bridge.api.port = config.bridge.websocket.port;
    EXPECT_FALSE(validate_bridge_config(config, error));

    config = HostlinkConfig();
    config.bridge.websocket.path = "api/bridge";
    EXPECT_FALSE(validate_bridge_config(config, error));

    config = HostlinkConfig();
    config.bridge.max_inflight_per_user = 0;
    EXPECT_FALSE(validate_bridge_config(config, error));

    config = HostlinkConfig();
    config.bridge.sweep_interval_ms = 1;
    EXPECT_FALSE(validate_bridge_config(config, error));

    config = HostlinkConfig();
    config.bridge.api.thread_pool_size = 0;
    EXPECT_FALSE(validate_bridge_config(config, error));
}

TEST_F(ConfigTest, AgentRequiresUserId) {
    HostlinkConfig config;
    std::string error;
    EXPECT_FALSE(validate_agent_config(config, error));
    EXPECT_NE(error.find("user_id"), std::string::npos);

    EXPECT_TRUE(validate_agent_config(valid_agent(), error)) << error;
}

TEST_F(ConfigTest, AgentValidation) {
    std::string error;

    auto config = valid_agent();
    config.agent.server_url = "http://bridge";
    EXPECT_FALSE(validate_agent_config(config, error));

    config = valid_agent();
    config.agent.reconnect.max_delay_ms = 10;
    config.agent.reconnect.base_delay_ms = 100;
    EXPECT_FALSE(validate_agent_config(config, error));

    config = valid_agent();
    config.agent.reconnect.max_attempts = 0;
    EXPECT_FALSE(validate_agent_config(config, error));

    config = valid_agent();
    config.agent.workers = 0;
    EXPECT_FALSE(validate_agent_config(config, error));

    config = valid_agent();
    config.agent.exec.shell.clear();
    EXPECT_FALSE(validate_agent_config(config, error));
}

TEST_F(ConfigTest, DaemonMustBindLoopback) {
    auto config = valid_agent();
    config.daemon.http.bind = "0.0.0.0";
    std::string error;
    EXPECT_FALSE(validate_agent_config(config, error));
    EXPECT_NE(error.find("loopback"), std::string::npos);

    config.daemon.http.enabled = false;
    EXPECT_TRUE(validate_agent_config(config, error)) << error;
}

TEST(LoopbackAddressTest, Classification) {
    EXPECT_TRUE(is_loopback_address("127.0.0.1"));
    EXPECT_TRUE(is_loopback_address("127.1.2.3"));
    EXPECT_TRUE(is_loopback_address("localhost"));
    EXPECT_TRUE(is_loopback_address("::1"));
    EXPECT_FALSE(is_loopback_address("0.0.0.0"));
    EXPECT_FALSE(is_loopback_address("192.168.1.10"));
    EXPECT_FALSE(is_loopback_address(""));
}
