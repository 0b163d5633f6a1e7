#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace hostlink {
namespace runtime {

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
    std::string file;            // Optional log file (stderr always)
};

// Shared by the bridge REST API and the loopback daemon
struct HttpConfig {
    bool enabled = true;                                 // HTTP server enabled
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 3000;                                     // HTTP port
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
    int thread_pool_size = 8;                            // Worker thread pool size
};

struct WebSocketConfig {
    std::string bind = "0.0.0.0";
    int port = 3001;
    std::string path = "/api/bridge";  // Upgrade path agents connect to
};

// bridge: section (cloud side)
struct BridgeConfig {
    WebSocketConfig websocket;
    HttpConfig api;
    int64_t request_timeout_ms = 30000;          // Default deadline for request_operation
    size_t max_inflight_per_user = 64;           // Fail fast with OVERLOADED beyond this
    int sweep_interval_ms = 100;                 // Deadline / idle sweep period
    int64_t idle_timeout_ms = 75000;             // Force-close connections silent this long
    std::string daemon_url = "http://127.0.0.1:4001";  // Local daemon probed by the status resolver
    int health_timeout_ms = 200;                 // Quick liveness probe
    int status_timeout_ms = 2000;                // Plan metadata probe
};

struct ReconnectConfig {
    int base_delay_ms = 3000;
    int max_delay_ms = 30000;
    int max_attempts = 10;
};

struct IndexConfig {
    bool enabled = true;
    int max_depth = 2;
};

struct ExecConfig {
    std::string shell = "/bin/sh";
    int64_t default_timeout_ms = 60000;
    size_t max_output_bytes = 1024 * 1024;  // Per stream
};

// agent: section (user side, duplex client)
struct AgentConfig {
    std::string server_url = "ws://localhost:3001";
    std::string path = "/api/bridge";
    std::string user_id;
    std::string auth_token;
    int heartbeat_interval_ms = 30000;
    int connect_timeout_ms = 10000;
    int workers = 4;  // Operation dispatch threads
    ReconnectConfig reconnect;
    IndexConfig index;
    ExecConfig exec;
};

// daemon: section (user side, loopback HTTP)
struct DaemonConfig {
    HttpConfig http{true, "127.0.0.1", 4001, {"*"}, false, 8};
    size_t audit_log_capacity = 1000;
};

struct HostlinkConfig {
    LoggingConfig logging;
    BridgeConfig bridge;
    AgentConfig agent;
    DaemonConfig daemon;
};

// Loads configuration from a YAML file (no validation; see validate_* below)
bool load_config(const std::string &config_path, HostlinkConfig &config, std::string &error);

// Validation for the sections each executable actually uses
bool validate_logging_config(const LoggingConfig &config, std::string &error);
bool validate_bridge_config(const HostlinkConfig &config, std::string &error);
bool validate_agent_config(const HostlinkConfig &config, std::string &error);

// True for 127.0.0.0/8, ::1 and "localhost"
bool is_loopback_address(const std::string &address);

}  // namespace runtime
}  // namespace hostlink
