/**
 * agent_runtime_test.cpp - agent connection loop against an in-memory channel
 *
 * Tests:
 * 1. Inbound operations are executed and answered with the request id
 * 2. Control messages (ping, plan-approve)
 * 3. Metadata on connect, graceful close, reconnect after abnormal close
 * 4. TERMINAL after exhausting attempts
 * 5. Missed heartbeats close the connection with 4000
 */

#include "agent/agent_runtime.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <memory>
#include <thread>

#include "mocks/mock_agent_channel.hpp"
#include "protocol/messages.hpp"

using namespace hostlink;
using namespace hostlink::agent;
using namespace hostlink::tests;
using namespace std::chrono_literals;
using json = nlohmann::json;
namespace fs = std::filesystem;

class AgentRuntimeTest : public ::testing::Test {
protected:
    fs::path home;
    PlanGuard guard;
    ActionLog log{100};
    std::unique_ptr<OperationDispatcher> dispatcher;
    std::shared_ptr<FakeAgentChannel> channel = std::make_shared<FakeAgentChannel>();
    runtime::AgentConfig config;

    void SetUp() override {
        home = fs::temp_directory_path() / "hostlink_agent_runtime_test";
        fs::remove_all(home);
        fs::create_directories(home / "Documents");
        std::ofstream(home / "Documents" / "a.txt") << "alpha";

        dispatcher = std::make_unique<OperationDispatcher>("alice", PathResolver(home.string()), guard, log,
                                                           runtime::ExecConfig{});

        config.server_url = "ws://bridge.test:3001";
        config.user_id = "alice";
        config.heartbeat_interval_ms = 60000;
        config.workers = 2;
        config.reconnect.base_delay_ms = 1;
        config.reconnect.max_delay_ms = 5;
        config.reconnect.max_attempts = 2;
        config.index.enabled = false;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(home, ec);
    }

    std::unique_ptr<AgentRuntime> make_runtime(std::optional<int> http_port = std::nullopt) {
        return std::make_unique<AgentRuntime>(config, channel, *dispatcher, http_port);
    }

    // Most recent sent frame matching a predicate
    json find_sent(const std::function<bool(const json &)> &match) {
        for (const auto &frame : channel->sent()) {
            json message = json::parse(frame);
            if (match(message)) {
                return message;
            }
        }
        return json();
    }
};

// ============================================================================
// Message handling
// ============================================================================

TEST_F(AgentRuntimeTest, OperationIsAnsweredWithItsId) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    channel->deliver(json({{"id", "req-1"}, {"operation", "fs.read"}, {"path", "~/Documents/a.txt"}}).dump());
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));

    json reply = json::parse(channel->sent()[0]);
    EXPECT_EQ(reply["id"], "req-1");
    EXPECT_EQ(reply["data"]["content"], "alpha");
}

TEST_F(AgentRuntimeTest, DeniedOperationCarriesErrorCode) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    channel->deliver(json({{"id", "req-2"}, {"operation", "fs.delete"}, {"path", "~/Documents/a.txt"}}).dump());
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));

    json reply = json::parse(channel->sent()[0]);
    EXPECT_EQ(reply["id"], "req-2");
    EXPECT_EQ(reply["errorCode"], "DENIED");
    EXPECT_TRUE(fs::exists(home / "Documents" / "a.txt"));
}

TEST_F(AgentRuntimeTest, MalformedOperationWithIdIsRejected) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    channel->deliver(json({{"id", "req-3"}, {"operation", "fs.read"}}).dump());
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));
    json reply = json::parse(channel->sent()[0]);
    EXPECT_EQ(reply["id"], "req-3");
    EXPECT_TRUE(reply.contains("error"));

    // Garbage without an id gets no reply
    channel->deliver("{broken");
    channel->deliver(json({{"operation", "fs.read"}, {"path", "/"}}).dump());
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(channel->sent().size(), 1u);
}

TEST_F(AgentRuntimeTest, PingIsAnsweredWithPong) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    channel->deliver(protocol::dump_message(protocol::make_ping(1)));
    ASSERT_EQ(channel->sent().size(), 1u);
    EXPECT_EQ(json::parse(channel->sent()[0])["type"], "pong");
}

TEST_F(AgentRuntimeTest, PlanApproveInstallsResolvedPlan) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    protocol::Plan plan;
    plan.mode = protocol::PlanMode::BALANCED;
    plan.allowed_directories = {"~/Documents"};
    plan.allowed_operations = {protocol::Capability::READ, protocol::Capability::WRITE};
    channel->deliver(protocol::dump_message(protocol::make_plan_approve(plan)));

    json reply = json::parse(channel->sent().at(0));
    EXPECT_EQ(reply["type"], "plan-approved");
    EXPECT_EQ(reply["plan"]["allowedDirectories"][0], (home / "Documents").string());

    auto installed = guard.current_plan();
    ASSERT_TRUE(installed.has_value());
    EXPECT_EQ(installed->mode, protocol::PlanMode::BALANCED);
}

TEST_F(AgentRuntimeTest, InvalidPlanIsIgnored) {
    auto agent = make_runtime();
    std::string error;
    ASSERT_TRUE(channel->open("test", 0, error));

    channel->deliver(json({{"type", "plan-approve"}, {"plan", {{"mode", "reckless"}}}}).dump());
    EXPECT_TRUE(channel->sent().empty());
    EXPECT_FALSE(guard.current_plan().has_value());
}

// ============================================================================
// Connection loop
// ============================================================================

TEST_F(AgentRuntimeTest, ConnectsSendsMetadataAndStopsOnGracefulClose) {
    auto agent = make_runtime(4001);
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });

    ASSERT_TRUE(channel->wait_for_sent(1, 2s));
    json metadata = json::parse(channel->sent()[0]);
    EXPECT_EQ(metadata["type"], "agent-metadata");
    EXPECT_EQ(metadata["userId"], "alice");
    EXPECT_EQ(metadata["homeDirectory"], home.string());
    EXPECT_EQ(metadata["httpPort"], 4001);
    EXPECT_EQ(agent->lifecycle().state, AgentState::CONNECTED);

    const std::string url = channel->urls().at(0);
    EXPECT_EQ(url.rfind("ws://bridge.test:3001/api/bridge?userId=alice&type=agent&pid=", 0), 0u);

    channel->remote_close(1000);
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(done.get());
    EXPECT_EQ(agent->lifecycle().state, AgentState::DISCONNECTED);
    EXPECT_EQ(channel->open_attempts(), 1);
}

TEST_F(AgentRuntimeTest, ReconnectsAfterAbnormalClose) {
    auto agent = make_runtime();
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });

    ASSERT_TRUE(channel->wait_for_sent(1, 2s));
    channel->remote_close(1006);

    // A second connection sends metadata again
    ASSERT_TRUE(channel->wait_for_sent(2, 2s));
    EXPECT_EQ(channel->open_attempts(), 2);
    EXPECT_EQ(json::parse(channel->sent()[1])["type"], "agent-metadata");

    agent->stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(done.get());
}

TEST_F(AgentRuntimeTest, TerminalAfterExhaustingAttempts) {
    channel->default_open_result = false;
    auto agent = make_runtime();

    EXPECT_FALSE(agent->run());
    EXPECT_EQ(agent->lifecycle().state, AgentState::TERMINAL);
    EXPECT_EQ(channel->open_attempts(), config.reconnect.max_attempts + 1);
}

TEST_F(AgentRuntimeTest, RecoversAfterFailedOpens) {
    channel->script_opens({false, true});
    auto agent = make_runtime();
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });

    ASSERT_TRUE(channel->wait_for_sent(1, 2s));
    EXPECT_EQ(channel->open_attempts(), 2);
    EXPECT_EQ(agent->lifecycle().attempt, 0);

    agent->stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(done.get());
}

TEST_F(AgentRuntimeTest, DisconnectEndsRunWithoutReconnecting) {
    auto agent = make_runtime();
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));

    agent->disconnect("kill switch");
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(done.get());
    ASSERT_FALSE(channel->local_closes().empty());
    EXPECT_EQ(channel->local_closes()[0], 1000);
    EXPECT_EQ(channel->open_attempts(), 1);
}

TEST_F(AgentRuntimeTest, StopDuringOpenClosesTheNewConnection) {
    auto agent = make_runtime();
    channel->before_open_completes = [&agent]() { agent->stop(); };

    EXPECT_TRUE(agent->run());
    EXPECT_FALSE(channel->is_open());
    ASSERT_EQ(channel->local_closes().size(), 2u);
    EXPECT_EQ(channel->local_closes()[1], kCloseCodeNormal);
    EXPECT_EQ(channel->open_attempts(), 1);
}

TEST_F(AgentRuntimeTest, MissedHeartbeatsCloseWith4000) {
    config.heartbeat_interval_ms = 20;
    config.reconnect.max_attempts = 1;
    auto agent = make_runtime();
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });

    // Nothing is ever delivered, so the first connection is dropped after two intervals
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));
    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (channel->local_closes().empty() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    ASSERT_FALSE(channel->local_closes().empty());
    EXPECT_EQ(channel->local_closes()[0], kCloseHeartbeatTimeout);

    agent->stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    done.get();
}

TEST_F(AgentRuntimeTest, PongsKeepConnectionAlive) {
    config.heartbeat_interval_ms = 20;
    auto agent = make_runtime();
    auto done = std::async(std::launch::async, [&agent]() { return agent->run(); });
    ASSERT_TRUE(channel->wait_for_sent(1, 2s));

    auto until = std::chrono::steady_clock::now() + 200ms;
    while (std::chrono::steady_clock::now() < until) {
        channel->deliver(protocol::dump_message(protocol::make_pong(protocol::now_ms())));
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(channel->local_closes().empty());
    EXPECT_EQ(channel->open_attempts(), 1);

    // Pings went out while connected
    json ping = find_sent([](const json &m) { return m.value("type", "") == "ping"; });
    ASSERT_TRUE(ping.is_object());
    EXPECT_TRUE(ping.contains("timestamp"));

    agent->stop();
    ASSERT_EQ(done.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(done.get());
}
