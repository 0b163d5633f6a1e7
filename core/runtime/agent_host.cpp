#include "agent_host.hpp"

#include <chrono>
#include <optional>

#include "agent/path_resolver.hpp"
#include "agent/ws_agent_channel.hpp"
#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace hostlink {
namespace runtime {

namespace {
constexpr int kMainLoopPollMs = 100;
}  // namespace

AgentHost::AgentHost(const HostlinkConfig &config)
    : config_(config), action_log_(config.daemon.audit_log_capacity) {}

AgentHost::~AgentHost() { shutdown(); }

bool AgentHost::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing agent for user '" << config_.agent.user_id << "'");

    const std::string home = agent::PathResolver::detect_home_directory();
    dispatcher_ = std::make_unique<agent::OperationDispatcher>(config_.agent.user_id, agent::PathResolver(home),
                                                               guard_, action_log_, config_.agent.exec);
    LOG_INFO("[Runtime] Home directory: " << home);

    std::optional<int> http_port;
    if (config_.daemon.http.enabled) {
        http_port = config_.daemon.http.port;
    }
    agent_ = std::make_unique<agent::AgentRuntime>(config_.agent, std::make_shared<agent::WsAgentChannel>(),
                                                   *dispatcher_, http_port);

    if (config_.daemon.http.enabled) {
        daemon_ = std::make_unique<daemon::DaemonServer>(
            config_.daemon, *dispatcher_,
            [this]() { return agent_->lifecycle().state == agent::AgentState::CONNECTED; },
            [this]() { agent_->disconnect("kill switch"); });
        std::string http_error;
        if (!daemon_->start(http_error)) {
            error = "Daemon failed to start: " + http_error;
            return false;
        }
    } else {
        LOG_INFO("[Runtime] Loopback daemon disabled in config");
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool AgentHost::run() {
    agent_thread_ = std::thread([this]() {
        const bool ok = agent_->run();
        agent_terminal_.store(!ok);
        agent_finished_.store(true);
    });

    LOG_INFO("[Runtime] Press Ctrl+C to exit");
    bool reported = false;
    while (!SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kMainLoopPollMs));

        if (agent_finished_.load() && !reported) {
            reported = true;
            if (agent_terminal_.load() && !daemon_) {
                LOG_ERROR("[Runtime] Agent gave up and no daemon is running, exiting");
                return false;
            }
            LOG_INFO("[Runtime] Duplex connection ended; "
                     << (daemon_ ? "loopback daemon still serving" : "waiting for signal"));
        }
    }
    LOG_INFO("[Runtime] Signal received, stopping...");
    return true;
}

void AgentHost::shutdown() {
    if (agent_) {
        LOG_INFO("[Runtime] Stopping agent");
        agent_->stop();
    }
    if (agent_thread_.joinable()) {
        agent_thread_.join();
    }
    if (daemon_) {
        LOG_INFO("[Runtime] Stopping daemon");
        daemon_->stop();
        daemon_.reset();
    }
    agent_.reset();
    dispatcher_.reset();
}

}  // namespace runtime
}  // namespace hostlink
