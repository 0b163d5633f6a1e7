#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "agent/action_log.hpp"
#include "agent/agent_runtime.hpp"
#include "agent/operation_dispatcher.hpp"
#include "agent/plan_guard.hpp"
#include "config.hpp"
#include "daemon/daemon_server.hpp"

namespace hostlink {
namespace runtime {

/**
 * @brief User-side process: duplex agent plus loopback daemon
 *
 * Both transports share one OperationDispatcher, PlanGuard and ActionLog.
 * The agent runs on its own thread; when it gives up (TERMINAL) the daemon
 * keeps serving, and the process only exits on a signal, or right away if
 * the daemon is disabled.
 */
class AgentHost {
public:
    explicit AgentHost(const HostlinkConfig &config);
    ~AgentHost();

    bool initialize(std::string &error);

    // Blocks until SIGINT/SIGTERM; false if the agent became TERMINAL with no daemon
    bool run();

    void shutdown();

private:
    HostlinkConfig config_;

    agent::ActionLog action_log_;
    agent::PlanGuard guard_;
    std::unique_ptr<agent::OperationDispatcher> dispatcher_;
    std::unique_ptr<agent::AgentRuntime> agent_;
    std::unique_ptr<daemon::DaemonServer> daemon_;

    std::thread agent_thread_;
    std::atomic<bool> agent_finished_{false};
    std::atomic<bool> agent_terminal_{false};
};

}  // namespace runtime
}  // namespace hostlink
