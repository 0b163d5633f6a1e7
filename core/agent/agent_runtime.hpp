#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "filesystem_indexer.hpp"
#include "i_agent_channel.hpp"
#include "operation_dispatcher.hpp"
#include "protocol/messages.hpp"
#include "reconnect_policy.hpp"
#include "runtime/config.hpp"
#include "worker_pool.hpp"

namespace hostlink {
namespace agent {

constexpr int kCloseHeartbeatTimeout = 4000;
constexpr int kCloseConnectFailed = 1006;

/**
 * @brief Duplex client side of the bridge
 *
 * run() drives ReconnectPolicy: it opens the channel, sends agent-metadata
 * (with the filesystem index built on the first successful connection and
 * reused afterwards), keeps the heartbeat going and waits for the channel to
 * close, then backs off and reconnects until stopped or TERMINAL.
 *
 * Inbound operation envelopes are executed on a WorkerPool through the
 * OperationDispatcher, so the channel's I/O thread never runs an operation.
 * Each reply carries the request's id.
 *
 * Dead connections: every inbound message refreshes the activity clock. When
 * two heartbeat intervals pass with nothing received, the channel is closed
 * with 4000, which counts as a non-graceful close and leads to backoff.
 */
class AgentRuntime {
public:
    using Clock = std::chrono::steady_clock;

    AgentRuntime(const runtime::AgentConfig &config, std::shared_ptr<IAgentChannel> channel,
                 OperationDispatcher &dispatcher, std::optional<int> http_port);
    ~AgentRuntime();

    AgentRuntime(const AgentRuntime &) = delete;
    AgentRuntime &operator=(const AgentRuntime &) = delete;

    /**
     * @brief Connect and serve until stop(), a graceful close, or TERMINAL
     *
     * @return false only when reconnect attempts were exhausted
     */
    bool run();

    // Close with 1000 and make run() return; safe from any thread
    void stop();

    // Close the current connection with 1000 without stopping the process
    void disconnect(const std::string &reason);

    // Process one inbound text frame (called from the channel's I/O thread)
    void handle_message(const std::string &text);

    ConnectionLifecycle lifecycle() const;

    // <server_url><path>?userId=..&type=agent&pid=..[&token=..]
    std::string connection_url() const;

    protocol::AgentMetadata build_metadata();

private:
    // One open connection: returns the close code that ended it
    int serve_connection();

    void on_channel_closed(int code, const std::string &reason);
    void send_message(const nlohmann::json &message);
    void handle_control(const std::string &type, const nlohmann::json &message);
    void handle_operation(const nlohmann::json &message);

    void set_lifecycle(const ConnectionLifecycle &next);

    runtime::AgentConfig config_;
    std::shared_ptr<IAgentChannel> channel_;
    OperationDispatcher &dispatcher_;
    std::optional<int> http_port_;
    ReconnectPolicy policy_;
    FilesystemIndexer indexer_;
    WorkerPool workers_;

    std::optional<protocol::FilesystemIndex> cached_index_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ConnectionLifecycle lifecycle_;
    bool stop_requested_ = false;
    bool connection_closed_ = false;
    int close_code_ = 0;
    Clock::time_point last_inbound_;
};

}  // namespace agent
}  // namespace hostlink
