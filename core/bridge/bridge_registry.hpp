#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "i_agent_transport.hpp"
#include "protocol/errors.hpp"
#include "protocol/messages.hpp"
#include "protocol/operation.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace bridge {

enum class ConnectionState { CONNECTING, OPEN, CLOSED };

std::string connection_state_to_string(ConnectionState state);

// Close codes sent by the bridge
constexpr int kCloseNormal = 1000;
constexpr int kCloseGoingAway = 1001;
constexpr int kClosePolicyViolation = 1008;
constexpr int kCloseHeartbeatTimeout = 4000;

/**
 * @brief Server-side connection registry and request/response correlator
 *
 * BridgeRegistry owns at most one live connection per user and the table of
 * in-flight requests keyed by correlation id. Callers submit operations with
 * request_operation_async() (or the future-returning request_operation());
 * the registry writes an envelope to the user's transport and settles the
 * request later from one of three events:
 * - a matching response envelope (handle_message)
 * - the connection closing or being replaced (handle_disconnect / register_connection)
 * - the deadline passing (sweep)
 *
 * Invariants:
 * - Every pending request is settled exactly once; the entry is erased under
 *   the lock before its completion runs, so competing events cannot both win.
 * - Completions run outside the lock and may call back into the registry.
 * - A user has zero or one connection. Connection ids are never reused, so a
 *   late close event for a replaced connection cannot remove its successor.
 * - A user never has more than max_inflight_per_user pending requests;
 *   beyond that requests fail fast with OVERLOADED.
 *
 * Thread Safety:
 * - All methods are thread-safe; a single mutex guards connections and pending table.
 * - Transport writes happen outside the lock.
 *
 * Usage Pattern:
 * ```cpp
 * BridgeRegistry registry(config.bridge);
 * registry.start();  // background deadline sweep
 *
 * // WebSocket adapter
 * auto id = registry.register_connection(user, transport);
 * registry.handle_message(user, id, text);
 * registry.handle_disconnect(user, id, "closed by peer");
 *
 * // Route layer
 * auto result = registry.request_operation(user, protocol::ReadRequest{"/tmp/a.txt"}).get();
 * ```
 */
class BridgeRegistry {
public:
    using Clock = std::chrono::steady_clock;
    using Completion = std::function<void(const protocol::OperationResult &)>;

    explicit BridgeRegistry(const runtime::BridgeConfig &config);
    ~BridgeRegistry();

    // Non-copyable, non-movable (manages mutex and sweeper thread)
    BridgeRegistry(const BridgeRegistry &) = delete;
    BridgeRegistry &operator=(const BridgeRegistry &) = delete;
    BridgeRegistry(BridgeRegistry &&) = delete;
    BridgeRegistry &operator=(BridgeRegistry &&) = delete;

    /**
     * @brief Install a new connection for a user
     *
     * If the user already has a connection, it is removed, its pending
     * requests are settled with DISCONNECTED, and its transport is closed
     * with code 1000 before this call returns. The new connection starts in
     * CONNECTING and becomes OPEN on its first valid agent-metadata message.
     * A {type: "connected"} greeting is sent to the new transport.
     *
     * @return Connection id to pass to handle_message / handle_disconnect
     */
    uint64_t register_connection(const std::string &user_id, std::shared_ptr<IAgentTransport> transport);

    /**
     * @brief Process one inbound text frame from a connection
     *
     * Handles agent-metadata, ping and response envelopes. Frames from a
     * connection that is no longer current for the user are dropped.
     */
    void handle_message(const std::string &user_id, uint64_t connection_id, const std::string &text);

    /**
     * @brief Connection closed or failed
     *
     * No-op unless connection_id is the user's current connection. Settles
     * all of that connection's pending requests with DISCONNECTED.
     */
    void handle_disconnect(const std::string &user_id, uint64_t connection_id, const std::string &reason);

    /**
     * @brief Submit an operation without blocking
     *
     * Fails fast (completion invoked before returning, no I/O) with
     * NOT_CONNECTED when the user has no OPEN connection, OVERLOADED when the
     * per-user cap is reached and INVALID_ARGUMENT for a non-positive timeout.
     * A transport write failure settles with SEND_FAILURE; nothing is retried.
     *
     * @param timeout_ms Deadline, defaults to bridge.request_timeout_ms
     * @param done Invoked exactly once, possibly on another thread
     */
    void request_operation_async(const std::string &user_id, const protocol::Operation &op,
                                 std::optional<int64_t> timeout_ms, Completion done);

    // Future-returning wrapper around request_operation_async
    std::future<protocol::OperationResult> request_operation(const std::string &user_id,
                                                             const protocol::Operation &op,
                                                             std::optional<int64_t> timeout_ms = std::nullopt);

    // True iff the user has an OPEN connection
    bool is_connected(const std::string &user_id) const;

    // CLOSED when the user has no connection
    ConnectionState connection_state(const std::string &user_id) const;

    // Latest metadata reported by the user's agent; kept after disconnect
    std::optional<protocol::AgentMetadata> get_metadata(const std::string &user_id) const;

    // Users with an OPEN connection
    std::vector<std::string> connected_users() const;

    size_t pending_count(const std::string &user_id) const;
    size_t pending_count() const;

    /**
     * @brief Expire deadlines and idle connections as of `now`
     *
     * Pending requests past their deadline settle with TIMEOUT. Connections
     * with no inbound traffic for idle_timeout_ms are closed with code 4000
     * and treated as disconnected. Called by the sweeper thread; public so
     * tests can drive time explicitly.
     */
    void sweep(Clock::time_point now);

    // Start/stop the background sweeper (sweep_interval_ms)
    void start();
    void stop();

    // Close every connection (code 1001) and settle everything still pending
    void shutdown();

private:
    struct Connection {
        uint64_t id = 0;
        std::shared_ptr<IAgentTransport> transport;
        ConnectionState state = ConnectionState::CONNECTING;
        Clock::time_point connected_at;
        Clock::time_point last_activity;
        std::optional<protocol::AgentMetadata> metadata;
    };

    struct PendingRequest {
        std::string user_id;
        uint64_t connection_id = 0;
        protocol::OperationKind kind = protocol::OperationKind::FS_LIST;
        Clock::time_point deadline;
        Completion done;
    };

    using Settlement = std::pair<Completion, protocol::OperationResult>;

    // Remove all pending requests owned by a connection (caller holds mutex_)
    void take_pending_for_connection(uint64_t connection_id, protocol::ErrorKind kind, const std::string &message,
                                     std::vector<Settlement> &out);

    // Decrement the user's in-flight count (caller holds mutex_)
    void release_slot(const std::string &user_id);

    void handle_control(const std::string &user_id, uint64_t connection_id, const nlohmann::json &message);
    void handle_response(const std::string &user_id, uint64_t connection_id, const nlohmann::json &message);

    // Send outside the lock; failures are logged, the connection is left to its close handler
    void send_control(const std::shared_ptr<IAgentTransport> &transport, const nlohmann::json &message);

    static void run_settlements(std::vector<Settlement> &settlements);

    void sweeper_loop();

    runtime::BridgeConfig config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Connection> connections_;
    std::unordered_map<std::string, PendingRequest> pending_;
    std::unordered_map<std::string, size_t> inflight_per_user_;
    std::unordered_map<std::string, protocol::AgentMetadata> last_metadata_;
    uint64_t next_connection_id_ = 0;
    uint64_t next_request_seq_ = 0;

    std::atomic<bool> running_{false};
    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    std::thread sweeper_thread_;
};

}  // namespace bridge
}  // namespace hostlink
