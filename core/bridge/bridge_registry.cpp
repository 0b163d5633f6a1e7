#include "bridge_registry.hpp"

#include "logging/logger.hpp"

namespace hostlink {
namespace bridge {

using protocol::ErrorKind;
using protocol::OperationResult;

std::string connection_state_to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::CONNECTING:
            return "CONNECTING";
        case ConnectionState::OPEN:
            return "OPEN";
        case ConnectionState::CLOSED:
            return "CLOSED";
        default:
            return "CLOSED";
    }
}

BridgeRegistry::BridgeRegistry(const runtime::BridgeConfig &config) : config_(config) {}

BridgeRegistry::~BridgeRegistry() {
    stop();

    // Whatever is still pending can never be answered now
    std::vector<Settlement> settlements;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[id, request] : pending_) {
            settlements.emplace_back(std::move(request.done),
                                     OperationResult::failure(ErrorKind::DISCONNECTED, "Bridge shutting down"));
        }
        pending_.clear();
        inflight_per_user_.clear();
    }
    run_settlements(settlements);
}

uint64_t BridgeRegistry::register_connection(const std::string &user_id, std::shared_ptr<IAgentTransport> transport) {
    std::vector<Settlement> settlements;
    std::shared_ptr<IAgentTransport> replaced;
    uint64_t connection_id = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto existing = connections_.find(user_id);
        if (existing != connections_.end()) {
            replaced = existing->second.transport;
            take_pending_for_connection(existing->second.id, ErrorKind::DISCONNECTED,
                                        "Agent connection replaced by a newer connection", settlements);
            LOG_WARN("[Bridge] Replacing connection " << existing->second.id << " for user '" << user_id << "' ("
                                                      << settlements.size() << " pending request(s) rejected)");
            connections_.erase(existing);
        }

        Connection connection;
        connection.id = ++next_connection_id_;
        connection.transport = transport;
        connection.state = ConnectionState::CONNECTING;
        connection.connected_at = Clock::now();
        connection.last_activity = connection.connected_at;
        connection_id = connection.id;
        connections_.emplace(user_id, std::move(connection));
    }

    // The old connection is gone from the table; its callers learn about it before any new request is accepted
    run_settlements(settlements);
    if (replaced) {
        replaced->close(kCloseNormal, "superseded");
    }

    LOG_INFO("[Bridge] Agent connected: user='" << user_id << "' connection=" << connection_id << " peer="
                                                << transport->describe());
    send_control(transport, protocol::make_connected(user_id));
    return connection_id;
}

void BridgeRegistry::handle_message(const std::string &user_id, uint64_t connection_id, const std::string &text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end() || it->second.id != connection_id) {
            LOG_DEBUG("[Bridge] Dropping frame from stale connection " << connection_id << " (user '" << user_id
                                                                       << "')");
            return;
        }
        it->second.last_activity = Clock::now();
    }

    nlohmann::json message;
    std::string error;
    if (!protocol::parse_message(text, message, error)) {
        LOG_WARN("[Bridge] Malformed frame from user '" << user_id << "': " << error);
        return;
    }

    switch (protocol::classify_message(message)) {
        case protocol::MessageClass::CONTROL:
            handle_control(user_id, connection_id, message);
            break;
        case protocol::MessageClass::RESPONSE:
            handle_response(user_id, connection_id, message);
            break;
        default:
            LOG_WARN("[Bridge] Unexpected frame from user '" << user_id << "' ignored");
            break;
    }
}

void BridgeRegistry::handle_control(const std::string &user_id, uint64_t connection_id,
                                    const nlohmann::json &message) {
    const std::string type = protocol::message_type(message);
    std::shared_ptr<IAgentTransport> transport;

    if (type == protocol::kTypeAgentMetadata) {
        protocol::AgentMetadata metadata;
        std::string error;
        if (!protocol::decode_agent_metadata(message, metadata, error)) {
            LOG_WARN("[Bridge] Invalid agent-metadata from user '" << user_id << "': " << error);
            return;
        }
        metadata.user_id = user_id;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(user_id);
            if (it == connections_.end() || it->second.id != connection_id) {
                return;
            }
            it->second.metadata = metadata;
            it->second.state = ConnectionState::OPEN;
            last_metadata_[user_id] = metadata;
            transport = it->second.transport;
        }

        LOG_INFO("[Bridge] Agent metadata: user='" << user_id << "' platform=" << metadata.platform
                                                  << " home=" << metadata.home_directory << " indexed="
                                                  << metadata.filesystem_index.indexed_paths.size());
        send_control(transport, protocol::make_metadata_ack());
        return;
    }

    if (type == protocol::kTypePing) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = connections_.find(user_id);
            if (it == connections_.end() || it->second.id != connection_id) {
                return;
            }
            transport = it->second.transport;
        }
        send_control(transport, protocol::make_pong(protocol::now_ms()));
        return;
    }

    if (type == protocol::kTypePong || type == protocol::kTypePlanApproved) {
        LOG_DEBUG("[Bridge] " << type << " from user '" << user_id << "'");
        return;
    }

    LOG_DEBUG("[Bridge] Ignoring control message '" << type << "' from user '" << user_id << "'");
}

void BridgeRegistry::handle_response(const std::string &user_id, uint64_t connection_id,
                                     const nlohmann::json &message) {
    protocol::ResponseEnvelope response;
    std::string error;
    if (!protocol::decode_response(message, response, error)) {
        LOG_WARN("[Bridge] Invalid response from user '" << user_id << "': " << error);
        return;
    }

    Completion done;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(response.id);
        if (it == pending_.end()) {
            // Already settled (timeout or disconnect) or never issued
            LOG_WARN("[Bridge] Response for unknown request '" << response.id << "' from user '" << user_id
                                                              << "' dropped");
            return;
        }
        if (it->second.user_id != user_id || it->second.connection_id != connection_id) {
            LOG_WARN("[Bridge] Response for request '" << response.id << "' arrived on the wrong connection; ignored");
            return;
        }
        done = std::move(it->second.done);
        release_slot(user_id);
        pending_.erase(it);
    }

    std::vector<Settlement> settlements;
    settlements.emplace_back(std::move(done), protocol::response_to_result(response));
    run_settlements(settlements);
}

void BridgeRegistry::handle_disconnect(const std::string &user_id, uint64_t connection_id, const std::string &reason) {
    std::vector<Settlement> settlements;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end() || it->second.id != connection_id) {
            LOG_DEBUG("[Bridge] Close of stale connection " << connection_id << " for user '" << user_id << "'");
            return;
        }
        take_pending_for_connection(connection_id, ErrorKind::DISCONNECTED, "Agent disconnected: " + reason,
                                    settlements);
        connections_.erase(it);
    }

    LOG_INFO("[Bridge] Agent disconnected: user='" << user_id << "' connection=" << connection_id << " (" << reason
                                                   << ", " << settlements.size() << " pending request(s) rejected)");
    run_settlements(settlements);
}

void BridgeRegistry::request_operation_async(const std::string &user_id, const protocol::Operation &op,
                                             std::optional<int64_t> timeout_ms, Completion done) {
    const auto kind = protocol::kind_of(op);
    const int64_t timeout = timeout_ms.value_or(config_.request_timeout_ms);

    std::vector<Settlement> settlements;
    auto fail_fast = [&settlements, &done](ErrorKind error_kind, const std::string &message) {
        settlements.emplace_back(std::move(done), OperationResult::failure(error_kind, message));
        run_settlements(settlements);
    };

    if (timeout <= 0) {
        fail_fast(ErrorKind::INVALID_ARGUMENT, "Timeout must be positive");
        return;
    }

    std::string request_id;
    std::shared_ptr<IAgentTransport> transport;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = connections_.find(user_id);
        if (it == connections_.end() || it->second.state != ConnectionState::OPEN) {
            lock.unlock();
            fail_fast(ErrorKind::NOT_CONNECTED, "Agent not connected for user '" + user_id + "'");
            return;
        }

        size_t &inflight = inflight_per_user_[user_id];
        if (inflight >= config_.max_inflight_per_user) {
            lock.unlock();
            LOG_WARN("[Bridge] In-flight cap reached for user '" << user_id << "' ("
                                                                 << config_.max_inflight_per_user << ")");
            fail_fast(ErrorKind::OVERLOADED, "Too many in-flight requests for user '" + user_id + "'");
            return;
        }

        request_id = user_id + "-" + std::to_string(++next_request_seq_);
        PendingRequest request;
        request.user_id = user_id;
        request.connection_id = it->second.id;
        request.kind = kind;
        request.deadline = Clock::now() + std::chrono::milliseconds(timeout);
        request.done = std::move(done);
        pending_.emplace(request_id, std::move(request));
        ++inflight;
        transport = it->second.transport;
    }

    LOG_DEBUG("[Bridge] -> " << request_id << " " << protocol::describe_operation(op));

    std::string error;
    if (transport->send(protocol::dump_message(protocol::encode_operation_envelope(request_id, op)), error)) {
        return;
    }

    LOG_WARN("[Bridge] Send failed for request '" << request_id << "': " << error);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(request_id);
        if (it == pending_.end()) {
            return;  // Already settled by a concurrent disconnect
        }
        settlements.emplace_back(std::move(it->second.done),
                                 OperationResult::failure(ErrorKind::SEND_FAILURE, "Send failed: " + error));
        release_slot(user_id);
        pending_.erase(it);
    }
    run_settlements(settlements);
}

std::future<OperationResult> BridgeRegistry::request_operation(const std::string &user_id,
                                                               const protocol::Operation &op,
                                                               std::optional<int64_t> timeout_ms) {
    auto promise = std::make_shared<std::promise<OperationResult>>();
    auto future = promise->get_future();
    request_operation_async(user_id, op, timeout_ms,
                            [promise](const OperationResult &result) { promise->set_value(result); });
    return future;
}

bool BridgeRegistry::is_connected(const std::string &user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    return it != connections_.end() && it->second.state == ConnectionState::OPEN;
}

ConnectionState BridgeRegistry::connection_state(const std::string &user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    if (it == connections_.end()) {
        return ConnectionState::CLOSED;
    }
    return it->second.state;
}

std::optional<protocol::AgentMetadata> BridgeRegistry::get_metadata(const std::string &user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_metadata_.find(user_id);
    if (it == last_metadata_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> BridgeRegistry::connected_users() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> users;
    for (const auto &[user_id, connection] : connections_) {
        if (connection.state == ConnectionState::OPEN) {
            users.push_back(user_id);
        }
    }
    return users;
}

size_t BridgeRegistry::pending_count(const std::string &user_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inflight_per_user_.find(user_id);
    return it == inflight_per_user_.end() ? 0 : it->second;
}

size_t BridgeRegistry::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

void BridgeRegistry::sweep(Clock::time_point now) {
    std::vector<Settlement> settlements;
    std::vector<std::pair<std::string, std::shared_ptr<IAgentTransport>>> idle;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline > now) {
                ++it;
                continue;
            }
            LOG_WARN("[Bridge] Request '" << it->first << "' ("
                                          << protocol::operation_name(it->second.kind) << ") timed out");
            settlements.emplace_back(std::move(it->second.done),
                                     OperationResult::failure(ErrorKind::TIMEOUT, "Agent did not respond in time"));
            release_slot(it->second.user_id);
            it = pending_.erase(it);
        }

        const auto idle_limit = std::chrono::milliseconds(config_.idle_timeout_ms);
        for (auto it = connections_.begin(); it != connections_.end();) {
            if (now - it->second.last_activity < idle_limit) {
                ++it;
                continue;
            }
            take_pending_for_connection(it->second.id, ErrorKind::DISCONNECTED, "Agent connection timed out",
                                        settlements);
            idle.emplace_back(it->first, it->second.transport);
            it = connections_.erase(it);
        }
    }

    for (const auto &[user_id, transport] : idle) {
        LOG_WARN("[Bridge] No traffic from user '" << user_id << "' within " << config_.idle_timeout_ms
                                                   << "ms, closing connection");
        transport->close(kCloseHeartbeatTimeout, "heartbeat timeout");
    }
    run_settlements(settlements);
}

void BridgeRegistry::start() {
    if (running_.exchange(true)) {
        return;
    }
    sweeper_thread_ = std::thread([this]() { sweeper_loop(); });
    LOG_INFO("[Bridge] Sweeper started (interval " << config_.sweep_interval_ms << "ms)");
}

void BridgeRegistry::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    sweeper_cv_.notify_all();
    if (sweeper_thread_.joinable()) {
        sweeper_thread_.join();
    }
    LOG_INFO("[Bridge] Sweeper stopped");
}

void BridgeRegistry::shutdown() {
    stop();

    std::vector<Settlement> settlements;
    std::vector<std::shared_ptr<IAgentTransport>> transports;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &[user_id, connection] : connections_) {
            transports.push_back(connection.transport);
        }
        connections_.clear();
        for (auto &[id, request] : pending_) {
            settlements.emplace_back(std::move(request.done),
                                     OperationResult::failure(ErrorKind::DISCONNECTED, "Bridge shutting down"));
        }
        pending_.clear();
        inflight_per_user_.clear();
    }

    for (const auto &transport : transports) {
        transport->close(kCloseGoingAway, "server shutting down");
    }
    run_settlements(settlements);
}

void BridgeRegistry::sweeper_loop() {
    const auto interval = std::chrono::milliseconds(config_.sweep_interval_ms);
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(sweeper_mutex_);
            sweeper_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }
        sweep(Clock::now());
    }
}

void BridgeRegistry::take_pending_for_connection(uint64_t connection_id, ErrorKind kind, const std::string &message,
                                                 std::vector<Settlement> &out) {
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->second.connection_id != connection_id) {
            ++it;
            continue;
        }
        out.emplace_back(std::move(it->second.done), OperationResult::failure(kind, message));
        release_slot(it->second.user_id);
        it = pending_.erase(it);
    }
}

void BridgeRegistry::release_slot(const std::string &user_id) {
    auto count = inflight_per_user_.find(user_id);
    if (count != inflight_per_user_.end() && --count->second == 0) {
        inflight_per_user_.erase(count);
    }
}

void BridgeRegistry::send_control(const std::shared_ptr<IAgentTransport> &transport, const nlohmann::json &message) {
    std::string error;
    if (!transport->send(protocol::dump_message(message), error)) {
        LOG_WARN("[Bridge] Failed to send " << protocol::message_type(message) << " to " << transport->describe()
                                            << ": " << error);
    }
}

void BridgeRegistry::run_settlements(std::vector<Settlement> &settlements) {
    for (auto &[done, result] : settlements) {
        if (!done) {
            continue;
        }
        try {
            done(result);
        } catch (const std::exception &e) {
            LOG_ERROR("[Bridge] Completion threw: " << e.what());
        }
    }
    settlements.clear();
}

}  // namespace bridge
}  // namespace hostlink
