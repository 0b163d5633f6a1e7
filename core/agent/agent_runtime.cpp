#include "agent_runtime.hpp"

#include <sys/utsname.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>

#include "logging/logger.hpp"
#include "protocol/url.hpp"

namespace hostlink {
namespace agent {

namespace {

// Dead-connection threshold in heartbeat intervals
constexpr int kMissedHeartbeatLimit = 2;

std::string detect_platform() {
    struct utsname info;
    if (::uname(&info) != 0) {
        return "unknown";
    }
    std::string name(info.sysname);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

}  // namespace

AgentRuntime::AgentRuntime(const runtime::AgentConfig &config, std::shared_ptr<IAgentChannel> channel,
                           OperationDispatcher &dispatcher, std::optional<int> http_port)
    : config_(config),
      channel_(std::move(channel)),
      dispatcher_(dispatcher),
      http_port_(http_port),
      policy_(config.reconnect),
      indexer_(config.index),
      workers_(static_cast<size_t>(std::max(1, config.workers)), "agent-ops") {
    channel_->set_handlers([this](const std::string &text) { handle_message(text); },
                           [this](int code, const std::string &reason) { on_channel_closed(code, reason); });
}

AgentRuntime::~AgentRuntime() {
    stop();
    workers_.shutdown();
}

bool AgentRuntime::run() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_requested_) {
            return true;
        }
    }
    set_lifecycle(policy_.on_connect_requested(lifecycle()));

    while (true) {
        const int code = serve_connection();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stop_requested_) {
                lifecycle_ = policy_.on_stop(lifecycle_);
                LOG_INFO("[Agent] Stopped");
                return true;
            }
        }

        const ConnectionLifecycle next = policy_.on_closed(lifecycle(), code);
        set_lifecycle(next);
        if (next.state == AgentState::TERMINAL) {
            LOG_ERROR("[Agent] Could not reach the bridge after " << policy_.max_attempts()
                                                                  << " attempts; restart the agent to retry");
            return false;
        }
        if (next.state == AgentState::DISCONNECTED) {
            LOG_INFO("[Agent] Connection closed normally, not reconnecting");
            return true;
        }

        const int delay_ms = policy_.backoff_delay_ms(next.attempt);
        LOG_INFO("[Agent] Reconnecting in " << delay_ms << "ms (attempt " << next.attempt << "/"
                                            << policy_.max_attempts() << ")");
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::milliseconds(delay_ms), [this] { return stop_requested_; });
            if (stop_requested_) {
                lifecycle_ = policy_.on_stop(lifecycle_);
                LOG_INFO("[Agent] Stopped during backoff");
                return true;
            }
        }
        set_lifecycle(policy_.on_backoff_elapsed(lifecycle()));
    }
}

int AgentRuntime::serve_connection() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_closed_ = false;
        close_code_ = 0;
    }

    LOG_INFO("[Agent] Connecting to " << config_.server_url << config_.path << " as '" << config_.user_id << "'");
    std::string error;
    if (!channel_->open(connection_url(), config_.connect_timeout_ms, error)) {
        LOG_WARN("[Agent] " << error);
        return kCloseConnectFailed;
    }

    set_lifecycle(policy_.on_open(lifecycle()));
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_inbound_ = Clock::now();
    }
    send_message(protocol::encode_agent_metadata(build_metadata()));

    const auto interval = std::chrono::milliseconds(config_.heartbeat_interval_ms);
    auto next_ping = Clock::now() + interval;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!connection_closed_ && !stop_requested_) {
        cv_.wait_until(lock, next_ping, [this] { return connection_closed_ || stop_requested_; });
        if (connection_closed_ || stop_requested_) {
            break;
        }

        const auto now = Clock::now();
        if (now < next_ping) {
            continue;
        }
        if (now - last_inbound_ >= interval * kMissedHeartbeatLimit) {
            LOG_WARN("[Agent] Nothing received for " << kMissedHeartbeatLimit
                                                     << " heartbeat intervals, dropping connection");
            connection_closed_ = true;
            close_code_ = kCloseHeartbeatTimeout;
            lock.unlock();
            channel_->close(kCloseHeartbeatTimeout, "heartbeat timeout");
            lock.lock();
            break;
        }

        lock.unlock();
        send_message(protocol::make_ping(protocol::now_ms()));
        lock.lock();
        next_ping = now + interval;
    }

    if (!connection_closed_) {
        // stop() may have landed while open() was pending, when there was nothing to close yet
        lock.unlock();
        channel_->close(kCloseCodeNormal, "agent shutting down");
        return kCloseCodeNormal;
    }
    return close_code_;
}

void AgentRuntime::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    cv_.notify_all();
    channel_->close(kCloseCodeNormal, "agent shutting down");
}

void AgentRuntime::disconnect(const std::string &reason) {
    LOG_INFO("[Agent] Disconnecting: " << reason);
    channel_->close(kCloseCodeNormal, reason);
}

void AgentRuntime::on_channel_closed(int code, const std::string &reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_closed_) {
            return;
        }
        connection_closed_ = true;
        close_code_ = code;
    }
    LOG_INFO("[Agent] Connection closed (code " << code << (reason.empty() ? "" : ", " + reason) << ")");
    cv_.notify_all();
}

void AgentRuntime::handle_message(const std::string &text) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        last_inbound_ = Clock::now();
    }

    nlohmann::json message;
    std::string error;
    if (!protocol::parse_message(text, message, error)) {
        LOG_WARN("[Agent] Dropping frame: " << error);
        return;
    }

    switch (protocol::classify_message(message)) {
        case protocol::MessageClass::CONTROL:
            handle_control(protocol::message_type(message), message);
            break;
        case protocol::MessageClass::OPERATION:
            handle_operation(message);
            break;
        case protocol::MessageClass::RESPONSE:
            LOG_WARN("[Agent] Unexpected response envelope from bridge, ignoring");
            break;
        default:
            LOG_WARN("[Agent] Unrecognized message, ignoring");
            break;
    }
}

void AgentRuntime::handle_control(const std::string &type, const nlohmann::json &message) {
    if (type == protocol::kTypePing) {
        send_message(protocol::make_pong(protocol::now_ms()));
    } else if (type == protocol::kTypePlanApprove) {
        protocol::Plan plan;
        std::string error;
        if (!protocol::decode_plan(message.value("plan", nlohmann::json::object()), plan, error)) {
            LOG_WARN("[Agent] Rejecting plan: " << error);
            return;
        }
        send_message(protocol::make_plan_approved(dispatcher_.approve_plan(std::move(plan))));
    } else if (type == protocol::kTypeConnected || type == protocol::kTypeMetadataAck ||
               type == protocol::kTypePong) {
        LOG_DEBUG("[Agent] Received " << type);
    } else {
        LOG_DEBUG("[Agent] Ignoring control message '" << type << "'");
    }
}

void AgentRuntime::handle_operation(const nlohmann::json &message) {
    std::string id;
    protocol::Operation op;
    std::string error;
    if (!protocol::decode_operation_envelope(message, id, op, error)) {
        LOG_WARN("[Agent] Malformed operation envelope: " << error);
        if (!id.empty()) {
            auto result = protocol::OperationResult::failure(protocol::ErrorKind::INVALID_ARGUMENT, error);
            send_message(protocol::encode_response(protocol::make_response(id, result)));
        }
        return;
    }

    LOG_DEBUG("[Agent] " << id << ": " << protocol::describe_operation(op));
    const bool queued = workers_.submit([this, id, op]() {
        const auto result = dispatcher_.dispatch(op);
        send_message(protocol::encode_response(protocol::make_response(id, result)));
    });
    if (!queued) {
        auto result = protocol::OperationResult::failure(protocol::ErrorKind::REMOTE_ERROR, "Agent is shutting down");
        send_message(protocol::encode_response(protocol::make_response(id, result)));
    }
}

void AgentRuntime::send_message(const nlohmann::json &message) {
    std::string error;
    if (!channel_->send(protocol::dump_message(message), error)) {
        LOG_WARN("[Agent] Send failed: " << error);
    }
}

ConnectionLifecycle AgentRuntime::lifecycle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lifecycle_;
}

void AgentRuntime::set_lifecycle(const ConnectionLifecycle &next) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (next.state != lifecycle_.state) {
        LOG_DEBUG("[Agent] " << agent_state_to_string(lifecycle_.state) << " -> " << agent_state_to_string(next.state));
    }
    lifecycle_ = next;
}

std::string AgentRuntime::connection_url() const {
    return protocol::build_agent_url(config_.server_url, config_.path, config_.user_id, static_cast<long>(::getpid()),
                                     config_.auth_token);
}

protocol::AgentMetadata AgentRuntime::build_metadata() {
    if (!cached_index_) {
        cached_index_ = indexer_.build(dispatcher_.resolver().home_directory());
    }

    protocol::AgentMetadata metadata;
    metadata.user_id = config_.user_id;
    metadata.home_directory = dispatcher_.resolver().home_directory();
    metadata.platform = detect_platform();
    metadata.http_port = http_port_;
    metadata.filesystem_index = *cached_index_;
    return metadata;
}

}  // namespace agent
}  // namespace hostlink
