#include "reconnect_policy.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

std::string agent_state_to_string(AgentState state) {
    switch (state) {
        case AgentState::DISCONNECTED:
            return "DISCONNECTED";
        case AgentState::CONNECTING:
            return "CONNECTING";
        case AgentState::CONNECTED:
            return "CONNECTED";
        case AgentState::BACKOFF:
            return "BACKOFF";
        case AgentState::TERMINAL:
            return "TERMINAL";
        default:
            return "UNKNOWN";
    }
}

ReconnectPolicy::ReconnectPolicy(const runtime::ReconnectConfig &config) : config_(config) {}

ConnectionLifecycle ReconnectPolicy::on_connect_requested(const ConnectionLifecycle &current) const {
    if (current.state != AgentState::DISCONNECTED) {
        return current;
    }
    return {AgentState::CONNECTING, current.attempt};
}

ConnectionLifecycle ReconnectPolicy::on_backoff_elapsed(const ConnectionLifecycle &current) const {
    if (current.state != AgentState::BACKOFF) {
        return current;
    }
    return {AgentState::CONNECTING, current.attempt};
}

ConnectionLifecycle ReconnectPolicy::on_open(const ConnectionLifecycle &current) const {
    if (current.state != AgentState::CONNECTING) {
        return current;
    }
    return {AgentState::CONNECTED, 0};
}

ConnectionLifecycle ReconnectPolicy::on_closed(const ConnectionLifecycle &current, int close_code) const {
    if (current.state != AgentState::CONNECTING && current.state != AgentState::CONNECTED) {
        return current;
    }

    if (is_graceful_close(close_code)) {
        return {AgentState::DISCONNECTED, 0};
    }

    const int attempt = current.attempt + 1;
    if (attempt > config_.max_attempts) {
        LOG_ERROR("[Reconnect] Giving up after " << config_.max_attempts << " attempts");
        return {AgentState::TERMINAL, current.attempt};
    }
    return {AgentState::BACKOFF, attempt};
}

ConnectionLifecycle ReconnectPolicy::on_stop(const ConnectionLifecycle &current) const {
    if (current.state == AgentState::TERMINAL) {
        return current;
    }
    return {AgentState::DISCONNECTED, 0};
}

int ReconnectPolicy::backoff_delay_ms(int attempt) const {
    if (attempt <= 0) {
        return 0;
    }
    const long long delay = static_cast<long long>(config_.base_delay_ms) * attempt;
    return static_cast<int>(std::min<long long>(delay, config_.max_delay_ms));
}

}  // namespace agent
}  // namespace hostlink
