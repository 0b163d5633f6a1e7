#pragma once

#include <string>

#include "runtime/config.hpp"

namespace hostlink {
namespace agent {

enum class AgentState { DISCONNECTED, CONNECTING, CONNECTED, BACKOFF, TERMINAL };

std::string agent_state_to_string(AgentState state);

constexpr int kCloseCodeNormal = 1000;

// Immutable snapshot of the connection lifecycle. attempt is the number of
// consecutive failed connections (n in BACKOFF(n)); 0 while healthy.
struct ConnectionLifecycle {
    AgentState state = AgentState::DISCONNECTED;
    int attempt = 0;
};

// ReconnectPolicy is the agent's connection state machine. Every transition
// is a pure function of the current lifecycle so tests can drive it without
// sockets or timers; AgentRuntime owns the timers and applies the results.
//
// Transitions:
//   DISCONNECTED         --connect_requested--> CONNECTING
//   BACKOFF              --backoff_elapsed-->   CONNECTING
//   CONNECTING           --open-->              CONNECTED (attempt reset)
//   CONNECTING/CONNECTED --closed(1000)-->      DISCONNECTED
//   CONNECTING/CONNECTED --closed(other)-->     BACKOFF(n+1) or TERMINAL past max_attempts
//   any                  --stop-->              DISCONNECTED (TERMINAL stays TERMINAL)
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(const runtime::ReconnectConfig &config);

    ConnectionLifecycle on_connect_requested(const ConnectionLifecycle &current) const;
    ConnectionLifecycle on_backoff_elapsed(const ConnectionLifecycle &current) const;
    ConnectionLifecycle on_open(const ConnectionLifecycle &current) const;

    // Open failures are reported as closes with a non-1000 code
    ConnectionLifecycle on_closed(const ConnectionLifecycle &current, int close_code) const;

    ConnectionLifecycle on_stop(const ConnectionLifecycle &current) const;

    // min(base × attempt, cap); 0 for attempt <= 0
    int backoff_delay_ms(int attempt) const;

    static bool is_graceful_close(int close_code) { return close_code == kCloseCodeNormal; }

    int max_attempts() const { return config_.max_attempts; }

private:
    runtime::ReconnectConfig config_;
};

}  // namespace agent
}  // namespace hostlink
