#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "bridge/bridge_registry.hpp"
#include "i_daemon_probe.hpp"
#include "protocol/messages.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace status {

enum class ConnectivityStatus { NONE, HTTP_ONLY, FULL };

// "none", "http-only", "full"
std::string connectivity_status_to_string(ConnectivityStatus status);

struct ConnectionInfo {
    ConnectivityStatus status = ConnectivityStatus::NONE;
    bool http_healthy = false;
    int64_t last_health_check = 0;  // ms since epoch
    std::optional<protocol::AgentMetadata> metadata;
    std::optional<DaemonStatus> daemon;  // Only when the daemon is healthy
};

nlohmann::json connection_info_to_json(const ConnectionInfo &info);

/**
 * @brief Decides which transport can currently reach a user's agent
 *
 * full when the registry has an OPEN duplex connection, otherwise http-only
 * when the local daemon answers its health probe, otherwise none. The daemon
 * is probed on every call, first at the configured URL and then on the
 * httpPort the agent reported in its metadata. Agent metadata from the registry is attached
 * whenever the registry still holds it.
 */
class ConnectionStatusResolver {
public:
    ConnectionStatusResolver(const bridge::BridgeRegistry &registry, IDaemonProbe &probe,
                             const runtime::BridgeConfig &config);

    ConnectionInfo resolve(const std::string &user_id);

private:
    const bridge::BridgeRegistry &registry_;
    IDaemonProbe &probe_;
    int health_timeout_ms_;
    int status_timeout_ms_;
};

}  // namespace status
}  // namespace hostlink
