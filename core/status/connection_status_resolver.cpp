#include "connection_status_resolver.hpp"

#include "logging/logger.hpp"

namespace hostlink {
namespace status {

nlohmann::json daemon_status_to_json(const DaemonStatus &status) {
    return {{"connected", status.connected},
            {"hasPermissions", status.has_permissions},
            {"mode", status.mode ? nlohmann::json(*status.mode) : nlohmann::json()},
            {"isShuttingDown", status.is_shutting_down}};
}

std::string connectivity_status_to_string(ConnectivityStatus status) {
    switch (status) {
        case ConnectivityStatus::NONE:
            return "none";
        case ConnectivityStatus::HTTP_ONLY:
            return "http-only";
        case ConnectivityStatus::FULL:
            return "full";
        default:
            return "none";
    }
}

nlohmann::json connection_info_to_json(const ConnectionInfo &info) {
    nlohmann::json j = {{"status", connectivity_status_to_string(info.status)},
                        {"httpHealth", info.http_healthy},
                        {"lastHealthCheck", info.last_health_check},
                        {"metadata", nullptr}};
    if (info.metadata) {
        j["metadata"] = protocol::encode_agent_metadata(*info.metadata);
        j["metadata"].erase("type");
    }
    if (info.daemon) {
        j["daemon"] = daemon_status_to_json(*info.daemon);
    }
    return j;
}

ConnectionStatusResolver::ConnectionStatusResolver(const bridge::BridgeRegistry &registry, IDaemonProbe &probe,
                                                   const runtime::BridgeConfig &config)
    : registry_(registry),
      probe_(probe),
      health_timeout_ms_(config.health_timeout_ms),
      status_timeout_ms_(config.status_timeout_ms) {}

ConnectionInfo ConnectionStatusResolver::resolve(const std::string &user_id) {
    ConnectionInfo info;
    info.metadata = registry_.get_metadata(user_id);

    // The agent may report a daemon on a port other than the configured one
    std::optional<int> port;
    info.http_healthy = probe_.probe_health(health_timeout_ms_, std::nullopt);
    if (!info.http_healthy && info.metadata && info.metadata->http_port &&
        *info.metadata->http_port != probe_.default_port()) {
        port = info.metadata->http_port;
        info.http_healthy = probe_.probe_health(health_timeout_ms_, port);
        if (info.http_healthy) {
            LOG_DEBUG("[Status] " << user_id << ": daemon answered on reported port " << *port);
        }
    }
    info.last_health_check = protocol::now_ms();
    if (info.http_healthy) {
        info.daemon = probe_.probe_status(status_timeout_ms_, port);
    }

    if (registry_.connection_state(user_id) == bridge::ConnectionState::OPEN) {
        info.status = ConnectivityStatus::FULL;
    } else if (info.http_healthy) {
        info.status = ConnectivityStatus::HTTP_ONLY;
    } else {
        info.status = ConnectivityStatus::NONE;
    }

    LOG_DEBUG("[Status] " << user_id << ": " << connectivity_status_to_string(info.status));
    return info;
}

}  // namespace status
}  // namespace hostlink
