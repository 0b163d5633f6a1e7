#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hostlink {
namespace status {

// Plan summary reported by a daemon's GET /status
struct DaemonStatus {
    bool connected = false;
    bool has_permissions = false;
    std::optional<std::string> mode;
    bool is_shutting_down = false;
};

nlohmann::json daemon_status_to_json(const DaemonStatus &status);

// Reachability checks against the local daemon
class IDaemonProbe {
public:
    virtual ~IDaemonProbe() = default;

    // Port of the configured daemon URL
    virtual int default_port() const = 0;

    // Quick liveness check (GET /health). port overrides the configured one.
    virtual bool probe_health(int timeout_ms, std::optional<int> port) = 0;

    // Plan metadata (GET /status); nullopt when unreachable or malformed
    virtual std::optional<DaemonStatus> probe_status(int timeout_ms, std::optional<int> port) = 0;
};

}  // namespace status
}  // namespace hostlink
