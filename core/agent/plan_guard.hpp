#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "protocol/messages.hpp"
#include "protocol/operation.hpp"

namespace hostlink {
namespace agent {

struct GuardDecision {
    bool allowed = false;
    std::string reason;  // Set when denied
};

// Capability an operation needs under a balanced plan (fs.move counts as delete)
protocol::Capability capability_for(protocol::OperationKind kind);

// Every filesystem path an operation touches (path, source/destination, cwd)
std::vector<std::string> paths_touched(const protocol::Operation &op);

// True if `path` equals `directory` or lies below it, compared on whole
// path components after lexical normalization ("/a/bc" is not inside "/a/b").
bool is_within_directory(const std::string &path, const std::string &directory);

/**
 * @brief Holds the approved Plan and checks operations against it
 *
 * Rules, in order:
 * - killed: everything is denied until a new plan is approved
 * - no plan: fs.list and fs.read only
 * - unrestricted: everything
 * - safe: read category only
 * - balanced: category must be in allowed_operations and every touched
 *   path must be inside one of allowed_directories
 *
 * Operations passed to check() must already have resolved paths.
 * Thread-safe.
 */
class PlanGuard {
public:
    GuardDecision check(const protocol::Operation &op) const;

    // Installs a plan and clears the killed flag
    void approve(const protocol::Plan &plan);

    // Revokes the plan and refuses everything
    void kill();

    bool is_killed() const;
    std::optional<protocol::Plan> current_plan() const;

private:
    mutable std::mutex mutex_;
    std::optional<protocol::Plan> plan_;
    bool killed_ = false;
};

}  // namespace agent
}  // namespace hostlink
