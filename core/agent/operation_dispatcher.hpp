#pragma once

#include <string>

#include "action_log.hpp"
#include "command_runner.hpp"
#include "path_resolver.hpp"
#include "plan_guard.hpp"
#include "protocol/errors.hpp"
#include "protocol/operation.hpp"

namespace hostlink {
namespace agent {

/**
 * @brief Executes operations arriving over either transport
 *
 * dispatch() resolves the operation's paths, checks them against the
 * PlanGuard, runs the local handler and records the outcome in the ActionLog.
 * Denials return DENIED; handler exceptions return REMOTE_ERROR carrying the
 * exception message. A command that exits non-zero is still a success: the
 * exit code is part of the data.
 *
 * Thread-safe; called concurrently from the agent worker pool and the daemon's
 * HTTP threads.
 */
class OperationDispatcher {
public:
    OperationDispatcher(std::string user_id, PathResolver resolver, PlanGuard &guard, ActionLog &log,
                        const runtime::ExecConfig &exec);

    protocol::OperationResult dispatch(const protocol::Operation &op);

    // Resolves the plan's directories like operation paths, installs it and audits it
    protocol::Plan approve_plan(protocol::Plan plan);

    // Engages the PlanGuard kill switch and audits it
    void kill();

    // Copy of op with every path run through the PathResolver
    protocol::Operation resolve_paths(const protocol::Operation &op) const;

    const std::string &user_id() const { return user_id_; }
    const PathResolver &resolver() const { return resolver_; }
    PlanGuard &guard() { return guard_; }
    ActionLog &action_log() { return log_; }

private:
    nlohmann::json execute(const protocol::Operation &op) const;

    void audit(const std::string &operation, ActionResult result, const std::string &details);

    std::string user_id_;
    PathResolver resolver_;
    PlanGuard &guard_;
    ActionLog &log_;
    CommandRunner runner_;
};

}  // namespace agent
}  // namespace hostlink
