#include "operation_dispatcher.hpp"

#include <exception>

#include "local_operations.hpp"
#include "logging/logger.hpp"
#include "protocol/messages.hpp"

namespace hostlink {
namespace agent {

OperationDispatcher::OperationDispatcher(std::string user_id, PathResolver resolver, PlanGuard &guard,
                                         ActionLog &log, const runtime::ExecConfig &exec)
    : user_id_(std::move(user_id)), resolver_(std::move(resolver)), guard_(guard), log_(log), runner_(exec) {}

protocol::Operation OperationDispatcher::resolve_paths(const protocol::Operation &op) const {
    return std::visit(
        protocol::overloaded{
            [this](protocol::ListRequest r) -> protocol::Operation {
                r.path = resolver_.resolve(r.path);
                return r;
            },
            [this](protocol::ReadRequest r) -> protocol::Operation {
                r.path = resolver_.resolve(r.path);
                return r;
            },
            [this](protocol::WriteRequest r) -> protocol::Operation {
                r.path = resolver_.resolve(r.path);
                return r;
            },
            [this](protocol::DeleteRequest r) -> protocol::Operation {
                r.path = resolver_.resolve(r.path);
                return r;
            },
            [this](protocol::MoveRequest r) -> protocol::Operation {
                r.source = resolver_.resolve(r.source);
                r.destination = resolver_.resolve(r.destination);
                return r;
            },
            [this](protocol::ExecRequest r) -> protocol::Operation {
                if (r.cwd) {
                    r.cwd = resolver_.resolve(*r.cwd);
                }
                return r;
            },
        },
        op);
}

protocol::OperationResult OperationDispatcher::dispatch(const protocol::Operation &op) {
    const protocol::Operation resolved = resolve_paths(op);
    const std::string name = protocol::operation_name(protocol::kind_of(resolved));

    const GuardDecision decision = guard_.check(resolved);
    if (!decision.allowed) {
        LOG_WARN("[Dispatch] Denied " << protocol::describe_operation(resolved) << ": " << decision.reason);
        audit(name, ActionResult::DENIED, decision.reason);
        return protocol::OperationResult::failure(protocol::ErrorKind::DENIED, decision.reason);
    }

    try {
        nlohmann::json data = execute(resolved);
        audit(name, ActionResult::SUCCESS, protocol::describe_operation(resolved));
        return protocol::OperationResult::ok(std::move(data));
    } catch (const std::exception &e) {
        LOG_WARN("[Dispatch] " << protocol::describe_operation(resolved) << " failed: " << e.what());
        audit(name, ActionResult::ERROR, e.what());
        return protocol::OperationResult::failure(protocol::ErrorKind::REMOTE_ERROR, e.what());
    }
}

nlohmann::json OperationDispatcher::execute(const protocol::Operation &op) const {
    return std::visit(protocol::overloaded{
                          [](const protocol::ListRequest &r) { return list_directory(r); },
                          [](const protocol::ReadRequest &r) { return read_file(r); },
                          [](const protocol::WriteRequest &r) { return write_file(r); },
                          [](const protocol::DeleteRequest &r) { return delete_path(r); },
                          [](const protocol::MoveRequest &r) { return move_path(r); },
                          [this](const protocol::ExecRequest &r) {
                              return runner_.run(r.command, r.cwd, r.timeout_ms).to_json();
                          },
                      },
                      op);
}

protocol::Plan OperationDispatcher::approve_plan(protocol::Plan plan) {
    for (auto &directory : plan.allowed_directories) {
        directory = resolver_.resolve(directory);
    }
    guard_.approve(plan);
    audit("plan.approve", ActionResult::SUCCESS, "mode=" + protocol::plan_mode_to_string(plan.mode));
    return plan;
}

void OperationDispatcher::kill() {
    guard_.kill();
    audit("kill", ActionResult::SUCCESS, "all operations refused");
}

void OperationDispatcher::audit(const std::string &operation, ActionResult result, const std::string &details) {
    ActionEntry entry;
    entry.timestamp = protocol::format_iso8601(protocol::now_ms());
    entry.user_id = user_id_;
    entry.operation = operation;
    entry.result = result;
    entry.details = details;
    log_.record(std::move(entry));
}

}  // namespace agent
}  // namespace hostlink
