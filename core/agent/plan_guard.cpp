#include "plan_guard.hpp"

#include <filesystem>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

namespace {

std::filesystem::path normalized(const std::string &path) {
    auto p = std::filesystem::path(path).lexically_normal();
    // "/a/b/" normalizes to "/a/b/" with an empty last component
    if (!p.empty() && p.filename().empty() && p != p.root_path()) {
        p = p.parent_path();
    }
    return p;
}

bool is_read_only(protocol::OperationKind kind) {
    return kind == protocol::OperationKind::FS_LIST || kind == protocol::OperationKind::FS_READ;
}

}  // namespace

protocol::Capability capability_for(protocol::OperationKind kind) {
    switch (kind) {
        case protocol::OperationKind::FS_LIST:
        case protocol::OperationKind::FS_READ:
            return protocol::Capability::READ;
        case protocol::OperationKind::FS_WRITE:
            return protocol::Capability::WRITE;
        case protocol::OperationKind::FS_DELETE:
        case protocol::OperationKind::FS_MOVE:
            return protocol::Capability::DELETE;
        case protocol::OperationKind::EXEC_RUN:
            return protocol::Capability::EXEC;
    }
    return protocol::Capability::EXEC;
}

std::vector<std::string> paths_touched(const protocol::Operation &op) {
    return std::visit(
        protocol::overloaded{
            [](const protocol::ListRequest &r) { return std::vector<std::string>{r.path}; },
            [](const protocol::ReadRequest &r) { return std::vector<std::string>{r.path}; },
            [](const protocol::WriteRequest &r) { return std::vector<std::string>{r.path}; },
            [](const protocol::DeleteRequest &r) { return std::vector<std::string>{r.path}; },
            [](const protocol::MoveRequest &r) { return std::vector<std::string>{r.source, r.destination}; },
            [](const protocol::ExecRequest &r) {
                return r.cwd ? std::vector<std::string>{*r.cwd} : std::vector<std::string>{};
            },
        },
        op);
}

bool is_within_directory(const std::string &path, const std::string &directory) {
    if (path.empty() || directory.empty()) {
        return false;
    }
    const auto target = normalized(path);
    const auto base = normalized(directory);

    auto t = target.begin();
    for (auto b = base.begin(); b != base.end(); ++b, ++t) {
        if (t == target.end() || *t != *b) {
            return false;
        }
    }
    return true;
}

GuardDecision PlanGuard::check(const protocol::Operation &op) const {
    const auto kind = protocol::kind_of(op);
    const std::string name = protocol::operation_name(kind);

    std::lock_guard<std::mutex> lock(mutex_);
    if (killed_) {
        return {false, "Agent has been stopped; approve a new plan to resume"};
    }
    if (!plan_) {
        if (is_read_only(kind)) {
            return {true, ""};
        }
        return {false, name + " requires an approved plan"};
    }

    switch (plan_->mode) {
        case protocol::PlanMode::UNRESTRICTED:
            return {true, ""};
        case protocol::PlanMode::SAFE:
            if (is_read_only(kind)) {
                return {true, ""};
            }
            return {false, name + " is not permitted in safe mode"};
        case protocol::PlanMode::BALANCED:
            break;
    }

    const auto capability = capability_for(kind);
    if (!plan_->allows(capability)) {
        return {false, name + " requires '" + protocol::capability_to_string(capability) +
                           "' permission, which the plan does not grant"};
    }

    for (const auto &path : paths_touched(op)) {
        bool inside = false;
        for (const auto &dir : plan_->allowed_directories) {
            if (is_within_directory(path, dir)) {
                inside = true;
                break;
            }
        }
        if (!inside) {
            return {false, "Path '" + path + "' is outside the allowed directories"};
        }
    }
    return {true, ""};
}

void PlanGuard::approve(const protocol::Plan &plan) {
    std::lock_guard<std::mutex> lock(mutex_);
    plan_ = plan;
    killed_ = false;
    LOG_INFO("[Plan] Approved " << protocol::plan_mode_to_string(plan.mode) << " plan with "
                                << plan.allowed_directories.size() << " directories");
}

void PlanGuard::kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    plan_.reset();
    killed_ = true;
    LOG_WARN("[Plan] Kill switch engaged, all operations refused");
}

bool PlanGuard::is_killed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return killed_;
}

std::optional<protocol::Plan> PlanGuard::current_plan() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return plan_;
}

}  // namespace agent
}  // namespace hostlink
