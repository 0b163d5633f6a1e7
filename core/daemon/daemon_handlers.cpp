#include <stdexcept>
#include <string>

#include "daemon_server.hpp"
#include "http/utils.hpp"
#include "logging/logger.hpp"
#include "protocol/messages.hpp"

namespace hostlink {
namespace daemon {

namespace {
constexpr size_t kDefaultLogLimit = 100;
}  // namespace

//=============================================================================
// POST /fs/* and /execute
//=============================================================================
void DaemonServer::handle_operation(protocol::OperationKind kind, const httplib::Request &req,
                                    httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!http::parse_json_body(req, body, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    protocol::Operation op;
    if (!protocol::decode_operation_fields(kind, body, op, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    LOG_DEBUG("[Daemon] " << req.path << ": " << protocol::describe_operation(op));
    const auto result = dispatcher_.dispatch(op);
    if (result.success) {
        http::send_json(res, http::StatusCode::OK, {{"status", http::make_status(http::StatusCode::OK)},
                                                    {"data", result.data}});
        return;
    }

    const auto code = result.error_kind == protocol::ErrorKind::DENIED ? http::StatusCode::PERMISSION_DENIED
                                                                       : http::StatusCode::INTERNAL;
    http::send_error(res, code, result.error_message);
}

//=============================================================================
// GET /status
//=============================================================================
void DaemonServer::handle_get_status(const httplib::Request &, httplib::Response &res) {
    auto &guard = dispatcher_.guard();
    const auto plan = guard.current_plan();

    nlohmann::json directories = nlohmann::json::array();
    nlohmann::json operations = nlohmann::json::array();
    if (plan) {
        for (const auto &dir : plan->allowed_directories) {
            directories.push_back(dir);
        }
        for (auto capability : plan->allowed_operations) {
            operations.push_back(protocol::capability_to_string(capability));
        }
    }

    nlohmann::json response = {
        {"status", http::make_status(http::StatusCode::OK)},
        {"connected", is_connected_ ? is_connected_() : false},
        {"userId", dispatcher_.user_id()},
        {"hasPermissions", plan.has_value()},
        {"mode", plan ? nlohmann::json(protocol::plan_mode_to_string(plan->mode)) : nlohmann::json()},
        {"allowedDirectories", directories},
        {"allowedOperations", operations},
        {"isShuttingDown", guard.is_killed()}};
    http::send_json(res, http::StatusCode::OK, response);
}

//=============================================================================
// GET /health
//=============================================================================
void DaemonServer::handle_get_health(const httplib::Request &, httplib::Response &res) {
    http::send_json(res, http::StatusCode::OK,
                    {{"status", http::make_status(http::StatusCode::OK)},
                     {"healthy", true},
                     {"timestamp", protocol::now_ms()}});
}

//=============================================================================
// POST /plan/approve
//=============================================================================
void DaemonServer::handle_post_plan_approve(const httplib::Request &req, httplib::Response &res) {
    nlohmann::json body;
    std::string error;
    if (!http::parse_json_body(req, body, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    // Accept {plan: {...}} as well as the bare plan object
    const nlohmann::json &plan_json = body.contains("plan") ? body["plan"] : body;
    protocol::Plan plan;
    if (!protocol::decode_plan(plan_json, plan, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    const auto installed = dispatcher_.approve_plan(std::move(plan));
    http::send_json(res, http::StatusCode::OK, {{"status", http::make_status(http::StatusCode::OK, "Plan approved")},
                                                {"plan", protocol::encode_plan(installed)}});
}

//=============================================================================
// POST /kill
//=============================================================================
void DaemonServer::handle_post_kill(const httplib::Request &, httplib::Response &res) {
    LOG_WARN("[Daemon] Kill switch requested");
    dispatcher_.kill();
    if (on_kill_) {
        on_kill_();
    }
    http::send_json(res, http::StatusCode::OK,
                    {{"status", http::make_status(http::StatusCode::OK, "Agent stopped")}, {"killed", true}});
}

//=============================================================================
// GET /logs?limit=N
//=============================================================================
void DaemonServer::handle_get_logs(const httplib::Request &req, httplib::Response &res) {
    size_t limit = kDefaultLogLimit;
    if (req.has_param("limit")) {
        const std::string value = req.get_param_value("limit");
        try {
            size_t pos = 0;
            const long long parsed = std::stoll(value, &pos);
            if (pos != value.size() || parsed < 0) {
                throw std::invalid_argument(value);
            }
            limit = static_cast<size_t>(parsed);
        } catch (const std::exception &) {
            http::send_error(res, http::StatusCode::INVALID_ARGUMENT,
                             "Invalid limit '" + value + "': must be a non-negative integer");
            return;
        }
    }

    auto &log = dispatcher_.action_log();
    nlohmann::json logs = nlohmann::json::array();
    for (const auto &entry : log.recent(limit)) {
        logs.push_back(agent::action_entry_to_json(entry));
    }
    http::send_json(res, http::StatusCode::OK,
                    {{"status", http::make_status(http::StatusCode::OK)}, {"logs", logs}, {"total", log.total()}});
}

}  // namespace daemon
}  // namespace hostlink
