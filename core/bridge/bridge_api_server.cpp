#include "bridge_api_server.hpp"

#include <algorithm>

#include "http/utils.hpp"
#include "logging/logger.hpp"
#include "protocol/messages.hpp"

namespace hostlink {
namespace bridge {

http::StatusCode status_for_error(protocol::ErrorKind kind) {
    switch (kind) {
        case protocol::ErrorKind::NOT_CONNECTED:
        case protocol::ErrorKind::DISCONNECTED:
        case protocol::ErrorKind::SEND_FAILURE:
            return http::StatusCode::UNAVAILABLE;
        case protocol::ErrorKind::TIMEOUT:
            return http::StatusCode::DEADLINE_EXCEEDED;
        case protocol::ErrorKind::DENIED:
            return http::StatusCode::PERMISSION_DENIED;
        case protocol::ErrorKind::REMOTE_ERROR:
            return http::StatusCode::UPSTREAM_ERROR;
        case protocol::ErrorKind::OVERLOADED:
            return http::StatusCode::RESOURCE_EXHAUSTED;
        case protocol::ErrorKind::INVALID_ARGUMENT:
            return http::StatusCode::INVALID_ARGUMENT;
        default:
            return http::StatusCode::INTERNAL;
    }
}

BridgeApiServer::BridgeApiServer(const runtime::HttpConfig &config, BridgeRegistry &registry,
                                 status::ConnectionStatusResolver &resolver)
    : config_(config), registry_(registry), resolver_(resolver) {}

BridgeApiServer::~BridgeApiServer() { stop(); }

bool BridgeApiServer::start(std::string &error) {
    server_ = std::make_unique<http::HttpServer>(config_, "API",
                                                 [this](httplib::Server &server) { setup_routes(server); });
    if (!server_->start(error)) {
        server_.reset();
        return false;
    }
    return true;
}

void BridgeApiServer::stop() {
    if (server_) {
        server_->stop();
    }
}

void BridgeApiServer::setup_routes(httplib::Server &server) {
    // GET /v0/agents - Users with an open connection
    server.Get("/v0/agents", [this](const httplib::Request &req, httplib::Response &res) { handle_get_agents(req, res); });

    // GET /v0/agents/:user/status - Which transport reaches the agent
    server.Get(R"(/v0/agents/([^/]+)/status)",
               [this](const httplib::Request &req, httplib::Response &res) { handle_get_agent_status(req, res); });

    // GET /v0/agents/:user/metadata - Last reported agent metadata
    server.Get(R"(/v0/agents/([^/]+)/metadata)",
               [this](const httplib::Request &req, httplib::Response &res) { handle_get_agent_metadata(req, res); });

    // POST /v0/agents/:user/operations - Run an operation on the agent
    server.Post(R"(/v0/agents/([^/]+)/operations)",
                [this](const httplib::Request &req, httplib::Response &res) { handle_post_operation(req, res); });

    LOG_INFO("[API] Routes configured:");
    LOG_INFO("[API]   GET  /v0/agents");
    LOG_INFO("[API]   GET  /v0/agents/{user}/status");
    LOG_INFO("[API]   GET  /v0/agents/{user}/metadata");
    LOG_INFO("[API]   POST /v0/agents/{user}/operations");
}

void BridgeApiServer::handle_get_agents(const httplib::Request &, httplib::Response &res) {
    nlohmann::json agents = nlohmann::json::array();
    for (const auto &user : registry_.connected_users()) {
        agents.push_back(user);
    }
    http::send_json(res, http::StatusCode::OK, {{"status", http::make_status(http::StatusCode::OK)}, {"agents", agents}});
}

void BridgeApiServer::handle_get_agent_status(const httplib::Request &req, httplib::Response &res) {
    std::string user_id;
    if (!http::parse_path_param(req, user_id)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, "Missing user id");
        return;
    }

    const auto info = resolver_.resolve(user_id);
    nlohmann::json response = status::connection_info_to_json(info);
    response["connectionStatus"] = response["status"];
    response["status"] = http::make_status(http::StatusCode::OK);
    response["userId"] = user_id;
    http::send_json(res, http::StatusCode::OK, response);
}

void BridgeApiServer::handle_get_agent_metadata(const httplib::Request &req, httplib::Response &res) {
    std::string user_id;
    if (!http::parse_path_param(req, user_id)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, "Missing user id");
        return;
    }

    const auto metadata = registry_.get_metadata(user_id);
    if (!metadata) {
        http::send_error(res, http::StatusCode::NOT_FOUND, "No metadata for user '" + user_id + "'");
        return;
    }
    nlohmann::json body = protocol::encode_agent_metadata(*metadata);
    body.erase("type");
    http::send_json(res, http::StatusCode::OK, {{"status", http::make_status(http::StatusCode::OK)},
                                                {"connected", registry_.is_connected(user_id)},
                                                {"metadata", body}});
}

void BridgeApiServer::handle_post_operation(const httplib::Request &req, httplib::Response &res) {
    std::string user_id;
    if (!http::parse_path_param(req, user_id)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, "Missing user id");
        return;
    }

    nlohmann::json body;
    std::string error;
    if (!http::parse_json_body(req, body, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    protocol::Operation op;
    if (!protocol::decode_operation(body, op, error)) {
        http::send_error(res, http::StatusCode::INVALID_ARGUMENT, error);
        return;
    }

    std::optional<int64_t> timeout_ms;
    if (body.contains("requestTimeoutMs")) {
        const auto &value = body["requestTimeoutMs"];
        if (!value.is_number_integer() || value.get<int64_t>() <= 0) {
            http::send_error(res, http::StatusCode::INVALID_ARGUMENT, "'requestTimeoutMs' must be a positive integer");
            return;
        }
        timeout_ms = value.get<int64_t>();
    }

    const int max_waiting = std::max(1, config_.thread_pool_size - 1);
    if (waiting_operations_.fetch_add(1) >= max_waiting) {
        waiting_operations_.fetch_sub(1);
        LOG_WARN("[API] " << user_id << ": " << max_waiting << " operations already waiting, rejecting");
        nlohmann::json response = http::make_error_response(
            http::StatusCode::RESOURCE_EXHAUSTED, "Too many operations waiting on agents; retry later");
        response["errorKind"] = protocol::error_kind_to_string(protocol::ErrorKind::OVERLOADED);
        http::send_json(res, http::StatusCode::RESOURCE_EXHAUSTED, response);
        return;
    }

    LOG_DEBUG("[API] " << user_id << ": " << protocol::describe_operation(op));
    auto pending = registry_.request_operation(user_id, op, timeout_ms);
    const auto result = pending.get();
    waiting_operations_.fetch_sub(1);
    if (!result.success) {
        const auto code = status_for_error(result.error_kind);
        nlohmann::json response = http::make_error_response(code, result.error_message);
        response["errorKind"] = protocol::error_kind_to_string(result.error_kind);
        http::send_json(res, code, response);
        return;
    }

    http::send_json(res, http::StatusCode::OK, {{"status", http::make_status(http::StatusCode::OK)},
                                                {"data", result.data}});
}

}  // namespace bridge
}  // namespace hostlink
