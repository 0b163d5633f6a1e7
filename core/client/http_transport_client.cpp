#include "http_transport_client.hpp"

#include <algorithm>
#include <cctype>

#include <httplib.h>

#include "logging/logger.hpp"

namespace hostlink {
namespace client {

namespace {

constexpr int kStatusForbidden = 403;
constexpr int kStatusGatewayTimeout = 504;

void set_timeout(httplib::Client &client, int connect_timeout_ms, int read_timeout_ms) {
    client.set_connection_timeout(connect_timeout_ms / 1000, (connect_timeout_ms % 1000) * 1000);
    client.set_read_timeout(read_timeout_ms / 1000, (read_timeout_ms % 1000) * 1000);
    client.set_write_timeout(read_timeout_ms / 1000, (read_timeout_ms % 1000) * 1000);
}

std::string status_message(const nlohmann::json &body, int http_status) {
    if (body.is_object() && body.contains("status") && body["status"].is_object()) {
        const auto &status = body["status"];
        if (status.contains("message") && status["message"].is_string()) {
            return status["message"].get<std::string>();
        }
    }
    return "Daemon returned HTTP " + std::to_string(http_status);
}

struct UrlParts {
    std::string scheme_host;  // "http://127.0.0.1"
    std::optional<int> port;
    std::string rest;  // Anything after the authority
};

UrlParts split_url(const std::string &url) {
    UrlParts parts;
    size_t host_start = url.find("://");
    host_start = host_start == std::string::npos ? 0 : host_start + 3;
    size_t host_end = url.find('/', host_start);
    if (host_end == std::string::npos) {
        host_end = url.size();
    }

    std::string authority = url.substr(host_start, host_end - host_start);
    const size_t colon = authority.rfind(':');
    const size_t bracket = authority.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        const std::string digits = authority.substr(colon + 1);
        if (!digits.empty() && digits.size() <= 5 &&
            std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
            parts.port = std::stoi(digits);
        }
        authority.resize(colon);
    }
    parts.scheme_host = url.substr(0, host_start) + authority;
    parts.rest = url.substr(host_end);
    return parts;
}

protocol::OperationResult to_result(const httplib::Result &res, const std::string &path) {
    if (!res) {
        const auto err = res.error();
        if (err == httplib::Error::Read) {
            return protocol::OperationResult::failure(protocol::ErrorKind::TIMEOUT,
                                                      "Daemon did not answer " + path + " in time");
        }
        return protocol::OperationResult::failure(protocol::ErrorKind::NOT_CONNECTED,
                                                  "Daemon unreachable: " + httplib::to_string(err));
    }

    nlohmann::json body;
    bool parsed = true;
    try {
        body = res->body.empty() ? nlohmann::json::object() : nlohmann::json::parse(res->body);
    } catch (const nlohmann::json::parse_error &e) {
        parsed = false;
        LOG_WARN("[Client] Unparsable body from " << path << ": " << e.what());
    }

    if (res->status >= 200 && res->status < 300) {
        if (!parsed) {
            return protocol::OperationResult::failure(protocol::ErrorKind::REMOTE_ERROR,
                                                      "Daemon returned an invalid JSON body for " + path);
        }
        return protocol::OperationResult::ok(std::move(body));
    }

    const std::string message = parsed ? status_message(body, res->status)
                                       : "Daemon returned HTTP " + std::to_string(res->status);
    if (res->status == kStatusForbidden) {
        return protocol::OperationResult::failure(protocol::ErrorKind::DENIED, message);
    }
    if (res->status == kStatusGatewayTimeout) {
        return protocol::OperationResult::failure(protocol::ErrorKind::TIMEOUT, message);
    }
    return protocol::OperationResult::failure(protocol::ErrorKind::REMOTE_ERROR, message);
}

}  // namespace

HttpTransportClient::HttpTransportClient(std::string base_url, HttpClientOptions options)
    : base_url_(std::move(base_url)), options_(options) {}

protocol::OperationResult HttpTransportClient::execute(const protocol::Operation &op) {
    const std::string path = protocol::daemon_route(protocol::kind_of(op));
    auto result = post(path, protocol::encode_operation_fields(op));
    if (!result.success) {
        return result;
    }
    nlohmann::json data = result.data.contains("data") ? result.data["data"] : nlohmann::json();
    return protocol::OperationResult::ok(std::move(data));
}

protocol::OperationResult HttpTransportClient::status() { return get(base_url_, "/status", options_.read_timeout_ms); }

protocol::OperationResult HttpTransportClient::health() { return get(base_url_, "/health", options_.read_timeout_ms); }

protocol::OperationResult HttpTransportClient::approve_plan(const protocol::Plan &plan) {
    return post("/plan/approve", {{"plan", protocol::encode_plan(plan)}});
}

protocol::OperationResult HttpTransportClient::kill() { return post("/kill", nlohmann::json::object()); }

protocol::OperationResult HttpTransportClient::logs(size_t limit) {
    return get(base_url_, "/logs?limit=" + std::to_string(limit), options_.read_timeout_ms);
}

int HttpTransportClient::default_port() const {
    const auto parts = split_url(base_url_);
    if (parts.port) {
        return *parts.port;
    }
    return parts.scheme_host.compare(0, 8, "https://") == 0 ? 443 : 80;
}

std::string HttpTransportClient::url_for(std::optional<int> port) const {
    if (!port) {
        return base_url_;
    }
    const auto parts = split_url(base_url_);
    return parts.scheme_host + ":" + std::to_string(*port) + parts.rest;
}

bool HttpTransportClient::probe_health(int timeout_ms, std::optional<int> port) {
    httplib::Client client(url_for(port));
    set_timeout(client, timeout_ms, timeout_ms);
    auto res = client.Get("/health");
    return res && res->status == 200;
}

std::optional<status::DaemonStatus> HttpTransportClient::probe_status(int timeout_ms, std::optional<int> port) {
    auto result = get(url_for(port), "/status", timeout_ms);
    if (!result.success || !result.data.is_object()) {
        return std::nullopt;
    }

    const auto &body = result.data;
    status::DaemonStatus status;
    try {
        status.connected = body.value("connected", false);
        status.has_permissions = body.value("hasPermissions", false);
        status.is_shutting_down = body.value("isShuttingDown", false);
        if (body.contains("mode") && body["mode"].is_string()) {
            status.mode = body["mode"].get<std::string>();
        }
    } catch (const nlohmann::json::type_error &e) {
        LOG_WARN("[Client] Malformed /status body: " << e.what());
        return std::nullopt;
    }
    return status;
}

protocol::OperationResult HttpTransportClient::get(const std::string &url, const std::string &path,
                                                   int read_timeout_ms) {
    httplib::Client client(url);
    set_timeout(client, std::min(options_.connect_timeout_ms, read_timeout_ms), read_timeout_ms);
    return to_result(client.Get(path), path);
}

protocol::OperationResult HttpTransportClient::post(const std::string &path, const nlohmann::json &body) {
    httplib::Client client(base_url_);
    set_timeout(client, options_.connect_timeout_ms, options_.read_timeout_ms);
    const std::string text = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return to_result(client.Post(path, text, "application/json"), path);
}

}  // namespace client
}  // namespace hostlink
