#include "server.hpp"

#include <algorithm>

#include "errors.hpp"
#include "logging/logger.hpp"

namespace hostlink {
namespace http {

namespace {
constexpr int kDefaultTimeoutSeconds = 5;
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusMethodNotAllowed = 405;
constexpr int kStatusInternal = 500;
// exec.run may legitimately hold a request for its whole timeout
constexpr int kHandlerWriteTimeoutSeconds = 300;
}  // namespace

bool cors_origin_matches(const std::string &allowed, const std::string &origin) {
    if (allowed == "*") {
        return true;
    }

    const auto wildcard_pos = allowed.find('*');
    if (wildcard_pos == std::string::npos) {
        return allowed == origin;
    }

    const std::string prefix = allowed.substr(0, wildcard_pos);
    const std::string suffix = allowed.substr(wildcard_pos + 1);
    if (origin.size() < prefix.size() + suffix.size()) {
        return false;
    }

    const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
    const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
    return prefix_ok && suffix_ok;
}

HttpServer::HttpServer(const runtime::HttpConfig &config, std::string tag, RouteSetup routes)
    : config_(config), tag_(std::move(tag)), routes_(std::move(routes)) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[" << tag_ << "] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();
    server_->set_read_timeout(kDefaultTimeoutSeconds, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(kHandlerWriteTimeoutSeconds, kDefaultTimeoutMilliseconds);

    int pool_size = config_.thread_pool_size;
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // Add CORS headers to all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto matched = std::find_if(origins.begin(), origins.end(),
                                    [&origin](const std::string &allowed) { return cors_origin_matches(allowed, origin); });
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;
        res.set_header("Access-Control-Allow-Origin", response_origin.c_str());
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    // CORS preflight for every route
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });

    if (routes_) {
        routes_(*server_);
    }

    // JSON body for HTTP errors raised by httplib itself (404 etc.); handler content is kept
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        StatusCode code = StatusCode::INTERNAL;
        std::string message = "Internal server error";

        if (res.status == kStatusNotFound || res.status == kStatusMethodNotAllowed) {
            code = StatusCode::NOT_FOUND;
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            code = StatusCode::INVALID_ARGUMENT;
            message = "Bad request";
        }

        nlohmann::json response = make_error_response(code, message);
        res.set_content(response.dump(), "application/json");
    });

    const std::string tag = tag_;
    server_->set_exception_handler([tag](const httplib::Request &, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[" << tag << "] Exception: " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[" << tag << "] Unknown exception");
        }

        nlohmann::json response = make_error_response(StatusCode::INTERNAL, msg);
        res.status = kStatusInternal;
        res.set_content(response.dump(), "application/json");
    });

    if (!server_->bind_to_port(config_.bind.c_str(), config_.port)) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
        server_.reset();
        return false;
    }
    port_ = config_.port;

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_DEBUG("[" << tag_ << "] Server thread started");
        server_->listen_after_bind();
        LOG_DEBUG("[" << tag_ << "] Server thread exiting");
    });

    LOG_INFO("[" << tag_ << "] Server listening on " << config_.bind << ":" << config_.port);
    return true;
}

void HttpServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[" << tag_ << "] Stopping server");
    if (server_) {
        server_->stop();
    }
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[" << tag_ << "] Server stopped");
}

}  // namespace http
}  // namespace hostlink
