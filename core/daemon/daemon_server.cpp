#include "daemon_server.hpp"

#include "logging/logger.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace daemon {

DaemonServer::DaemonServer(const runtime::DaemonConfig &config, agent::OperationDispatcher &dispatcher,
                           ConnectedProbe is_connected, KillCallback on_kill)
    : config_(config), dispatcher_(dispatcher), is_connected_(std::move(is_connected)), on_kill_(std::move(on_kill)) {}

DaemonServer::~DaemonServer() { stop(); }

bool DaemonServer::start(std::string &error) {
    if (!runtime::is_loopback_address(config_.http.bind)) {
        error = "Daemon must bind to a loopback address, got '" + config_.http.bind + "'";
        return false;
    }
    server_ = std::make_unique<http::HttpServer>(config_.http, "Daemon",
                                                 [this](httplib::Server &server) { setup_routes(server); });
    if (!server_->start(error)) {
        server_.reset();
        return false;
    }
    return true;
}

void DaemonServer::stop() {
    if (server_) {
        server_->stop();
    }
}

void DaemonServer::setup_routes(httplib::Server &server) {
    const protocol::OperationKind kinds[] = {
        protocol::OperationKind::FS_LIST,   protocol::OperationKind::FS_READ, protocol::OperationKind::FS_WRITE,
        protocol::OperationKind::FS_DELETE, protocol::OperationKind::FS_MOVE, protocol::OperationKind::EXEC_RUN};
    for (auto kind : kinds) {
        server.Post(protocol::daemon_route(kind), [this, kind](const httplib::Request &req, httplib::Response &res) {
            handle_operation(kind, req, res);
        });
    }

    server.Get("/status", [this](const httplib::Request &req, httplib::Response &res) { handle_get_status(req, res); });
    server.Get("/health", [this](const httplib::Request &req, httplib::Response &res) { handle_get_health(req, res); });
    server.Post("/plan/approve",
                [this](const httplib::Request &req, httplib::Response &res) { handle_post_plan_approve(req, res); });
    server.Post("/kill", [this](const httplib::Request &req, httplib::Response &res) { handle_post_kill(req, res); });
    server.Get("/logs", [this](const httplib::Request &req, httplib::Response &res) { handle_get_logs(req, res); });

    LOG_INFO("[Daemon] Routes configured:");
    LOG_INFO("[Daemon]   POST /fs/list /fs/read /fs/write /fs/delete /fs/move /execute");
    LOG_INFO("[Daemon]   GET  /status /health /logs");
    LOG_INFO("[Daemon]   POST /plan/approve /kill");
}

}  // namespace daemon
}  // namespace hostlink
