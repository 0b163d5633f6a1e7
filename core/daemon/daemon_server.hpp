#pragma once

#include <functional>
#include <memory>
#include <string>

#include <httplib.h>

#include "agent/operation_dispatcher.hpp"
#include "http/server.hpp"
#include "protocol/operation.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace daemon {

/**
 * @brief Loopback HTTP API of the agent
 *
 * Exposes the same operations as the duplex channel, plus plan and audit
 * endpoints. Every operation goes through the shared OperationDispatcher, so
 * the plan check applies to both transports.
 *
 * Routes:
 * - POST /fs/list|read|write|delete|move, POST /execute -> {status, data}
 *   (403 when the plan refuses, 500 when the operation fails, 400 for a bad body)
 * - GET  /status        -> connection and plan summary
 * - GET  /health        -> {status, healthy, timestamp}
 * - POST /plan/approve  -> install a plan ({plan} or the plan object itself)
 * - POST /kill          -> revoke the plan, refuse everything, disconnect the runtime
 * - GET  /logs?limit=N  -> newest audit entries
 *
 * start() refuses any bind address that is not loopback.
 */
class DaemonServer {
public:
    using ConnectedProbe = std::function<bool()>;
    using KillCallback = std::function<void()>;

    DaemonServer(const runtime::DaemonConfig &config, agent::OperationDispatcher &dispatcher,
                 ConnectedProbe is_connected, KillCallback on_kill);
    ~DaemonServer();

    DaemonServer(const DaemonServer &) = delete;
    DaemonServer &operator=(const DaemonServer &) = delete;

    bool start(std::string &error);
    void stop();

    bool is_running() const { return server_ && server_->is_running(); }
    int port() const { return config_.http.port; }

private:
    void setup_routes(httplib::Server &server);

    void handle_operation(protocol::OperationKind kind, const httplib::Request &req, httplib::Response &res);
    void handle_get_status(const httplib::Request &req, httplib::Response &res);
    void handle_get_health(const httplib::Request &req, httplib::Response &res);
    void handle_post_plan_approve(const httplib::Request &req, httplib::Response &res);
    void handle_post_kill(const httplib::Request &req, httplib::Response &res);
    void handle_get_logs(const httplib::Request &req, httplib::Response &res);

    runtime::DaemonConfig config_;
    agent::OperationDispatcher &dispatcher_;
    ConnectedProbe is_connected_;
    KillCallback on_kill_;
    std::unique_ptr<http::HttpServer> server_;
};

}  // namespace daemon
}  // namespace hostlink
