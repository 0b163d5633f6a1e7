#pragma once

#include <atomic>
#include <memory>
#include <string>

#include <httplib.h>

#include "bridge_registry.hpp"
#include "http/errors.hpp"
#include "http/server.hpp"
#include "protocol/errors.hpp"
#include "runtime/config.hpp"
#include "status/connection_status_resolver.hpp"

namespace hostlink {
namespace bridge {

// REST status for a failed bridged operation (NOT_CONNECTED -> 503, DENIED -> 403, ...)
http::StatusCode status_for_error(protocol::ErrorKind kind);

/**
 * @brief REST route layer in front of the BridgeRegistry
 *
 * Routes:
 * - GET  /v0/agents                     -> connected user ids
 * - GET  /v0/agents/{user}/status       -> ConnectionStatusResolver output
 * - GET  /v0/agents/{user}/metadata     -> last agent metadata, 404 if never seen
 * - POST /v0/agents/{user}/operations   -> {operation, ...fields, requestTimeoutMs?}
 *
 * The caller is trusted; authentication happens upstream.
 *
 * An operation holds its pool thread until the agent answers or the request
 * deadline passes. At most thread_pool_size - 1 operations wait at once so
 * the read-only routes keep a thread; further operations get 429 OVERLOADED.
 */
class BridgeApiServer {
public:
    BridgeApiServer(const runtime::HttpConfig &config, BridgeRegistry &registry,
                    status::ConnectionStatusResolver &resolver);
    ~BridgeApiServer();

    BridgeApiServer(const BridgeApiServer &) = delete;
    BridgeApiServer &operator=(const BridgeApiServer &) = delete;

    bool start(std::string &error);
    void stop();

    bool is_running() const { return server_ && server_->is_running(); }

    // Operations currently parked on an agent reply
    int waiting_operations() const { return waiting_operations_.load(); }

private:
    void setup_routes(httplib::Server &server);

    void handle_get_agents(const httplib::Request &req, httplib::Response &res);
    void handle_get_agent_status(const httplib::Request &req, httplib::Response &res);
    void handle_get_agent_metadata(const httplib::Request &req, httplib::Response &res);
    void handle_post_operation(const httplib::Request &req, httplib::Response &res);

    runtime::HttpConfig config_;
    BridgeRegistry &registry_;
    status::ConnectionStatusResolver &resolver_;
    std::unique_ptr<http::HttpServer> server_;
    std::atomic<int> waiting_operations_{0};
};

}  // namespace bridge
}  // namespace hostlink
