#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <httplib.h>
#include "runtime/config.hpp"

namespace hostlink {
namespace http {

/**
 * @brief httplib server wrapper shared by the daemon and the bridge REST API
 *
 * Owns the httplib::Server, its thread pool and listener thread, and installs
 * the common plumbing: CORS allowlist, JSON error handler for unmatched routes
 * and an exception handler that turns handler exceptions into 500 responses.
 * Routes come from the owning component through the RouteSetup callback.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool
 *
 * Lifecycle:
 * - start() binds to the configured address/port and spawns the server thread
 * - stop() signals shutdown and joins the server thread
 */
class HttpServer {
public:
    using RouteSetup = std::function<void(httplib::Server &)>;

    /**
     * @param config Bind address, port, CORS and pool settings
     * @param tag Log prefix, e.g. "Daemon"
     * @param routes Registers handlers on the server before it binds
     */
    HttpServer(const runtime::HttpConfig &config, std::string tag, RouteSetup routes);
    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Start HTTP server
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    int get_port() const { return port_; }

private:
    runtime::HttpConfig config_;
    std::string tag_;
    RouteSetup routes_;
    int port_ = 0;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};
};

// Allowlist match with a single '*' wildcard ("http://localhost:*")
bool cors_origin_matches(const std::string &allowed, const std::string &origin);

}  // namespace http
}  // namespace hostlink
