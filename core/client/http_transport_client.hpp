#pragma once

#include <cstddef>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "protocol/errors.hpp"
#include "protocol/messages.hpp"
#include "protocol/operation.hpp"
#include "status/i_daemon_probe.hpp"

namespace hostlink {
namespace client {

struct HttpClientOptions {
    int connect_timeout_ms = 1000;
    int read_timeout_ms = 120000;  // Covers exec.run up to its own timeout
};

/**
 * @brief REST client for the loopback daemon
 *
 * One method per logical operation, each mapped to a single endpoint.
 * Results come back as OperationResult:
 * - daemon unreachable -> NOT_CONNECTED
 * - read timed out or HTTP 504 -> TIMEOUT
 * - HTTP 403 -> DENIED
 * - other non-2xx -> REMOTE_ERROR with the daemon's status message
 * - 2xx with an unparsable body -> REMOTE_ERROR
 *
 * On success, execute() returns the operation's data; the auxiliary calls
 * return the whole response body. Each call opens its own connection, so one
 * client can be shared across threads.
 */
class HttpTransportClient : public status::IDaemonProbe {
public:
    explicit HttpTransportClient(std::string base_url, HttpClientOptions options = {});

    protocol::OperationResult execute(const protocol::Operation &op);

    protocol::OperationResult status();
    protocol::OperationResult health();
    protocol::OperationResult approve_plan(const protocol::Plan &plan);
    protocol::OperationResult kill();
    protocol::OperationResult logs(size_t limit);

    int default_port() const override;
    bool probe_health(int timeout_ms, std::optional<int> port = std::nullopt) override;
    std::optional<status::DaemonStatus> probe_status(int timeout_ms, std::optional<int> port = std::nullopt) override;

    const std::string &base_url() const { return base_url_; }

private:
    // base_url_ with its port replaced, or base_url_ itself
    std::string url_for(std::optional<int> port) const;

    protocol::OperationResult get(const std::string &url, const std::string &path, int read_timeout_ms);
    protocol::OperationResult post(const std::string &path, const nlohmann::json &body);

    std::string base_url_;
    HttpClientOptions options_;
};

}  // namespace client
}  // namespace hostlink
