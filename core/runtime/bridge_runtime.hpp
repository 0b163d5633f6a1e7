#pragma once

#include <memory>
#include <string>

#include "bridge/bridge_api_server.hpp"
#include "bridge/bridge_registry.hpp"
#include "bridge/ws_bridge_server.hpp"
#include "client/http_transport_client.hpp"
#include "config.hpp"
#include "status/connection_status_resolver.hpp"

namespace hostlink {
namespace runtime {

// Cloud-side process: registry, WebSocket endpoint, status resolver and REST API
class BridgeRuntime {
public:
    explicit BridgeRuntime(const HostlinkConfig &config);
    ~BridgeRuntime();

    // Start components in dependency order; on failure nothing is left running
    bool initialize(std::string &error);

    // Main loop (blocking) until SIGINT/SIGTERM
    void run();

    // Stop components in reverse order. Safe to call multiple times.
    void shutdown();

    bridge::BridgeRegistry &get_registry() { return *registry_; }

private:
    bool init_registry(std::string &error);
    bool init_websocket(std::string &error);
    bool init_api(std::string &error);

    HostlinkConfig config_;

    std::unique_ptr<bridge::BridgeRegistry> registry_;
    std::unique_ptr<bridge::WsBridgeServer> ws_server_;
    std::unique_ptr<client::HttpTransportClient> daemon_client_;
    std::unique_ptr<status::ConnectionStatusResolver> resolver_;
    std::unique_ptr<bridge::BridgeApiServer> api_server_;
};

}  // namespace runtime
}  // namespace hostlink
