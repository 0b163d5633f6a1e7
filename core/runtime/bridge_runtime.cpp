#include "bridge_runtime.hpp"

#include <chrono>
#include <thread>

#include "logging/logger.hpp"
#include "signal_handler.hpp"

namespace hostlink {
namespace runtime {

namespace {
constexpr int kMainLoopPollMs = 100;
}  // namespace

BridgeRuntime::BridgeRuntime(const HostlinkConfig &config) : config_(config) {}

BridgeRuntime::~BridgeRuntime() { shutdown(); }

bool BridgeRuntime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing bridge");

    if (!init_registry(error) || !init_websocket(error) || !init_api(error)) {
        shutdown();
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool BridgeRuntime::init_registry(std::string &) {
    registry_ = std::make_unique<bridge::BridgeRegistry>(config_.bridge);
    registry_->start();
    LOG_INFO("[Runtime] Bridge registry started (timeout " << config_.bridge.request_timeout_ms << "ms, cap "
                                                           << config_.bridge.max_inflight_per_user << " per user)");
    return true;
}

bool BridgeRuntime::init_websocket(std::string &error) {
    ws_server_ = std::make_unique<bridge::WsBridgeServer>(config_.bridge.websocket, *registry_);
    std::string ws_error;
    if (!ws_server_->start(ws_error)) {
        error = "WebSocket endpoint failed to start: " + ws_error;
        return false;
    }
    return true;
}

bool BridgeRuntime::init_api(std::string &error) {
    daemon_client_ = std::make_unique<client::HttpTransportClient>(config_.bridge.daemon_url);
    resolver_ = std::make_unique<status::ConnectionStatusResolver>(*registry_, *daemon_client_, config_.bridge);

    if (!config_.bridge.api.enabled) {
        LOG_INFO("[Runtime] REST API disabled in config");
        return true;
    }

    api_server_ = std::make_unique<bridge::BridgeApiServer>(config_.bridge.api, *registry_, *resolver_);
    std::string http_error;
    if (!api_server_->start(http_error)) {
        error = "REST API failed to start: " + http_error;
        return false;
    }
    return true;
}

void BridgeRuntime::run() {
    LOG_INFO("[Runtime] Press Ctrl+C to exit");
    while (!SignalHandler::is_shutdown_requested()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kMainLoopPollMs));
    }
    LOG_INFO("[Runtime] Signal received, stopping...");
}

void BridgeRuntime::shutdown() {
    if (api_server_) {
        LOG_INFO("[Runtime] Stopping REST API");
        api_server_->stop();
        api_server_.reset();
    }
    if (ws_server_) {
        LOG_INFO("[Runtime] Stopping WebSocket endpoint");
        ws_server_->stop();
        ws_server_.reset();
    }
    if (registry_) {
        LOG_INFO("[Runtime] Settling outstanding requests");
        registry_->shutdown();
        registry_->stop();
    }
    resolver_.reset();
    daemon_client_.reset();
    registry_.reset();
}

}  // namespace runtime
}  // namespace hostlink
