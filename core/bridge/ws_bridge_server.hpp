#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "bridge_registry.hpp"
#include "i_agent_transport.hpp"
#include "runtime/config.hpp"

namespace hostlink {
namespace bridge {

using WsServer = websocketpp::server<websocketpp::config::asio>;

// IAgentTransport over one websocketpp server connection
class WsAgentTransport : public IAgentTransport {
public:
    WsAgentTransport(WsServer &server, websocketpp::connection_hdl hdl, std::string peer);

    bool send(const std::string &text, std::string &error) override;
    void close(int code, const std::string &reason) override;
    std::string describe() const override { return peer_; }

private:
    WsServer &server_;
    websocketpp::connection_hdl hdl_;
    std::string peer_;
};

// Agent handshake parameters taken from "<path>?userId=..&type=agent&token=.."
struct HandshakeParams {
    std::string path;
    std::map<std::string, std::string> query;
};

HandshakeParams parse_resource(const std::string &resource);

/**
 * @brief WebSocket endpoint agents connect to
 *
 * Accepts upgrades on websocket.path, registers each connection with the
 * BridgeRegistry under the userId query parameter and forwards text frames
 * and close events to it. Connections without a userId are closed with 1008.
 *
 * Thread model:
 * - One asio thread runs the websocketpp endpoint; all handlers run there.
 * - Registry calls from handlers never block on a remote response.
 */
class WsBridgeServer {
public:
    WsBridgeServer(const runtime::WebSocketConfig &config, BridgeRegistry &registry);
    ~WsBridgeServer();

    WsBridgeServer(const WsBridgeServer &) = delete;
    WsBridgeServer &operator=(const WsBridgeServer &) = delete;

    bool start(std::string &error);

    // Stops accepting, closes every session with 1001 and joins the asio thread
    void stop();

    bool is_running() const { return running_.load(); }
    size_t session_count() const;

private:
    struct Session {
        std::string user_id;
        uint64_t connection_id = 0;
    };

    bool on_validate(websocketpp::connection_hdl hdl);
    void on_open(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg);
    void on_close(websocketpp::connection_hdl hdl);
    void on_fail(websocketpp::connection_hdl hdl);

    // Remove the session and tell the registry; no-op for unknown handles
    void end_session(websocketpp::connection_hdl hdl, const std::string &reason);

    runtime::WebSocketConfig config_;
    BridgeRegistry &registry_;

    WsServer server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex sessions_mutex_;
    std::map<websocketpp::connection_hdl, Session, std::owner_less<websocketpp::connection_hdl>> sessions_;
};

}  // namespace bridge
}  // namespace hostlink
