#include "ws_bridge_server.hpp"

#include <chrono>
#include <vector>

#include "logging/logger.hpp"
#include "protocol/url.hpp"

namespace hostlink {
namespace bridge {

namespace {
constexpr int kDrainTimeoutMs = 1000;
constexpr int kDrainPollMs = 10;
}  // namespace

//=============================================================================
// WsAgentTransport
//=============================================================================

WsAgentTransport::WsAgentTransport(WsServer &server, websocketpp::connection_hdl hdl, std::string peer)
    : server_(server), hdl_(std::move(hdl)), peer_(std::move(peer)) {}

bool WsAgentTransport::send(const std::string &text, std::string &error) {
    websocketpp::lib::error_code ec;
    server_.send(hdl_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

void WsAgentTransport::close(int code, const std::string &reason) {
    websocketpp::lib::error_code ec;
    server_.close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
    if (ec) {
        LOG_DEBUG("[WS] Close of " << peer_ << " ignored: " << ec.message());
    }
}

HandshakeParams parse_resource(const std::string &resource) {
    HandshakeParams params;
    const size_t question = resource.find('?');
    params.path = resource.substr(0, question);
    if (question != std::string::npos) {
        params.query = protocol::parse_query_string(resource.substr(question + 1));
    }
    return params;
}

//=============================================================================
// WsBridgeServer
//=============================================================================

WsBridgeServer::WsBridgeServer(const runtime::WebSocketConfig &config, BridgeRegistry &registry)
    : config_(config), registry_(registry) {}

WsBridgeServer::~WsBridgeServer() { stop(); }

bool WsBridgeServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[WS] Starting bridge endpoint on " << config_.bind << ":" << config_.port << config_.path);

    try {
        server_.clear_access_channels(websocketpp::log::alevel::all);
        server_.clear_error_channels(websocketpp::log::elevel::all);
        server_.init_asio();
        server_.set_reuse_addr(true);

        server_.set_validate_handler([this](websocketpp::connection_hdl hdl) { return on_validate(hdl); });
        server_.set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
        server_.set_message_handler(
            [this](websocketpp::connection_hdl hdl, WsServer::message_ptr msg) { on_message(hdl, msg); });
        server_.set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
        server_.set_fail_handler([this](websocketpp::connection_hdl hdl) { on_fail(hdl); });
    } catch (const websocketpp::exception &e) {
        error = std::string("WebSocket init failed: ") + e.what();
        return false;
    }

    websocketpp::lib::error_code ec;
    server_.listen(config_.bind, std::to_string(config_.port), ec);
    if (ec) {
        error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port) + ": " + ec.message();
        return false;
    }
    server_.start_accept(ec);
    if (ec) {
        error = "Failed to accept on " + config_.bind + ":" + std::to_string(config_.port) + ": " + ec.message();
        return false;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[WS] Server thread started");
        try {
            server_.run();
        } catch (const std::exception &e) {
            LOG_ERROR("[WS] Run loop exception: " << e.what());
        }
        LOG_INFO("[WS] Server thread exiting");
    });

    LOG_INFO("[WS] Listening on " << config_.bind << ":" << config_.port);
    return true;
}

void WsBridgeServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    LOG_INFO("[WS] Stopping bridge endpoint");
    websocketpp::lib::error_code ec;
    server_.stop_listening(ec);
    if (ec) {
        LOG_WARN("[WS] stop_listening: " << ec.message());
    }

    std::vector<websocketpp::connection_hdl> handles;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto &[hdl, session] : sessions_) {
            handles.push_back(hdl);
        }
    }
    for (const auto &hdl : handles) {
        websocketpp::lib::error_code close_ec;
        server_.close(hdl, websocketpp::close::status::going_away, "server shutting down", close_ec);
    }

    // Give close handshakes a moment before tearing down the io loop
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(kDrainTimeoutMs);
    while (session_count() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kDrainPollMs));
    }

    server_.stop();
    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }
    server_thread_.reset();

    // Sessions the drain did not finish still own registry entries
    std::map<websocketpp::connection_hdl, Session, std::owner_less<websocketpp::connection_hdl>> leftover;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        leftover.swap(sessions_);
    }
    for (const auto &[hdl, session] : leftover) {
        registry_.handle_disconnect(session.user_id, session.connection_id, "server shutting down");
    }
    LOG_INFO("[WS] Bridge endpoint stopped");
}

size_t WsBridgeServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

bool WsBridgeServer::on_validate(websocketpp::connection_hdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    const auto params = parse_resource(con->get_resource());
    if (params.path != config_.path) {
        LOG_WARN("[WS] Rejecting upgrade on unknown path: " << params.path);
        con->set_status(websocketpp::http::status_code::not_found);
        return false;
    }
    return true;
}

void WsBridgeServer::on_open(websocketpp::connection_hdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    const auto params = parse_resource(con->get_resource());
    const std::string peer = con->get_remote_endpoint();

    auto user_it = params.query.find("userId");
    if (user_it == params.query.end() || user_it->second.empty()) {
        LOG_WARN("[WS] Connection from " << peer << " without userId, closing");
        websocketpp::lib::error_code ec;
        server_.close(hdl, websocketpp::close::status::policy_violation, "userId required", ec);
        return;
    }

    auto type_it = params.query.find("type");
    if (type_it != params.query.end() && type_it->second != "agent") {
        LOG_WARN("[WS] Connection from " << peer << " with unsupported type '" << type_it->second << "', closing");
        websocketpp::lib::error_code ec;
        server_.close(hdl, websocketpp::close::status::policy_violation, "unsupported client type", ec);
        return;
    }

    auto pid_it = params.query.find("pid");
    LOG_DEBUG("[WS] Handshake user='" << user_it->second << "' pid="
                                      << (pid_it != params.query.end() ? pid_it->second : "?") << " token="
                                      << (params.query.count("token") != 0 ? "present" : "absent"));

    auto transport = std::make_shared<WsAgentTransport>(server_, hdl, peer);
    Session session;
    session.user_id = user_it->second;

    // Handlers are serialized on the asio thread, so no frame for hdl can race this
    session.connection_id = registry_.register_connection(session.user_id, transport);
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_[hdl] = session;
}

void WsBridgeServer::on_message(websocketpp::connection_hdl hdl, WsServer::message_ptr msg) {
    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        LOG_WARN("[WS] Ignoring non-text frame");
        return;
    }

    Session session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(hdl);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
    }
    registry_.handle_message(session.user_id, session.connection_id, msg->get_payload());
}

void WsBridgeServer::on_close(websocketpp::connection_hdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    end_session(hdl, "close code " + std::to_string(con->get_remote_close_code()));
}

void WsBridgeServer::on_fail(websocketpp::connection_hdl hdl) {
    auto con = server_.get_con_from_hdl(hdl);
    end_session(hdl, "connection failed: " + con->get_ec().message());
}

void WsBridgeServer::end_session(websocketpp::connection_hdl hdl, const std::string &reason) {
    Session session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(hdl);
        if (it == sessions_.end()) {
            return;
        }
        session = it->second;
        sessions_.erase(it);
    }
    registry_.handle_disconnect(session.user_id, session.connection_id, reason);
}

}  // namespace bridge
}  // namespace hostlink
