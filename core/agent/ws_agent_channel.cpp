#include "ws_agent_channel.hpp"

#include <chrono>

#include "logging/logger.hpp"

namespace hostlink {
namespace agent {

namespace {
constexpr int kAbnormalClose = 1006;
}  // namespace

WsAgentChannel::~WsAgentChannel() { teardown(); }

void WsAgentChannel::set_handlers(MessageHandler on_message, CloseHandler on_close) {
    std::lock_guard<std::mutex> lock(handlers_mutex_);
    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
}

bool WsAgentChannel::open(const std::string &url, int timeout_ms, std::string &error) {
    teardown();

    auto client = std::make_unique<WsClient>();
    websocketpp::lib::error_code ec;
    try {
        client->clear_access_channels(websocketpp::log::alevel::all);
        client->clear_error_channels(websocketpp::log::elevel::all);
        client->init_asio(ec);
        if (ec) {
            error = "WebSocket init failed: " + ec.message();
            return false;
        }
        client->set_open_handshake_timeout(timeout_ms);
        client->set_open_handler([this](websocketpp::connection_hdl hdl) { on_open(hdl); });
        client->set_fail_handler([this](websocketpp::connection_hdl hdl) { on_fail(hdl); });
        client->set_message_handler(
            [this](websocketpp::connection_hdl hdl, WsClient::message_ptr msg) { on_message(hdl, msg); });
        client->set_close_handler([this](websocketpp::connection_hdl hdl) { on_close(hdl); });
    } catch (const websocketpp::exception &e) {
        error = std::string("WebSocket init failed: ") + e.what();
        return false;
    }

    WsClient::connection_ptr con = client->get_connection(url, ec);
    if (ec) {
        error = "Invalid URL '" + url + "': " + ec.message();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_state_ = OpenState::PENDING;
        fail_reason_.clear();
        local_close_code_.reset();
        hdl_ = con->get_handle();
    }
    client->connect(con);

    active_.store(true);
    WsClient *raw = client.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client_ = std::move(client);
    }
    io_thread_ = std::thread([raw]() {
        try {
            raw->run();
        } catch (const std::exception &e) {
            LOG_ERROR("[Channel] Run loop exception: " << e.what());
        }
    });

    std::unique_lock<std::mutex> lock(mutex_);
    const bool settled = cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                                      [this] { return open_state_ != OpenState::PENDING; });
    if (!settled) {
        error = "Connection to " + url + " timed out after " + std::to_string(timeout_ms) + "ms";
        lock.unlock();
        teardown();
        return false;
    }
    if (open_state_ == OpenState::FAILED) {
        error = "Connection to " + url + " failed: " + fail_reason_;
        lock.unlock();
        teardown();
        return false;
    }
    return true;
}

bool WsAgentChannel::send(const std::string &text, std::string &error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_ || open_state_ != OpenState::OPEN) {
        error = "Channel is not open";
        return false;
    }
    websocketpp::lib::error_code ec;
    client_->send(hdl_, text, websocketpp::frame::opcode::text, ec);
    if (ec) {
        error = ec.message();
        return false;
    }
    return true;
}

void WsAgentChannel::close(int code, const std::string &reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!client_ || open_state_ != OpenState::OPEN) {
        return;
    }
    local_close_code_ = code;
    websocketpp::lib::error_code ec;
    client_->close(hdl_, static_cast<websocketpp::close::status::value>(code), reason, ec);
    if (ec) {
        LOG_DEBUG("[Channel] Close ignored: " << ec.message());
    }
}

void WsAgentChannel::teardown() {
    active_.store(false);
    std::unique_ptr<WsClient> client;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        client = std::move(client_);
        open_state_ = OpenState::FAILED;
    }
    if (client) {
        client->stop();
    }
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
}

void WsAgentChannel::on_open(websocketpp::connection_hdl) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_state_ = OpenState::OPEN;
    }
    cv_.notify_all();
}

void WsAgentChannel::on_fail(websocketpp::connection_hdl hdl) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (client_) {
        fail_reason_ = client_->get_con_from_hdl(hdl)->get_ec().message();
    }
    open_state_ = OpenState::FAILED;
    cv_.notify_all();
}

void WsAgentChannel::on_message(websocketpp::connection_hdl, WsClient::message_ptr msg) {
    if (!active_.load() || msg->get_opcode() != websocketpp::frame::opcode::text) {
        return;
    }
    MessageHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = on_message_;
    }
    if (handler) {
        handler(msg->get_payload());
    }
}

void WsAgentChannel::on_close(websocketpp::connection_hdl hdl) {
    int code = kAbnormalClose;
    std::string reason;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (client_) {
            auto con = client_->get_con_from_hdl(hdl);
            code = local_close_code_ ? *local_close_code_ : con->get_remote_close_code();
            reason = local_close_code_ ? con->get_local_close_reason() : con->get_remote_close_reason();
        }
        open_state_ = OpenState::FAILED;
    }
    if (!active_.load()) {
        return;
    }

    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlers_mutex_);
        handler = on_close_;
    }
    if (handler) {
        handler(code, reason);
    }
}

}  // namespace agent
}  // namespace hostlink
