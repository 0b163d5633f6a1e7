#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_no_tls_client.hpp>

#include "i_agent_channel.hpp"

namespace hostlink {
namespace agent {

using WsClient = websocketpp::client<websocketpp::config::asio_client>;

// IAgentChannel over a websocketpp client endpoint. Each open() builds a
// fresh endpoint with its own asio thread; the previous one is stopped and
// joined first.
class WsAgentChannel : public IAgentChannel {
public:
    WsAgentChannel() = default;
    ~WsAgentChannel() override;

    WsAgentChannel(const WsAgentChannel &) = delete;
    WsAgentChannel &operator=(const WsAgentChannel &) = delete;

    void set_handlers(MessageHandler on_message, CloseHandler on_close) override;
    bool open(const std::string &url, int timeout_ms, std::string &error) override;
    bool send(const std::string &text, std::string &error) override;
    void close(int code, const std::string &reason) override;

private:
    enum class OpenState { PENDING, OPEN, FAILED };

    void teardown();

    void on_open(websocketpp::connection_hdl hdl);
    void on_fail(websocketpp::connection_hdl hdl);
    void on_message(websocketpp::connection_hdl hdl, WsClient::message_ptr msg);
    void on_close(websocketpp::connection_hdl hdl);

    std::mutex handlers_mutex_;
    MessageHandler on_message_;
    CloseHandler on_close_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<WsClient> client_;
    std::thread io_thread_;
    websocketpp::connection_hdl hdl_;
    OpenState open_state_ = OpenState::PENDING;
    std::string fail_reason_;
    std::optional<int> local_close_code_;

    // False while tearing down so callbacks of a discarded endpoint are dropped
    std::atomic<bool> active_{false};
};

}  // namespace agent
}  // namespace hostlink
