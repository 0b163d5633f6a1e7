#pragma once

#include <functional>
#include <string>

namespace hostlink {
namespace agent {

/**
 * @brief Duplex client connection from the agent to the bridge
 *
 * One channel object is reused across reconnects. open() discards any
 * previous connection without invoking the handlers for it. Handlers run on
 * the channel's I/O thread and must not call open() or block on it.
 */
class IAgentChannel {
public:
    using MessageHandler = std::function<void(const std::string &text)>;
    using CloseHandler = std::function<void(int code, const std::string &reason)>;

    virtual ~IAgentChannel() = default;

    // Set before the first open()
    virtual void set_handlers(MessageHandler on_message, CloseHandler on_close) = 0;

    // Blocks until the connection is open, fails, or timeout_ms passes
    virtual bool open(const std::string &url, int timeout_ms, std::string &error) = 0;

    virtual bool send(const std::string &text, std::string &error) = 0;

    // Starts a close handshake; the close handler later reports `code`
    virtual void close(int code, const std::string &reason) = 0;
};

}  // namespace agent
}  // namespace hostlink
