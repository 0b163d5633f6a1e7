#pragma once

#include <string>

namespace hostlink {
namespace bridge {

// One agent's duplex connection as seen by the registry. Implemented by the
// WebSocket adapter; mocked in tests.
class IAgentTransport {
public:
    virtual ~IAgentTransport() = default;

    // Queue a text frame. Returns false (with error) if the write could not be started.
    virtual bool send(const std::string &text, std::string &error) = 0;

    // Initiate a close handshake. Must be safe to call on an already closed transport.
    virtual void close(int code, const std::string &reason) = 0;

    // Peer description for logs
    virtual std::string describe() const = 0;
};

}  // namespace bridge
}  // namespace hostlink
