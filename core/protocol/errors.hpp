#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace hostlink {
namespace protocol {

/**
 * @brief Outcome categories of a bridged operation
 *
 * Every kind has a stable wire name (see error_kind_to_string) so that the
 * agent, the daemon and the bridge REST layer agree on the classification:
 * - NOT_CONNECTED: no live connection (or daemon) for the user
 * - SEND_FAILURE: transport write failed, request never left the process
 * - TIMEOUT: no response within the deadline
 * - REMOTE_ERROR: agent executed the operation and it failed
 * - DENIED: operation refused by the approved plan
 * - DISCONNECTED: connection closed or replaced while the request was in flight
 * - OVERLOADED: per-user in-flight cap reached
 * - INVALID_ARGUMENT: malformed operation or envelope
 */
enum class ErrorKind {
    NONE,
    NOT_CONNECTED,
    SEND_FAILURE,
    TIMEOUT,
    REMOTE_ERROR,
    DENIED,
    DISCONNECTED,
    OVERLOADED,
    INVALID_ARGUMENT
};

inline std::string error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:
            return "NONE";
        case ErrorKind::NOT_CONNECTED:
            return "NOT_CONNECTED";
        case ErrorKind::SEND_FAILURE:
            return "SEND_FAILURE";
        case ErrorKind::TIMEOUT:
            return "TIMEOUT";
        case ErrorKind::REMOTE_ERROR:
            return "REMOTE_ERROR";
        case ErrorKind::DENIED:
            return "DENIED";
        case ErrorKind::DISCONNECTED:
            return "DISCONNECTED";
        case ErrorKind::OVERLOADED:
            return "OVERLOADED";
        case ErrorKind::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        default:
            return "REMOTE_ERROR";
    }
}

inline std::optional<ErrorKind> error_kind_from_string(const std::string &name) {
    if (name == "NONE") return ErrorKind::NONE;
    if (name == "NOT_CONNECTED") return ErrorKind::NOT_CONNECTED;
    if (name == "SEND_FAILURE") return ErrorKind::SEND_FAILURE;
    if (name == "TIMEOUT") return ErrorKind::TIMEOUT;
    if (name == "REMOTE_ERROR") return ErrorKind::REMOTE_ERROR;
    if (name == "DENIED") return ErrorKind::DENIED;
    if (name == "DISCONNECTED") return ErrorKind::DISCONNECTED;
    if (name == "OVERLOADED") return ErrorKind::OVERLOADED;
    if (name == "INVALID_ARGUMENT") return ErrorKind::INVALID_ARGUMENT;
    return std::nullopt;
}

// Result of one operation, whichever transport carried it
struct OperationResult {
    bool success = false;
    ErrorKind error_kind = ErrorKind::NONE;
    std::string error_message;
    nlohmann::json data;

    static OperationResult ok(nlohmann::json payload) {
        OperationResult result;
        result.success = true;
        result.data = std::move(payload);
        return result;
    }

    static OperationResult failure(ErrorKind kind, std::string message) {
        OperationResult result;
        result.success = false;
        result.error_kind = kind;
        result.error_message = std::move(message);
        return result;
    }
};

}  // namespace protocol
}  // namespace hostlink
