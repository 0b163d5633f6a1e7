#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace hostlink {
namespace protocol {

enum class OperationKind { FS_LIST, FS_READ, FS_WRITE, FS_DELETE, FS_MOVE, EXEC_RUN };

struct ListRequest {
    std::string path;
    int depth = 0;
};

struct ReadRequest {
    std::string path;
    std::string encoding = "utf8";
};

struct WriteRequest {
    std::string path;
    std::string content;
    bool create_dirs = true;
    std::string encoding = "utf8";
};

struct DeleteRequest {
    std::string path;
    bool recursive = false;
};

struct MoveRequest {
    std::string source;
    std::string destination;
    bool create_dest_dirs = true;
};

struct ExecRequest {
    std::string command;
    std::optional<std::string> cwd;
    std::optional<int64_t> timeout_ms;
};

// Visitor built from lambdas, for std::visit over Operation
template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

// One operation with its validated payload; the alternative index is the kind.
using Operation = std::variant<ListRequest, ReadRequest, WriteRequest, DeleteRequest, MoveRequest, ExecRequest>;

OperationKind kind_of(const Operation &op);

// "fs.list", "fs.read", ... as used on the wire and in the daemon routes
std::string operation_name(OperationKind kind);
std::optional<OperationKind> parse_operation_name(const std::string &name);

// Daemon route for an operation kind ("/fs/list", ..., "/execute")
std::string daemon_route(OperationKind kind);

// Operation-specific fields only (no "id", no "operation")
nlohmann::json encode_operation_fields(const Operation &op);

/**
 * @brief Decode operation fields of the given kind from a JSON object
 *
 * Required fields must be present with the right type; optional fields fall
 * back to their defaults. Unknown fields are ignored.
 *
 * @return false with error populated when the payload is malformed
 */
bool decode_operation_fields(OperationKind kind, const nlohmann::json &json, Operation &op, std::string &error);

// Decode {"operation": "<name>", ...fields}
bool decode_operation(const nlohmann::json &json, Operation &op, std::string &error);

// Short human-readable summary for logs and the audit trail
std::string describe_operation(const Operation &op);

}  // namespace protocol
}  // namespace hostlink
