#include "operation.hpp"

namespace hostlink {
namespace protocol {

namespace {

constexpr size_t kMaxDescribedCommand = 80;

bool require_string(const nlohmann::json &json, const char *key, std::string &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        error = std::string("Missing '") + key + "' field";
        return false;
    }
    if (!it->is_string()) {
        error = std::string("'") + key + "' must be a string";
        return false;
    }
    out = it->get<std::string>();
    if (out.empty()) {
        error = std::string("'") + key + "' must not be empty";
        return false;
    }
    return true;
}

bool optional_bool(const nlohmann::json &json, const char *key, bool &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_boolean()) {
        error = std::string("'") + key + "' must be a boolean";
        return false;
    }
    out = it->get<bool>();
    return true;
}

bool optional_int(const nlohmann::json &json, const char *key, std::optional<int64_t> &out, std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_number_integer()) {
        error = std::string("'") + key + "' must be an integer";
        return false;
    }
    out = it->get<int64_t>();
    return true;
}

bool optional_encoding(const nlohmann::json &json, std::string &out, std::string &error) {
    auto it = json.find("encoding");
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_string()) {
        error = "'encoding' must be a string";
        return false;
    }
    std::string encoding = it->get<std::string>();
    if (encoding != "utf8" && encoding != "utf-8") {
        error = "Unsupported encoding: " + encoding;
        return false;
    }
    out = "utf8";
    return true;
}

}  // namespace

OperationKind kind_of(const Operation &op) {
    return std::visit(overloaded{
                          [](const ListRequest &) { return OperationKind::FS_LIST; },
                          [](const ReadRequest &) { return OperationKind::FS_READ; },
                          [](const WriteRequest &) { return OperationKind::FS_WRITE; },
                          [](const DeleteRequest &) { return OperationKind::FS_DELETE; },
                          [](const MoveRequest &) { return OperationKind::FS_MOVE; },
                          [](const ExecRequest &) { return OperationKind::EXEC_RUN; },
                      },
                      op);
}

std::string operation_name(OperationKind kind) {
    switch (kind) {
        case OperationKind::FS_LIST:
            return "fs.list";
        case OperationKind::FS_READ:
            return "fs.read";
        case OperationKind::FS_WRITE:
            return "fs.write";
        case OperationKind::FS_DELETE:
            return "fs.delete";
        case OperationKind::FS_MOVE:
            return "fs.move";
        case OperationKind::EXEC_RUN:
            return "exec.run";
        default:
            return "unknown";
    }
}

std::optional<OperationKind> parse_operation_name(const std::string &name) {
    if (name == "fs.list") return OperationKind::FS_LIST;
    if (name == "fs.read") return OperationKind::FS_READ;
    if (name == "fs.write") return OperationKind::FS_WRITE;
    if (name == "fs.delete") return OperationKind::FS_DELETE;
    if (name == "fs.move") return OperationKind::FS_MOVE;
    if (name == "exec.run") return OperationKind::EXEC_RUN;
    return std::nullopt;
}

std::string daemon_route(OperationKind kind) {
    switch (kind) {
        case OperationKind::FS_LIST:
            return "/fs/list";
        case OperationKind::FS_READ:
            return "/fs/read";
        case OperationKind::FS_WRITE:
            return "/fs/write";
        case OperationKind::FS_DELETE:
            return "/fs/delete";
        case OperationKind::FS_MOVE:
            return "/fs/move";
        case OperationKind::EXEC_RUN:
            return "/execute";
        default:
            return "/";
    }
}

nlohmann::json encode_operation_fields(const Operation &op) {
    return std::visit(overloaded{
                          [](const ListRequest &r) -> nlohmann::json {
                              return {{"path", r.path}, {"depth", r.depth}};
                          },
                          [](const ReadRequest &r) -> nlohmann::json {
                              return {{"path", r.path}, {"encoding", r.encoding}};
                          },
                          [](const WriteRequest &r) -> nlohmann::json {
                              return {{"path", r.path},
                                      {"content", r.content},
                                      {"createDirs", r.create_dirs},
                                      {"encoding", r.encoding}};
                          },
                          [](const DeleteRequest &r) -> nlohmann::json {
                              return {{"path", r.path}, {"recursive", r.recursive}};
                          },
                          [](const MoveRequest &r) -> nlohmann::json {
                              return {{"source", r.source},
                                      {"destination", r.destination},
                                      {"createDestDirs", r.create_dest_dirs}};
                          },
                          [](const ExecRequest &r) -> nlohmann::json {
                              nlohmann::json j = {{"command", r.command}};
                              if (r.cwd) {
                                  j["cwd"] = *r.cwd;
                              }
                              if (r.timeout_ms) {
                                  j["timeoutMs"] = *r.timeout_ms;
                              }
                              return j;
                          },
                      },
                      op);
}

bool decode_operation_fields(OperationKind kind, const nlohmann::json &json, Operation &op, std::string &error) {
    if (!json.is_object()) {
        error = "Operation payload must be a JSON object";
        return false;
    }

    switch (kind) {
        case OperationKind::FS_LIST: {
            ListRequest r;
            if (!require_string(json, "path", r.path, error)) return false;
            std::optional<int64_t> depth;
            if (!optional_int(json, "depth", depth, error)) return false;
            if (depth) {
                if (*depth < 0) {
                    error = "'depth' must be >= 0";
                    return false;
                }
                r.depth = static_cast<int>(*depth);
            }
            op = r;
            return true;
        }
        case OperationKind::FS_READ: {
            ReadRequest r;
            if (!require_string(json, "path", r.path, error)) return false;
            if (!optional_encoding(json, r.encoding, error)) return false;
            op = r;
            return true;
        }
        case OperationKind::FS_WRITE: {
            WriteRequest r;
            if (!require_string(json, "path", r.path, error)) return false;
            auto content = json.find("content");
            if (content == json.end() || !content->is_string()) {
                error = "'content' must be a string";
                return false;
            }
            r.content = content->get<std::string>();
            if (!optional_bool(json, "createDirs", r.create_dirs, error)) return false;
            if (!optional_encoding(json, r.encoding, error)) return false;
            op = r;
            return true;
        }
        case OperationKind::FS_DELETE: {
            DeleteRequest r;
            if (!require_string(json, "path", r.path, error)) return false;
            if (!optional_bool(json, "recursive", r.recursive, error)) return false;
            op = r;
            return true;
        }
        case OperationKind::FS_MOVE: {
            MoveRequest r;
            if (!require_string(json, "source", r.source, error)) return false;
            if (!require_string(json, "destination", r.destination, error)) return false;
            if (!optional_bool(json, "createDestDirs", r.create_dest_dirs, error)) return false;
            op = r;
            return true;
        }
        case OperationKind::EXEC_RUN: {
            ExecRequest r;
            if (!require_string(json, "command", r.command, error)) return false;
            auto cwd = json.find("cwd");
            if (cwd != json.end() && !cwd->is_null()) {
                if (!cwd->is_string()) {
                    error = "'cwd' must be a string";
                    return false;
                }
                r.cwd = cwd->get<std::string>();
            }
            if (!optional_int(json, "timeoutMs", r.timeout_ms, error)) return false;
            if (r.timeout_ms && *r.timeout_ms <= 0) {
                error = "'timeoutMs' must be > 0";
                return false;
            }
            op = r;
            return true;
        }
        default:
            error = "Unknown operation kind";
            return false;
    }
}

bool decode_operation(const nlohmann::json &json, Operation &op, std::string &error) {
    if (!json.is_object()) {
        error = "Operation must be a JSON object";
        return false;
    }
    auto it = json.find("operation");
    if (it == json.end() || !it->is_string()) {
        error = "Missing 'operation' field";
        return false;
    }
    auto kind = parse_operation_name(it->get<std::string>());
    if (!kind) {
        error = "Unknown operation: " + it->get<std::string>();
        return false;
    }
    return decode_operation_fields(*kind, json, op, error);
}

std::string describe_operation(const Operation &op) {
    const std::string name = operation_name(kind_of(op));
    return std::visit(overloaded{
                          [&name](const MoveRequest &r) { return name + " " + r.source + " -> " + r.destination; },
                          [&name](const ExecRequest &r) {
                              if (r.command.size() > kMaxDescribedCommand) {
                                  return name + " " + r.command.substr(0, kMaxDescribedCommand) + "...";
                              }
                              return name + " " + r.command;
                          },
                          [&name](const auto &r) { return name + " " + r.path; },
                      },
                      op);
}

}  // namespace protocol
}  // namespace hostlink
