#include "messages.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace hostlink {
namespace protocol {

namespace {

bool decode_string_array(const nlohmann::json &json, const char *key, std::vector<std::string> &out,
                         std::string &error) {
    auto it = json.find(key);
    if (it == json.end() || it->is_null()) {
        return true;
    }
    if (!it->is_array()) {
        error = std::string("'") + key + "' must be an array";
        return false;
    }
    out.clear();
    for (const auto &item : *it) {
        if (!item.is_string()) {
            error = std::string("'") + key + "' must contain only strings";
            return false;
        }
        out.push_back(item.get<std::string>());
    }
    return true;
}

}  // namespace

//=============================================================================
// Plan
//=============================================================================

bool Plan::allows(Capability capability) const {
    return std::find(allowed_operations.begin(), allowed_operations.end(), capability) != allowed_operations.end();
}

std::string plan_mode_to_string(PlanMode mode) {
    switch (mode) {
        case PlanMode::SAFE:
            return "safe";
        case PlanMode::BALANCED:
            return "balanced";
        case PlanMode::UNRESTRICTED:
            return "unrestricted";
        default:
            return "safe";
    }
}

std::optional<PlanMode> parse_plan_mode(const std::string &mode) {
    if (mode == "safe") return PlanMode::SAFE;
    if (mode == "balanced") return PlanMode::BALANCED;
    if (mode == "unrestricted") return PlanMode::UNRESTRICTED;
    return std::nullopt;
}

std::string capability_to_string(Capability capability) {
    switch (capability) {
        case Capability::READ:
            return "read";
        case Capability::WRITE:
            return "write";
        case Capability::DELETE:
            return "delete";
        case Capability::EXEC:
            return "exec";
        default:
            return "read";
    }
}

std::optional<Capability> parse_capability(const std::string &capability) {
    if (capability == "read") return Capability::READ;
    if (capability == "write") return Capability::WRITE;
    if (capability == "delete") return Capability::DELETE;
    if (capability == "exec") return Capability::EXEC;
    return std::nullopt;
}

nlohmann::json encode_plan(const Plan &plan) {
    nlohmann::json operations = nlohmann::json::array();
    for (auto capability : plan.allowed_operations) {
        operations.push_back(capability_to_string(capability));
    }
    return {{"mode", plan_mode_to_string(plan.mode)},
            {"allowedDirectories", plan.allowed_directories},
            {"allowedOperations", operations}};
}

bool decode_plan(const nlohmann::json &json, Plan &plan, std::string &error) {
    if (!json.is_object()) {
        error = "Plan must be a JSON object";
        return false;
    }

    auto mode_it = json.find("mode");
    if (mode_it == json.end() || !mode_it->is_string()) {
        error = "Plan missing 'mode'";
        return false;
    }
    auto mode = parse_plan_mode(mode_it->get<std::string>());
    if (!mode) {
        error = "Invalid plan mode '" + mode_it->get<std::string>() + "': must be safe, balanced, or unrestricted";
        return false;
    }

    Plan decoded;
    decoded.mode = *mode;
    if (!decode_string_array(json, "allowedDirectories", decoded.allowed_directories, error)) {
        return false;
    }

    std::vector<std::string> operations;
    if (!decode_string_array(json, "allowedOperations", operations, error)) {
        return false;
    }
    for (const auto &name : operations) {
        auto capability = parse_capability(name);
        if (!capability) {
            error = "Invalid plan operation '" + name + "': must be read, write, delete, or exec";
            return false;
        }
        if (!decoded.allows(*capability)) {
            decoded.allowed_operations.push_back(*capability);
        }
    }

    plan = std::move(decoded);
    return true;
}

//=============================================================================
// Agent metadata
//=============================================================================

nlohmann::json encode_filesystem_index(const FilesystemIndex &index) {
    nlohmann::json directories = nlohmann::json::array();
    for (const auto &dir : index.directories) {
        directories.push_back({{"name", dir.name}, {"path", dir.path}});
    }
    return {{"directories", directories}, {"indexedPaths", index.indexed_paths}};
}

bool decode_filesystem_index(const nlohmann::json &json, FilesystemIndex &index, std::string &error) {
    if (!json.is_object()) {
        error = "filesystemIndex must be a JSON object";
        return false;
    }

    FilesystemIndex decoded;
    auto dirs = json.find("directories");
    if (dirs != json.end() && !dirs->is_null()) {
        if (!dirs->is_array()) {
            error = "'directories' must be an array";
            return false;
        }
        for (const auto &dir : *dirs) {
            if (!dir.is_object() || !dir.contains("name") || !dir.contains("path") || !dir["name"].is_string() ||
                !dir["path"].is_string()) {
                error = "Directory entries require string 'name' and 'path'";
                return false;
            }
            decoded.directories.push_back({dir["name"].get<std::string>(), dir["path"].get<std::string>()});
        }
    }
    if (!decode_string_array(json, "indexedPaths", decoded.indexed_paths, error)) {
        return false;
    }

    index = std::move(decoded);
    return true;
}

nlohmann::json encode_agent_metadata(const AgentMetadata &metadata) {
    nlohmann::json j = {{"type", kTypeAgentMetadata},
                        {"userId", metadata.user_id},
                        {"homeDirectory", metadata.home_directory},
                        {"platform", metadata.platform},
                        {"filesystemIndex", encode_filesystem_index(metadata.filesystem_index)}};
    if (metadata.http_port) {
        j["httpPort"] = *metadata.http_port;
    }
    return j;
}

bool decode_agent_metadata(const nlohmann::json &json, AgentMetadata &metadata, std::string &error) {
    if (message_type(json) != kTypeAgentMetadata) {
        error = "Not an agent-metadata message";
        return false;
    }

    AgentMetadata decoded;
    for (const auto &[key, target] :
         {std::make_pair("homeDirectory", &decoded.home_directory), std::make_pair("platform", &decoded.platform)}) {
        auto it = json.find(key);
        if (it == json.end() || !it->is_string()) {
            error = std::string("agent-metadata missing '") + key + "'";
            return false;
        }
        *target = it->get<std::string>();
    }

    auto user = json.find("userId");
    if (user != json.end() && user->is_string()) {
        decoded.user_id = user->get<std::string>();
    }

    auto port = json.find("httpPort");
    if (port != json.end() && !port->is_null()) {
        if (!port->is_number_integer()) {
            error = "'httpPort' must be an integer";
            return false;
        }
        decoded.http_port = port->get<int>();
    }

    auto index = json.find("filesystemIndex");
    if (index != json.end() && !index->is_null()) {
        if (!decode_filesystem_index(*index, decoded.filesystem_index, error)) {
            return false;
        }
    }

    metadata = std::move(decoded);
    return true;
}

//=============================================================================
// Envelopes
//=============================================================================

nlohmann::json encode_operation_envelope(const std::string &id, const Operation &op) {
    nlohmann::json j = encode_operation_fields(op);
    j["id"] = id;
    j["operation"] = operation_name(kind_of(op));
    return j;
}

bool decode_operation_envelope(const nlohmann::json &json, std::string &id, Operation &op, std::string &error) {
    if (!json.is_object()) {
        error = "Envelope must be a JSON object";
        return false;
    }
    auto id_it = json.find("id");
    if (id_it == json.end() || !id_it->is_string() || id_it->get<std::string>().empty()) {
        error = "Envelope missing 'id'";
        return false;
    }
    id = id_it->get<std::string>();
    return decode_operation(json, op, error);
}

nlohmann::json encode_response(const ResponseEnvelope &response) {
    nlohmann::json j = {{"id", response.id}};
    if (response.error) {
        j["error"] = *response.error;
        if (response.error_code) {
            j["errorCode"] = error_kind_to_string(*response.error_code);
        }
    } else {
        j["data"] = response.data ? *response.data : nlohmann::json();
    }
    return j;
}

bool decode_response(const nlohmann::json &json, ResponseEnvelope &response, std::string &error) {
    if (!json.is_object()) {
        error = "Response must be a JSON object";
        return false;
    }
    auto id_it = json.find("id");
    if (id_it == json.end() || !id_it->is_string()) {
        error = "Response missing 'id'";
        return false;
    }

    const bool has_data = json.contains("data");
    const bool has_error = json.contains("error") && !json["error"].is_null();
    if (has_data == has_error) {
        error = has_data ? "Response carries both 'data' and 'error'" : "Response carries neither 'data' nor 'error'";
        return false;
    }

    ResponseEnvelope decoded;
    decoded.id = id_it->get<std::string>();
    if (has_error) {
        const auto &err = json["error"];
        decoded.error = err.is_string() ? err.get<std::string>() : err.dump();
        auto code = json.find("errorCode");
        if (code != json.end() && code->is_string()) {
            decoded.error_code = error_kind_from_string(code->get<std::string>());
        }
    } else {
        decoded.data = json["data"];
    }

    response = std::move(decoded);
    return true;
}

ResponseEnvelope make_response(const std::string &id, const OperationResult &result) {
    ResponseEnvelope response;
    response.id = id;
    if (result.success) {
        response.data = result.data;
    } else {
        response.error = result.error_message;
        if (result.error_kind == ErrorKind::DENIED) {
            response.error_code = ErrorKind::DENIED;
        }
    }
    return response;
}

OperationResult response_to_result(const ResponseEnvelope &response) {
    if (!response.error) {
        return OperationResult::ok(response.data ? *response.data : nlohmann::json());
    }
    const ErrorKind kind = (response.error_code && *response.error_code == ErrorKind::DENIED)
                               ? ErrorKind::DENIED
                               : ErrorKind::REMOTE_ERROR;
    return OperationResult::failure(kind, *response.error);
}

//=============================================================================
// Control messages
//=============================================================================

nlohmann::json make_ping(int64_t timestamp_ms) { return {{"type", kTypePing}, {"timestamp", timestamp_ms}}; }

nlohmann::json make_pong(int64_t timestamp_ms) { return {{"type", kTypePong}, {"timestamp", timestamp_ms}}; }

nlohmann::json make_connected(const std::string &user_id) { return {{"type", kTypeConnected}, {"userId", user_id}}; }

nlohmann::json make_metadata_ack() { return {{"type", kTypeMetadataAck}}; }

nlohmann::json make_plan_approve(const Plan &plan) { return {{"type", kTypePlanApprove}, {"plan", encode_plan(plan)}}; }

nlohmann::json make_plan_approved(const Plan &plan) {
    return {{"type", kTypePlanApproved}, {"plan", encode_plan(plan)}};
}

MessageClass classify_message(const nlohmann::json &json) {
    if (!json.is_object()) {
        return MessageClass::UNKNOWN;
    }
    if (json.contains("type") && json["type"].is_string()) {
        return MessageClass::CONTROL;
    }
    if (!json.contains("id")) {
        return MessageClass::UNKNOWN;
    }
    if (json.contains("operation")) {
        return MessageClass::OPERATION;
    }
    if (json.contains("data") || json.contains("error")) {
        return MessageClass::RESPONSE;
    }
    return MessageClass::UNKNOWN;
}

std::string message_type(const nlohmann::json &json) {
    if (json.is_object()) {
        auto it = json.find("type");
        if (it != json.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

bool parse_message(const std::string &text, nlohmann::json &json, std::string &error) {
    try {
        json = nlohmann::json::parse(text);
        return true;
    } catch (const nlohmann::json::parse_error &e) {
        error = std::string("Invalid JSON: ") + e.what();
        return false;
    }
}

std::string dump_message(const nlohmann::json &json) {
    return json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_iso8601(int64_t epoch_ms) {
    std::time_t seconds = static_cast<std::time_t>(epoch_ms / 1000);
    std::tm tm_buf;
    gmtime_r(&seconds, &tm_buf);

    std::ostringstream out;
    out << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << "." << std::setfill('0') << std::setw(3)
        << (epoch_ms % 1000) << "Z";
    return out.str();
}

}  // namespace protocol
}  // namespace hostlink
