#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "operation.hpp"

namespace hostlink {
namespace protocol {

// Control message "type" values
constexpr const char *kTypeAgentMetadata = "agent-metadata";
constexpr const char *kTypeMetadataAck = "metadata-ack";
constexpr const char *kTypePing = "ping";
constexpr const char *kTypePong = "pong";
constexpr const char *kTypeConnected = "connected";
constexpr const char *kTypePlanApprove = "plan-approve";
constexpr const char *kTypePlanApproved = "plan-approved";

//-----------------------------------------------------------------------------
// Plan
//-----------------------------------------------------------------------------

enum class PlanMode { SAFE, BALANCED, UNRESTRICTED };

enum class Capability { READ, WRITE, DELETE, EXEC };

struct Plan {
    PlanMode mode = PlanMode::SAFE;
    std::vector<std::string> allowed_directories;
    std::vector<Capability> allowed_operations;

    bool allows(Capability capability) const;
};

std::string plan_mode_to_string(PlanMode mode);
std::optional<PlanMode> parse_plan_mode(const std::string &mode);
std::string capability_to_string(Capability capability);
std::optional<Capability> parse_capability(const std::string &capability);

nlohmann::json encode_plan(const Plan &plan);
bool decode_plan(const nlohmann::json &json, Plan &plan, std::string &error);

//-----------------------------------------------------------------------------
// Agent metadata
//-----------------------------------------------------------------------------

struct IndexedDirectory {
    std::string name;
    std::string path;
};

struct FilesystemIndex {
    std::vector<IndexedDirectory> directories;
    std::vector<std::string> indexed_paths;
};

struct AgentMetadata {
    std::string user_id;
    std::string home_directory;
    std::string platform;
    std::optional<int> http_port;
    FilesystemIndex filesystem_index;
};

nlohmann::json encode_filesystem_index(const FilesystemIndex &index);
bool decode_filesystem_index(const nlohmann::json &json, FilesystemIndex &index, std::string &error);

// {type: "agent-metadata", userId, homeDirectory, platform, httpPort?, filesystemIndex}
nlohmann::json encode_agent_metadata(const AgentMetadata &metadata);
bool decode_agent_metadata(const nlohmann::json &json, AgentMetadata &metadata, std::string &error);

//-----------------------------------------------------------------------------
// Envelopes
//-----------------------------------------------------------------------------

// {id, operation, ...fields}
nlohmann::json encode_operation_envelope(const std::string &id, const Operation &op);
bool decode_operation_envelope(const nlohmann::json &json, std::string &id, Operation &op, std::string &error);

/**
 * @brief Inbound unit matched to a pending request by id
 *
 * Exactly one of data / error is set. error_code is an optional refinement of
 * error (currently only DENIED is sent) so the bridge can tell a plan refusal
 * from a failed operation.
 */
struct ResponseEnvelope {
    std::string id;
    std::optional<nlohmann::json> data;
    std::optional<std::string> error;
    std::optional<ErrorKind> error_code;
};

nlohmann::json encode_response(const ResponseEnvelope &response);
bool decode_response(const nlohmann::json &json, ResponseEnvelope &response, std::string &error);

ResponseEnvelope make_response(const std::string &id, const OperationResult &result);
OperationResult response_to_result(const ResponseEnvelope &response);

//-----------------------------------------------------------------------------
// Control messages
//-----------------------------------------------------------------------------

nlohmann::json make_ping(int64_t timestamp_ms);
nlohmann::json make_pong(int64_t timestamp_ms);
nlohmann::json make_connected(const std::string &user_id);
nlohmann::json make_metadata_ack();
nlohmann::json make_plan_approve(const Plan &plan);
nlohmann::json make_plan_approved(const Plan &plan);

enum class MessageClass { CONTROL, RESPONSE, OPERATION, UNKNOWN };

// Control messages carry "type"; envelopes carry "id" plus operation or data/error.
MessageClass classify_message(const nlohmann::json &json);

// "type" of a control message, empty otherwise
std::string message_type(const nlohmann::json &json);

bool parse_message(const std::string &text, nlohmann::json &json, std::string &error);

// Serialize for the wire; invalid UTF-8 in file content is replaced, not thrown.
std::string dump_message(const nlohmann::json &json);

int64_t now_ms();

// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:00:00.000Z
std::string format_iso8601(int64_t epoch_ms);

}  // namespace protocol
}  // namespace hostlink
