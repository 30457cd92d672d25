#pragma once

#include <cfs_bridge/core/result.hpp>
#include <cfs_bridge/protocol/envelope.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

// Tool names exposed to callers, one per OperationCode.
inline constexpr const char* kToolSendCommand = "cfs_send_command";
inline constexpr const char* kToolGetTelemetry = "cfs_get_telemetry";
inline constexpr const char* kToolGetSystemStatus = "cfs_get_system_status";
inline constexpr const char* kToolManageApp = "cfs_manage_app";
inline constexpr const char* kToolListFiles = "cfs_list_files";
inline constexpr const char* kToolReadFile = "cfs_read_file";
inline constexpr const char* kToolGetEventLog = "cfs_get_event_log";
inline constexpr const char* kToolEmergencyStop = "cfs_emergency_stop";

inline constexpr const char* kDefaultTelemetryApp = "MCP_INTERFACE";
inline constexpr const char* kDefaultManageAction = "status";
inline constexpr const char* kDefaultDirectory = "/cf";

// Map a tool name to its operation; nullopt for unknown names.
[[nodiscard]] std::optional<OperationCode> ToolOperation(std::string_view tool_name);

// Serialize a value as a JSON string literal: /cf -> "/cf".
[[nodiscard]] std::string QuoteParam(std::string_view value);

// Inverse of QuoteParam. Errors when params is not a JSON string literal.
[[nodiscard]] Result<std::string, Error> DecodeQuotedParam(std::string_view params);

// ---------------------------------------------------------------------------
// EncodeInvocation — translate a tool call into a RequestEnvelope.
//
// Pure: no I/O, no state. `arguments` must be a JSON object (null is treated
// as empty). Missing optional arguments take their defaults; values of the
// wrong kind, missing required ones and anything the endpoint would reject
// (over-long names, unknown manage action) are ErrorCategory::InvalidArgument.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<RequestEnvelope, Error> EncodeInvocation(
    std::string_view tool_name,
    const nlohmann::json& arguments,
    uint64_t id);

} // namespace cfs_bridge
