#pragma once

#include <cfs_bridge/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// OperationCode — request type understood by the MCP_INTERFACE endpoint.
// The integer values are part of the wire format and must never change.
// Value 6 (file write) is reserved by the endpoint and never sent.
// ---------------------------------------------------------------------------
enum class OperationCode : int {
    SendCommand = 0,
    GetTelemetry = 1,
    GetSystemStatus = 2,
    ManageApplication = 3,
    ListFiles = 4,
    ReadFile = 5,
    GetEventLog = 7,
    EmergencyStop = 8,
};

constexpr int kReservedOperationCode = 6;

[[nodiscard]] std::optional<OperationCode> OperationCodeFromInt(int value);
[[nodiscard]] const char* OperationCodeName(OperationCode code);

// ---------------------------------------------------------------------------
// RequestEnvelope — one request to the remote endpoint.
//
// The confirmation/critical flags are optional on the wire: they are only
// emitted for operations that define them.
// ---------------------------------------------------------------------------
struct RequestEnvelope {
    uint64_t id = 0;
    OperationCode type = OperationCode::SendCommand;
    std::string target;   // "app_name" on the wire, may be empty
    std::string command;
    std::string params;   // opaque string, forwarded verbatim
    std::optional<bool> require_confirmation;
    std::optional<bool> is_critical;

    [[nodiscard]] bool RequiresConfirmation() const {
        return require_confirmation.value_or(false);
    }
    [[nodiscard]] bool IsCritical() const { return is_critical.value_or(false); }

    bool operator==(const RequestEnvelope& other) const {
        return id == other.id && type == other.type &&
               target == other.target && command == other.command &&
               params == other.params &&
               require_confirmation == other.require_confirmation &&
               is_critical == other.is_critical;
    }
};

// ---------------------------------------------------------------------------
// ResponseEnvelope — the single reply to a RequestEnvelope.
// ---------------------------------------------------------------------------
struct ResponseEnvelope {
    uint64_t id = 0;
    int32_t status = 0;
    std::optional<nlohmann::json> result;
    std::optional<std::string> error;
    std::optional<int64_t> timestamp;

    [[nodiscard]] bool IsSuccess() const noexcept { return status == 0; }
};

// -- Request ---------------------------------------------------------------

[[nodiscard]] nlohmann::json RequestToJson(const RequestEnvelope& request);

// Serialize to the UTF-8 bytes written on the stream (one JSON object,
// no framing). Invalid UTF-8 in string fields is replaced, never thrown.
[[nodiscard]] std::string EncodeRequest(const RequestEnvelope& request);

// Parse wire bytes back into a request. Requires numeric "id" and "type";
// string fields default to empty. Errors are ErrorCategory::Protocol.
[[nodiscard]] Result<RequestEnvelope, Error> DecodeRequest(std::string_view bytes);

// -- Response --------------------------------------------------------------

[[nodiscard]] nlohmann::json ResponseToJson(const ResponseEnvelope& response);
[[nodiscard]] std::string EncodeResponse(const ResponseEnvelope& response);

// Parse wire bytes into a response. Requires a non-negative integer "id" and
// an integer "status". A string "result" holding a serialized JSON object or
// array is unwrapped. Errors are ErrorCategory::Protocol.
[[nodiscard]] Result<ResponseEnvelope, Error> DecodeResponse(std::string_view bytes);

} // namespace cfs_bridge
