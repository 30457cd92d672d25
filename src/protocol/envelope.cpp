#include <cfs_bridge/protocol/envelope.hpp>

#include <limits>

namespace cfs_bridge {

namespace {

Error MakeProtocolError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol, std::nullopt};
}

std::string Dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// Parse an object; returns nullopt (and sets `why`) on malformed input or a
// non-object top-level value.
std::optional<nlohmann::json> ParseObject(std::string_view bytes, std::string& why) {
    auto parsed = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr,
                                        /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        why = "Invalid JSON";
        return std::nullopt;
    }
    if (!parsed.is_object()) {
        why = "Expected a JSON object";
        return std::nullopt;
    }
    return parsed;
}

bool ReadId(const nlohmann::json& j, uint64_t& out) {
    if (!j.contains("id")) return false;
    const auto& id = j["id"];
    if (id.is_number_unsigned()) {
        out = id.get<uint64_t>();
        return true;
    }
    if (id.is_number_integer() && id.get<int64_t>() >= 0) {
        out = static_cast<uint64_t>(id.get<int64_t>());
        return true;
    }
    return false;
}

std::string StringField(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return "";
}

std::optional<bool> BoolField(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<OperationCode> OperationCodeFromInt(int value) {
    switch (value) {
        case 0: return OperationCode::SendCommand;
        case 1: return OperationCode::GetTelemetry;
        case 2: return OperationCode::GetSystemStatus;
        case 3: return OperationCode::ManageApplication;
        case 4: return OperationCode::ListFiles;
        case 5: return OperationCode::ReadFile;
        case 7: return OperationCode::GetEventLog;
        case 8: return OperationCode::EmergencyStop;
        default: return std::nullopt;
    }
}

const char* OperationCodeName(OperationCode code) {
    switch (code) {
        case OperationCode::SendCommand:       return "SEND_COMMAND";
        case OperationCode::GetTelemetry:      return "GET_TELEMETRY";
        case OperationCode::GetSystemStatus:   return "GET_SYSTEM_STATUS";
        case OperationCode::ManageApplication: return "MANAGE_APP";
        case OperationCode::ListFiles:         return "GET_FILE_LIST";
        case OperationCode::ReadFile:          return "READ_FILE";
        case OperationCode::GetEventLog:       return "GET_EVENT_LOG";
        case OperationCode::EmergencyStop:     return "EMERGENCY_STOP";
    }
    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------
nlohmann::json RequestToJson(const RequestEnvelope& request) {
    nlohmann::json j;
    j["id"] = request.id;
    j["type"] = static_cast<int>(request.type);
    j["app_name"] = request.target;
    j["command"] = request.command;
    j["params"] = request.params;
    if (request.require_confirmation.has_value()) {
        j["require_confirmation"] = *request.require_confirmation;
    }
    if (request.is_critical.has_value()) {
        j["is_critical"] = *request.is_critical;
    }
    return j;
}

std::string EncodeRequest(const RequestEnvelope& request) {
    return Dump(RequestToJson(request));
}

Result<RequestEnvelope, Error> DecodeRequest(std::string_view bytes) {
    std::string why;
    auto parsed = ParseObject(bytes, why);
    if (!parsed) {
        return Result<RequestEnvelope, Error>::Err(
            MakeProtocolError("DecodeRequest", why));
    }
    const auto& j = *parsed;

    RequestEnvelope request;
    if (!ReadId(j, request.id)) {
        return Result<RequestEnvelope, Error>::Err(
            MakeProtocolError("DecodeRequest", "Missing or invalid 'id'"));
    }
    if (!j.contains("type") || !j["type"].is_number_integer()) {
        return Result<RequestEnvelope, Error>::Err(
            MakeProtocolError("DecodeRequest", "Missing or invalid 'type'"));
    }
    auto type_value = j["type"].get<int64_t>();
    auto code = (type_value >= 0 && type_value <= std::numeric_limits<int>::max())
                    ? OperationCodeFromInt(static_cast<int>(type_value))
                    : std::nullopt;
    if (!code) {
        return Result<RequestEnvelope, Error>::Err(MakeProtocolError(
            "DecodeRequest", "Unknown request type: " + std::to_string(type_value)));
    }
    request.type = *code;
    request.target = StringField(j, "app_name");
    request.command = StringField(j, "command");
    request.params = StringField(j, "params");
    request.require_confirmation = BoolField(j, "require_confirmation");
    request.is_critical = BoolField(j, "is_critical");
    return Result<RequestEnvelope, Error>::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
nlohmann::json ResponseToJson(const ResponseEnvelope& response) {
    nlohmann::json j;
    j["id"] = response.id;
    j["status"] = response.status;
    if (response.result.has_value()) {
        j["result"] = *response.result;
    }
    if (response.error.has_value()) {
        j["error"] = *response.error;
    }
    if (response.timestamp.has_value()) {
        j["timestamp"] = *response.timestamp;
    }
    return j;
}

std::string EncodeResponse(const ResponseEnvelope& response) {
    return Dump(ResponseToJson(response));
}

Result<ResponseEnvelope, Error> DecodeResponse(std::string_view bytes) {
    std::string why;
    auto parsed = ParseObject(bytes, why);
    if (!parsed) {
        return Result<ResponseEnvelope, Error>::Err(MakeProtocolError(
            "DecodeResponse", "Invalid response from cFS: " + why));
    }
    const auto& j = *parsed;

    ResponseEnvelope response;
    if (!ReadId(j, response.id)) {
        return Result<ResponseEnvelope, Error>::Err(MakeProtocolError(
            "DecodeResponse", "Invalid response from cFS: missing or invalid 'id'"));
    }
    if (!j.contains("status") || !j["status"].is_number_integer()) {
        return Result<ResponseEnvelope, Error>::Err(MakeProtocolError(
            "DecodeResponse", "Invalid response from cFS: missing or invalid 'status'"));
    }
    auto status = j["status"].get<int64_t>();
    if (status < std::numeric_limits<int32_t>::min() ||
        status > std::numeric_limits<int32_t>::max()) {
        return Result<ResponseEnvelope, Error>::Err(MakeProtocolError(
            "DecodeResponse", "Invalid response from cFS: 'status' out of range"));
    }
    response.status = static_cast<int32_t>(status);

    if (j.contains("result") && !j["result"].is_null()) {
        const auto& result = j["result"];
        if (result.is_string()) {
            // The endpoint may hand back its result pre-serialized.
            const auto& text = result.get_ref<const std::string&>();
            auto inner = nlohmann::json::parse(text, nullptr, false);
            if (!inner.is_discarded() && (inner.is_object() || inner.is_array())) {
                response.result = std::move(inner);
            } else {
                response.result = result;
            }
        } else {
            response.result = result;
        }
    }
    if (j.contains("error") && j["error"].is_string()) {
        response.error = j["error"].get<std::string>();
    }
    if (j.contains("timestamp") && j["timestamp"].is_number_integer()) {
        response.timestamp = j["timestamp"].get<int64_t>();
    }
    return Result<ResponseEnvelope, Error>::Ok(std::move(response));
}

} // namespace cfs_bridge
