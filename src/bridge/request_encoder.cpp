#include <cfs_bridge/bridge/request_encoder.hpp>

#include <cfs_bridge/core/types.hpp>

#include <array>
#include <utility>

namespace cfs_bridge {

namespace {

constexpr const char* kOperation = "EncodeInvocation";

struct ToolEntry {
    const char* name;
    OperationCode code;
};

constexpr std::array<ToolEntry, 8> kTools = {{
    {kToolSendCommand, OperationCode::SendCommand},
    {kToolGetTelemetry, OperationCode::GetTelemetry},
    {kToolGetSystemStatus, OperationCode::GetSystemStatus},
    {kToolManageApp, OperationCode::ManageApplication},
    {kToolListFiles, OperationCode::ListFiles},
    {kToolReadFile, OperationCode::ReadFile},
    {kToolGetEventLog, OperationCode::GetEventLog},
    {kToolEmergencyStop, OperationCode::EmergencyStop},
}};

Error MakeArgError(const std::string& message) {
    return Error{kOperation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::InvalidArgument, std::nullopt};
}

// Optional string argument. Absent or null yields `default_val`.
Result<std::string, Error> OptString(const nlohmann::json& args,
                                     const std::string& key,
                                     const std::string& default_val) {
    if (!args.contains(key) || args[key].is_null()) {
        return Result<std::string, Error>::Ok(default_val);
    }
    if (!args[key].is_string()) {
        return Result<std::string, Error>::Err(
            MakeArgError("Parameter '" + key + "' must be a string"));
    }
    return Result<std::string, Error>::Ok(args[key].get<std::string>());
}

Result<std::string, Error> RequireString(const nlohmann::json& args,
                                         const std::string& key) {
    if (!args.contains(key) || args[key].is_null()) {
        return Result<std::string, Error>::Err(
            MakeArgError("Missing required parameter: " + key));
    }
    return OptString(args, key, "");
}

Result<bool, Error> OptBool(const nlohmann::json& args,
                            const std::string& key,
                            bool default_val) {
    if (!args.contains(key) || args[key].is_null()) {
        return Result<bool, Error>::Ok(default_val);
    }
    if (!args[key].is_boolean()) {
        return Result<bool, Error>::Err(
            MakeArgError("Parameter '" + key + "' must be a boolean"));
    }
    return Result<bool, Error>::Ok(args[key].get<bool>());
}

Result<std::string, Error> CheckAppName(const std::string& value) {
    auto app = AppName::Create(value);
    if (app.IsErr()) {
        return Result<std::string, Error>::Err(MakeArgError(app.Error()));
    }
    return Result<std::string, Error>::Ok(app.Value().Value());
}

Result<std::string, Error> CheckParams(std::string params) {
    if (params.size() >= kMaxParamsLen) {
        return Result<std::string, Error>::Err(MakeArgError(
            "Parameters must be shorter than " + std::to_string(kMaxParamsLen) +
            " bytes, got " + std::to_string(params.size())));
    }
    return Result<std::string, Error>::Ok(std::move(params));
}

bool IsKnownAction(const std::string& action) {
    return action == "start" || action == "stop" || action == "status" ||
           action == "restart";
}

// -- Per-operation encoders -------------------------------------------------

Result<void, Error> FillSendCommand(const nlohmann::json& args,
                                    RequestEnvelope& request) {
    auto app = RequireString(args, "app_name");
    if (app.IsErr()) return Result<void, Error>::Err(app.Error());
    auto app_checked = CheckAppName(app.Value());
    if (app_checked.IsErr()) return Result<void, Error>::Err(app_checked.Error());

    auto command = RequireString(args, "command");
    if (command.IsErr()) return Result<void, Error>::Err(command.Error());
    auto command_checked = CommandName::Create(command.Value());
    if (command_checked.IsErr()) {
        return Result<void, Error>::Err(MakeArgError(command_checked.Error()));
    }

    auto params = OptString(args, "params", "");
    if (params.IsErr()) return Result<void, Error>::Err(params.Error());
    auto params_checked = CheckParams(params.Value());
    if (params_checked.IsErr()) return Result<void, Error>::Err(params_checked.Error());

    auto confirm = OptBool(args, "require_confirmation", false);
    if (confirm.IsErr()) return Result<void, Error>::Err(confirm.Error());
    auto critical = OptBool(args, "is_critical", false);
    if (critical.IsErr()) return Result<void, Error>::Err(critical.Error());

    request.target = app_checked.Value();
    request.command = command_checked.Value().Value();
    request.params = params_checked.Value();
    request.require_confirmation = confirm.Value();
    request.is_critical = critical.Value();
    return Result<void, Error>::Ok();
}

Result<void, Error> FillTelemetry(const nlohmann::json& args,
                                  RequestEnvelope& request) {
    auto app = OptString(args, "app_name", kDefaultTelemetryApp);
    if (app.IsErr()) return Result<void, Error>::Err(app.Error());
    auto app_checked = CheckAppName(app.Value());
    if (app_checked.IsErr()) return Result<void, Error>::Err(app_checked.Error());
    request.target = app_checked.Value();
    return Result<void, Error>::Ok();
}

Result<void, Error> FillManageApp(const nlohmann::json& args,
                                  RequestEnvelope& request) {
    auto app = RequireString(args, "app_name");
    if (app.IsErr()) return Result<void, Error>::Err(app.Error());
    auto app_checked = CheckAppName(app.Value());
    if (app_checked.IsErr()) return Result<void, Error>::Err(app_checked.Error());

    auto action = OptString(args, "action", kDefaultManageAction);
    if (action.IsErr()) return Result<void, Error>::Err(action.Error());
    if (!IsKnownAction(action.Value())) {
        return Result<void, Error>::Err(MakeArgError(
            "Invalid action '" + action.Value() +
            "': expected one of start, stop, status, restart"));
    }

    auto confirm = OptBool(args, "require_confirmation", true);
    if (confirm.IsErr()) return Result<void, Error>::Err(confirm.Error());

    request.target = app_checked.Value();
    request.params = QuoteParam(action.Value());
    request.require_confirmation = confirm.Value();
    return Result<void, Error>::Ok();
}

Result<void, Error> FillQuotedPath(const nlohmann::json& args,
                                   const std::string& key,
                                   const std::optional<std::string>& default_val,
                                   RequestEnvelope& request) {
    auto value = default_val.has_value() ? OptString(args, key, *default_val)
                                         : RequireString(args, key);
    if (value.IsErr()) return Result<void, Error>::Err(value.Error());
    if (value.Value().empty()) {
        return Result<void, Error>::Err(
            MakeArgError("Parameter '" + key + "' must not be empty"));
    }
    auto params = CheckParams(QuoteParam(value.Value()));
    if (params.IsErr()) return Result<void, Error>::Err(params.Error());
    request.params = params.Value();
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::optional<OperationCode> ToolOperation(std::string_view tool_name) {
    for (const auto& entry : kTools) {
        if (tool_name == entry.name) {
            return entry.code;
        }
    }
    return std::nullopt;
}

std::string QuoteParam(std::string_view value) {
    return nlohmann::json(std::string(value))
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

Result<std::string, Error> DecodeQuotedParam(std::string_view params) {
    auto parsed = nlohmann::json::parse(params.begin(), params.end(), nullptr, false);
    if (!parsed.is_string()) {
        return Result<std::string, Error>::Err(
            MakeArgError("Params are not a quoted string: " + std::string(params)));
    }
    return Result<std::string, Error>::Ok(parsed.get<std::string>());
}

Result<RequestEnvelope, Error> EncodeInvocation(std::string_view tool_name,
                                                const nlohmann::json& arguments,
                                                uint64_t id) {
    auto code = ToolOperation(tool_name);
    if (!code) {
        return Result<RequestEnvelope, Error>::Err(
            MakeArgError("Unknown tool: " + std::string(tool_name)));
    }

    const nlohmann::json args =
        arguments.is_null() ? nlohmann::json::object() : arguments;
    if (!args.is_object()) {
        return Result<RequestEnvelope, Error>::Err(
            MakeArgError("Arguments must be a JSON object"));
    }

    RequestEnvelope request;
    request.id = id;
    request.type = *code;

    Result<void, Error> filled = Result<void, Error>::Ok();
    switch (*code) {
        case OperationCode::SendCommand:
            filled = FillSendCommand(args, request);
            break;
        case OperationCode::GetTelemetry:
            filled = FillTelemetry(args, request);
            break;
        case OperationCode::GetSystemStatus:
        case OperationCode::GetEventLog:
            break;
        case OperationCode::ManageApplication:
            filled = FillManageApp(args, request);
            break;
        case OperationCode::ListFiles:
            filled = FillQuotedPath(args, "directory", std::string(kDefaultDirectory),
                                    request);
            break;
        case OperationCode::ReadFile:
            filled = FillQuotedPath(args, "file_path", std::nullopt, request);
            break;
        case OperationCode::EmergencyStop:
            request.require_confirmation = true;
            request.is_critical = true;
            break;
    }

    if (filled.IsErr()) {
        return Result<RequestEnvelope, Error>::Err(filled.Error());
    }
    return Result<RequestEnvelope, Error>::Ok(std::move(request));
}

} // namespace cfs_bridge
