#include <cfs_bridge/mcp/cfs_tool_handlers.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>
#include <cfs_bridge/bridge/safety_gate.hpp>
#include <cfs_bridge/core/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace cfs_bridge {

namespace {

// ---------------------------------------------------------------------------
// Result helpers
// ---------------------------------------------------------------------------

ToolResult MakeOkResult(const nlohmann::json& data) {
    return MakeTextResult(
        data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
}

ToolResult MakeErrorResult(const Error& error) {
    return MakeTextResult(error.ToJson(), true);
}

// ---------------------------------------------------------------------------
// Parameter helpers
// ---------------------------------------------------------------------------

ParameterSpec StringParam(const std::string& desc) {
    return ParameterSpec{"string", desc, std::nullopt, {}};
}

ParameterSpec StringParam(const std::string& desc, const std::string& default_val) {
    return ParameterSpec{"string", desc, nlohmann::json(default_val), {}};
}

ParameterSpec BoolParam(const std::string& desc, bool default_val) {
    return ParameterSpec{"boolean", desc, nlohmann::json(default_val), {}};
}

// Every cFS tool runs the same pipeline; only the descriptor differs.
ToolHandler MakeHandler(Bridge& bridge, const std::string& tool_name) {
    return [&bridge, tool_name](const nlohmann::json& arguments) {
        auto result = bridge.Invoke(tool_name, arguments);
        if (result.IsErr()) {
            LogWarn("mcp", tool_name + " failed: " + result.Error().ToString());
            return MakeErrorResult(result.Error());
        }
        return MakeOkResult(result.Value());
    };
}

} // anonymous namespace

void RegisterCfsTools(ToolRegistry& registry, Bridge& bridge) {
    registry.Register(ToolDescriptor{
        kToolSendCommand,
        "Send a command to a cFS application.",
        {
            {"app_name", StringParam("Name of the cFS application (e.g. CFE_ES, FM)")},
            {"command", StringParam("Command name (e.g. NOOP, RESET_COUNTERS)")},
            {"params", StringParam("Command parameters as a JSON string", "")},
            {"require_confirmation",
             BoolParam("Whether this command requires operator confirmation", false)},
            {"is_critical",
             BoolParam("Whether this is a critical command that affects safety", false)},
        },
        {"app_name", "command"},
        MakeHandler(bridge, kToolSendCommand)});

    registry.Register(ToolDescriptor{
        kToolGetTelemetry,
        "Get telemetry data from a cFS application.",
        {
            {"app_name", StringParam("Name of the cFS application to get telemetry from",
                                     kDefaultTelemetryApp)},
        },
        {},
        MakeHandler(bridge, kToolGetTelemetry)});

    registry.Register(ToolDescriptor{
        kToolGetSystemStatus,
        "Get overall cFS system status and health information.",
        {},
        {},
        MakeHandler(bridge, kToolGetSystemStatus)});

    ParameterSpec action = StringParam("Action to perform", kDefaultManageAction);
    action.allowed = {"start", "stop", "status", "restart"};
    registry.Register(ToolDescriptor{
        kToolManageApp,
        "Manage cFS applications (start, stop, restart, get status).",
        {
            {"app_name", StringParam("Name of the cFS application")},
            {"action", action},
            {"require_confirmation",
             BoolParam("Whether to require confirmation for critical actions", true)},
        },
        {"app_name"},
        MakeHandler(bridge, kToolManageApp)});

    registry.Register(ToolDescriptor{
        kToolListFiles,
        "List files in a cFS filesystem directory.",
        {
            {"directory", StringParam("Directory path to list", kDefaultDirectory)},
        },
        {},
        MakeHandler(bridge, kToolListFiles)});

    registry.Register(ToolDescriptor{
        kToolReadFile,
        "Read contents of a file from the cFS filesystem.",
        {
            {"file_path", StringParam("Full path to the file to read")},
        },
        {"file_path"},
        MakeHandler(bridge, kToolReadFile)});

    registry.Register(ToolDescriptor{
        kToolGetEventLog,
        "Get recent events from the cFS Event Services log.",
        {},
        {},
        MakeHandler(bridge, kToolGetEventLog)});

    registry.Register(ToolDescriptor{
        kToolEmergencyStop,
        "EMERGENCY STOP: put the spacecraft systems in safe mode. "
        "Only for emergencies; requires the confirmation token.",
        {
            {"confirmation",
             StringParam(std::string("Must be ") + kEmergencyStopConfirmation +
                         " to execute")},
        },
        {"confirmation"},
        MakeHandler(bridge, kToolEmergencyStop)});
}

} // namespace cfs_bridge
