#include <cfs_bridge/bridge/safety_gate.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>
#include <cfs_bridge/core/log.hpp>

namespace cfs_bridge {

Result<void, Error> AuthorizeInvocation(std::string_view tool_name,
                                        const nlohmann::json& arguments) {
    if (ToolOperation(tool_name) != OperationCode::EmergencyStop) {
        return Result<void, Error>::Ok();
    }

    const bool confirmed = arguments.is_object() &&
                           arguments.contains("confirmation") &&
                           arguments["confirmation"].is_string() &&
                           arguments["confirmation"].get<std::string>() ==
                               kEmergencyStopConfirmation;
    if (confirmed) {
        LogWarn("safety", "Emergency stop confirmed");
        return Result<void, Error>::Ok();
    }

    LogWarn("safety", "Emergency stop rejected: confirmation token missing or wrong");
    return Result<void, Error>::Err(Error{
        "EmergencyStop", "", std::nullopt,
        std::string("Emergency stop requires confirmation='") +
            kEmergencyStopConfirmation + "'",
        std::nullopt, ErrorCategory::SafetyViolation, std::nullopt});
}

} // namespace cfs_bridge
