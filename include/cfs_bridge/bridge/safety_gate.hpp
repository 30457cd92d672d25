#pragma once

#include <cfs_bridge/core/result.hpp>

#include <string_view>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

inline constexpr const char* kEmergencyStopConfirmation = "CONFIRM_EMERGENCY_STOP";

// ---------------------------------------------------------------------------
// AuthorizeInvocation — gate applied before anything is encoded or sent.
//
// The emergency stop runs only when arguments["confirmation"] is exactly the
// string kEmergencyStopConfirmation; anything else is a SafetyViolation.
// All other tools pass unconditionally: their confirmation/critical flags are
// forwarded metadata, enforced by the endpoint.
// ---------------------------------------------------------------------------
[[nodiscard]] Result<void, Error> AuthorizeInvocation(std::string_view tool_name,
                                                      const nlohmann::json& arguments);

} // namespace cfs_bridge
