#include <catch2/catch_test_macros.hpp>

#include <cfs_bridge/bridge/request_encoder.hpp>

#include <nlohmann/json.hpp>

#include <string>

using namespace cfs_bridge;
using nlohmann::json;

namespace {

RequestEnvelope MustEncode(const char* tool, const json& args, uint64_t id = 1) {
    auto r = EncodeInvocation(tool, args, id);
    if (r.IsErr()) {
        FAIL(r.Error().ToString());
    }
    return r.Value();
}

std::string EncodeError(const char* tool, const json& args) {
    auto r = EncodeInvocation(tool, args, 1);
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::InvalidArgument);
    CHECK(r.Error().operation == "EncodeInvocation");
    return r.Error().message;
}

} // anonymous namespace

// ===========================================================================
// Tool table
// ===========================================================================

TEST_CASE("ToolOperation: maps every tool to its operation", "[bridge][encoder]") {
    CHECK(ToolOperation(kToolSendCommand) == OperationCode::SendCommand);
    CHECK(ToolOperation(kToolGetTelemetry) == OperationCode::GetTelemetry);
    CHECK(ToolOperation(kToolGetSystemStatus) == OperationCode::GetSystemStatus);
    CHECK(ToolOperation(kToolManageApp) == OperationCode::ManageApplication);
    CHECK(ToolOperation(kToolListFiles) == OperationCode::ListFiles);
    CHECK(ToolOperation(kToolReadFile) == OperationCode::ReadFile);
    CHECK(ToolOperation(kToolGetEventLog) == OperationCode::GetEventLog);
    CHECK(ToolOperation(kToolEmergencyStop) == OperationCode::EmergencyStop);
    CHECK_FALSE(ToolOperation("cfs_reboot").has_value());
}

TEST_CASE("QuoteParam: produces a JSON string literal", "[bridge][encoder]") {
    CHECK(QuoteParam("/cf") == "\"/cf\"");
    CHECK(QuoteParam("a\"b") == "\"a\\\"b\"");

    auto decoded = DecodeQuotedParam(QuoteParam("/cf/logs/x y.txt"));
    REQUIRE(decoded.IsOk());
    CHECK(decoded.Value() == "/cf/logs/x y.txt");

    CHECK(DecodeQuotedParam("/cf").IsErr());
    CHECK(DecodeQuotedParam("42").IsErr());
}

// ===========================================================================
// EncodeInvocation
// ===========================================================================

TEST_CASE("EncodeInvocation: send_command carries all fields", "[bridge][encoder]") {
    auto req = MustEncode(kToolSendCommand,
                          {{"app_name", "CFE_ES"},
                           {"command", "NOOP"},
                           {"params", "{\"x\":1}"},
                           {"is_critical", true}},
                          17);
    CHECK(req.id == 17);
    CHECK(req.type == OperationCode::SendCommand);
    CHECK(req.target == "CFE_ES");
    CHECK(req.command == "NOOP");
    CHECK(req.params == "{\"x\":1}");
    REQUIRE(req.require_confirmation.has_value());
    CHECK_FALSE(*req.require_confirmation);
    CHECK(req.is_critical == true);
}

TEST_CASE("EncodeInvocation: send_command defaults", "[bridge][encoder]") {
    auto req = MustEncode(kToolSendCommand, {{"app_name", "HK"}, {"command", "RESET"}});
    CHECK(req.params.empty());
    CHECK(req.require_confirmation == false);
    CHECK(req.is_critical == false);
}

TEST_CASE("EncodeInvocation: send_command rejects missing and bad arguments",
          "[bridge][encoder]") {
    CHECK(EncodeError(kToolSendCommand, {{"command", "NOOP"}}) ==
          "Missing required parameter: app_name");
    CHECK(EncodeError(kToolSendCommand, {{"app_name", "FM"}}) ==
          "Missing required parameter: command");
    CHECK(EncodeError(kToolSendCommand, {{"app_name", 5}, {"command", "NOOP"}}) ==
          "Parameter 'app_name' must be a string");
    CHECK(EncodeError(kToolSendCommand,
                      {{"app_name", "FM"}, {"command", "NOOP"}, {"is_critical", "yes"}}) ==
          "Parameter 'is_critical' must be a boolean");

    // Over-long identifiers are rejected before they reach the wire.
    EncodeError(kToolSendCommand, {{"app_name", std::string(20, 'A')}, {"command", "NOOP"}});
    EncodeError(kToolSendCommand, {{"app_name", "FM"}, {"command", std::string(32, 'C')}});
    EncodeError(kToolSendCommand,
                {{"app_name", "FM"}, {"command", "NOOP"}, {"params", std::string(4096, 'p')}});
}

TEST_CASE("EncodeInvocation: telemetry defaults to MCP_INTERFACE", "[bridge][encoder]") {
    auto req = MustEncode(kToolGetTelemetry, json::object());
    CHECK(req.type == OperationCode::GetTelemetry);
    CHECK(req.target == kDefaultTelemetryApp);
    CHECK_FALSE(req.require_confirmation.has_value());

    auto named = MustEncode(kToolGetTelemetry, {{"app_name", "SAMPLE_APP"}});
    CHECK(named.target == "SAMPLE_APP");
}

TEST_CASE("EncodeInvocation: null arguments behave like an empty object",
          "[bridge][encoder]") {
    auto req = MustEncode(kToolGetTelemetry, json());
    CHECK(req.target == kDefaultTelemetryApp);
}

TEST_CASE("EncodeInvocation: non-object arguments are rejected", "[bridge][encoder]") {
    CHECK(EncodeError(kToolGetSystemStatus, json::array({1, 2})) ==
          "Arguments must be a JSON object");
    CHECK(EncodeError(kToolGetSystemStatus, "text") == "Arguments must be a JSON object");
}

TEST_CASE("EncodeInvocation: manage_app quotes the action", "[bridge][encoder]") {
    auto req = MustEncode(kToolManageApp, {{"app_name", "FM"}, {"action", "restart"}});
    CHECK(req.type == OperationCode::ManageApplication);
    CHECK(req.target == "FM");
    CHECK(req.params == "\"restart\"");
    CHECK(req.require_confirmation == true);
    CHECK_FALSE(req.is_critical.has_value());
}

TEST_CASE("EncodeInvocation: manage_app defaults and overrides", "[bridge][encoder]") {
    auto status = MustEncode(kToolManageApp, {{"app_name", "FM"}});
    CHECK(status.params == "\"status\"");

    auto unconfirmed = MustEncode(
        kToolManageApp, {{"app_name", "FM"}, {"require_confirmation", false}});
    CHECK(unconfirmed.require_confirmation == false);
}

TEST_CASE("EncodeInvocation: manage_app rejects unknown actions", "[bridge][encoder]") {
    CHECK(EncodeError(kToolManageApp, {{"app_name", "FM"}, {"action", "reboot"}}) ==
          "Invalid action 'reboot': expected one of start, stop, status, restart");
    CHECK(EncodeError(kToolManageApp, {{"action", "stop"}}) ==
          "Missing required parameter: app_name");
}

TEST_CASE("EncodeInvocation: list_files quotes the directory", "[bridge][encoder]") {
    auto def = MustEncode(kToolListFiles, json::object());
    CHECK(def.params == "\"/cf\"");

    auto logs = MustEncode(kToolListFiles, {{"directory", "/cf/logs"}});
    CHECK(logs.params == "\"/cf/logs\"");
    CHECK(logs.target.empty());

    CHECK(EncodeError(kToolListFiles, {{"directory", ""}}) ==
          "Parameter 'directory' must not be empty");
}

TEST_CASE("EncodeInvocation: read_file requires a path", "[bridge][encoder]") {
    auto req = MustEncode(kToolReadFile, {{"file_path", "/cf/test_file.txt"}});
    CHECK(req.type == OperationCode::ReadFile);
    CHECK(req.params == "\"/cf/test_file.txt\"");

    CHECK(EncodeError(kToolReadFile, json::object()) ==
          "Missing required parameter: file_path");
    CHECK(EncodeError(kToolReadFile, {{"file_path", ""}}) ==
          "Parameter 'file_path' must not be empty");
}

TEST_CASE("EncodeInvocation: argument-free operations ignore extras", "[bridge][encoder]") {
    auto status = MustEncode(kToolGetSystemStatus, {{"verbose", true}});
    CHECK(status.type == OperationCode::GetSystemStatus);
    CHECK(status.target.empty());
    CHECK(status.params.empty());

    auto events = MustEncode(kToolGetEventLog, json::object());
    CHECK(events.type == OperationCode::GetEventLog);
}

TEST_CASE("EncodeInvocation: emergency stop is confirmed and critical",
          "[bridge][encoder]") {
    auto req = MustEncode(kToolEmergencyStop,
                          {{"confirmation", "CONFIRM_EMERGENCY_STOP"}});
    CHECK(req.type == OperationCode::EmergencyStop);
    CHECK(req.require_confirmation == true);
    CHECK(req.is_critical == true);
}

TEST_CASE("EncodeInvocation: unknown tool", "[bridge][encoder]") {
    CHECK(EncodeError("cfs_reboot", json::object()) == "Unknown tool: cfs_reboot");
}
