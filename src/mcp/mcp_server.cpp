#include <cfs_bridge/mcp/mcp_server.hpp>

#include <cfs_bridge/core/log.hpp>
#include <cfs_bridge/core/version.hpp>

#include <exception>
#include <string>

namespace cfs_bridge {

namespace {

constexpr const char* kComponent = "mcp";
constexpr const char* kProtocolVersion = "2024-11-05";

bool IsBlank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // anonymous namespace

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo(kComponent, "Serving " + std::to_string(registry_.Size()) +
                            " tools on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump(-1, ' ', false,
                                   nlohmann::json::error_handler_t::replace)
                 << "\n";
            out_.flush();
        }
    }
    LogInfo(kComponent, "Input closed, shutting down");
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception& e) {
        LogWarn(kComponent, std::string("Parse error: ") + e.what());
        return MakeError(nullptr, kParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest, "Invalid Request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeError(message["id"], kInvalidRequest,
                             "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    // Notifications have no "id" and never get a response.
    if (!message.contains("id")) {
        LogDebug(kComponent, "Notification: " +
                                 message.value("method", nlohmann::json()).dump());
        return std::nullopt;
    }

    const auto& id = message["id"];
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, kInvalidRequest, "Missing 'method'");
    }
    const auto method = message["method"].get<std::string>();
    const auto params = message.value("params", nlohmann::json::object());

    try {
        return Dispatch(method, params, id);
    } catch (const std::exception& e) {
        LogError(kComponent, "Unhandled error in " + method + ": " + e.what());
        return MakeError(id, kInternalError,
                         std::string("Internal error: ") + e.what());
    }
}

nlohmann::json McpServer::Dispatch(const std::string& method,
                                   const nlohmann::json& params,
                                   const nlohmann::json& id) {
    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else if (method == "tools/list" || method == "list-operations") {
        return HandleToolsList(id);
    } else if (method == "tools/call" || method == "invoke-operation") {
        return HandleToolsCall(params, id);
    }
    return MakeError(id, kMethodNotFound, "Method not found: " + method);
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& /*params*/, const nlohmann::json& id) {
    initialized_ = true;

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", "cfs-bridge"},
        {"version", kVersion}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        return MakeError(id, kInvalidParams, "'arguments' must be an object");
    }

    if (!registry_.HasTool(tool_name)) {
        return MakeError(id, kMethodNotFound, "Unknown tool: " + tool_name);
    }

    LogDebug(kComponent, "Calling tool " + tool_name);
    auto result = registry_.Execute(tool_name, arguments);

    nlohmann::json response_result;
    response_result["content"] = result.content;
    if (result.is_error) {
        response_result["isError"] = true;
    }

    return MakeResult(id, response_result);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace cfs_bridge
