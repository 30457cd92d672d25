#pragma once

#include <cfs_bridge/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

// JSON-RPC 2.0 error codes.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over stdin/stdout.
//
// Implements JSON-RPC 2.0 protocol, one message per line, with methods:
//   - initialize
//   - ping
//   - tools/list   (alias: list-operations)
//   - tools/call   (alias: invoke-operation)
//   - notifications/* (no response)
//
// Tool failures are successful RPC responses with "isError": true; RPC
// errors are reserved for malformed input and unknown methods or tools.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process one raw input line. Returns nullopt for notifications and
    // blank lines.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }

private:
    nlohmann::json Dispatch(const std::string& method,
                            const nlohmann::json& params,
                            const nlohmann::json& id);
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

} // namespace cfs_bridge
