#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace cfs_bridge {

// ---------------------------------------------------------------------------
// ParameterSpec — one named tool argument.
// ---------------------------------------------------------------------------
struct ParameterSpec {
    std::string kind;  // JSON Schema type: "string", "boolean", ...
    std::string description;
    std::optional<nlohmann::json> default_value;
    std::vector<std::string> allowed;  // enum values, empty = unrestricted
};

// ---------------------------------------------------------------------------
// ToolSchema — JSON Schema for a tool's input parameters.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;  // array of content blocks
};

// A tool handler takes a JSON arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolDescriptor — everything the registry knows about one tool.
// Parameters keep declaration order so listings are stable.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    std::vector<std::pair<std::string, ParameterSpec>> parameters;
    std::vector<std::string> required;
    ToolHandler handler;

    // {"type":"object","properties":{...},"required":[...]}
    [[nodiscard]] nlohmann::json InputSchema() const;
};

// ---------------------------------------------------------------------------
// ToolRegistry — registry of tools, filled once at startup.
//
// Registering a name twice replaces the earlier descriptor in place.
// Execute() does not catch: an exception escaping a handler reaches the
// server, which reports it as an internal error.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(ToolDescriptor descriptor);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] std::size_t Size() const noexcept { return schemas_.size(); }

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

// Content helpers shared by tool handlers.
[[nodiscard]] ToolResult MakeTextResult(const std::string& text, bool is_error = false);

} // namespace cfs_bridge
