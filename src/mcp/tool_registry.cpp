#include <cfs_bridge/mcp/tool_registry.hpp>

#include <algorithm>

namespace cfs_bridge {

nlohmann::json ToolDescriptor::InputSchema() const {
    nlohmann::json properties = nlohmann::json::object();
    for (const auto& [param_name, spec] : parameters) {
        nlohmann::json prop = {{"type", spec.kind},
                               {"description", spec.description}};
        if (spec.default_value.has_value()) {
            prop["default"] = *spec.default_value;
        }
        if (!spec.allowed.empty()) {
            prop["enum"] = spec.allowed;
        }
        properties[param_name] = std::move(prop);
    }
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

void ToolRegistry::Register(ToolDescriptor descriptor) {
    ToolSchema schema{descriptor.name, descriptor.description,
                      descriptor.InputSchema()};

    auto existing = std::find_if(schemas_.begin(), schemas_.end(),
                                 [&](const ToolSchema& s) {
                                     return s.name == descriptor.name;
                                 });
    if (existing != schemas_.end()) {
        *existing = std::move(schema);
    } else {
        schemas_.push_back(std::move(schema));
    }
    handlers_[descriptor.name] = std::move(descriptor.handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end() || !it->second) {
        return MakeTextResult("Unknown tool: " + name, true);
    }
    return it->second(arguments);
}

ToolResult MakeTextResult(const std::string& text, bool is_error) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

} // namespace cfs_bridge
