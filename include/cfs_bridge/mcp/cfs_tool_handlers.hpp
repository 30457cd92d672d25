#pragma once

#include <cfs_bridge/bridge/bridge.hpp>
#include <cfs_bridge/mcp/tool_registry.hpp>

namespace cfs_bridge {

// Register the eight cFS tools with the registry.
// Each handler captures &bridge by reference: single-threaded, one bridge
// (and so one connection) shared across all tool calls.
void RegisterCfsTools(ToolRegistry& registry, Bridge& bridge);

} // namespace cfs_bridge
