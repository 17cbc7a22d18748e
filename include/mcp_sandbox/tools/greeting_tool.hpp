#pragma once

#include <mcp_sandbox/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

// greeting — pure, deterministic, no filesystem access.
// args: {name: string} -> "Hello from the MCP Server <name>!"
ToolResult HandleGreeting(const nlohmann::json& args);

} // namespace mcp_sandbox
