#include <mcp_sandbox/tools/greeting_tool.hpp>

#include <string>

namespace mcp_sandbox {

ToolResult HandleGreeting(const nlohmann::json& args) {
    if (!args.is_object() || !args.contains("name") || !args["name"].is_string()) {
        return ToolResult::FromError(ToolError{
            ToolErrorKind::InvalidArguments, "Missing 'name' argument"});
    }
    return ToolResult::Text("Hello from the MCP Server " +
                            args["name"].get<std::string>() + "!");
}

} // namespace mcp_sandbox
