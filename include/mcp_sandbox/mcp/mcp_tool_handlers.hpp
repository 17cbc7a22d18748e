#pragma once

#include <mcp_sandbox/core/result.hpp>
#include <mcp_sandbox/mcp/tool_registry.hpp>
#include <mcp_sandbox/sandbox/sandbox_guard.hpp>
#include <mcp_sandbox/tools/file_tools.hpp>

namespace mcp_sandbox {

// Register the built-in tools: greeting, read_file, write_file,
// list_directory, create_directory. The guard and options are copied into
// the handlers; filesystem tools run under options.io_timeout.
Result<void, Error> RegisterSandboxTools(ToolRegistry& registry,
                                         const SandboxGuard& guard,
                                         const FileToolOptions& options);

} // namespace mcp_sandbox
