#pragma once

#include <mcp_sandbox/mcp/tool_registry.hpp>
#include <mcp_sandbox/sandbox/sandbox_guard.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

struct FileToolOptions {
    std::uint64_t max_file_size = 10ULL * 1024 * 1024;
    std::chrono::milliseconds io_timeout{30000};
};

// ---------------------------------------------------------------------------
// Filesystem tools. Each one authorizes its `path` argument through the
// guard and then operates only on the canonical path it got back. Failures
// come back as ToolResult::FromError, never as exceptions.
// ---------------------------------------------------------------------------

// read_file {path} -> full contents as text; structured {path, size}.
ToolResult HandleReadFile(const SandboxGuard& guard,
                          const FileToolOptions& options,
                          const nlohmann::json& args);

// write_file {path, content} -> create or truncate, then write.
ToolResult HandleWriteFile(const SandboxGuard& guard,
                           const FileToolOptions& options,
                           const nlohmann::json& args);

// list_directory {path} -> entries sorted by name.
ToolResult HandleListDirectory(const SandboxGuard& guard,
                               const FileToolOptions& options,
                               const nlohmann::json& args);

// create_directory {path} -> one level; an existing directory is fine.
ToolResult HandleCreateDirectory(const SandboxGuard& guard,
                                 const FileToolOptions& options,
                                 const nlohmann::json& args);

// ---------------------------------------------------------------------------
// Descriptor-level I/O on a path the guard already authorized. The parent
// directory is reached from "/" one component at a time and the leaf is
// opened with O_NOFOLLOW, so a symlink swapped into the path after Authorize
// fails with AccessDenied instead of leading out of the roots.
// ---------------------------------------------------------------------------

// At most `max_size` bytes; the contents must be UTF-8 text.
[[nodiscard]] Result<std::string, ToolError> ReadAuthorizedFile(
    const std::filesystem::path& path, std::uint64_t max_size);

[[nodiscard]] Result<void, ToolError> WriteAuthorizedFile(
    const std::filesystem::path& path, std::string_view content);

// Ok(false) when the directory was already there.
[[nodiscard]] Result<bool, ToolError> CreateAuthorizedDirectory(
    const std::filesystem::path& path);

// Well-formed UTF-8: no overlong forms, no surrogates, nothing past U+10FFFF.
[[nodiscard]] bool IsValidUtf8(std::string_view text);

} // namespace mcp_sandbox
