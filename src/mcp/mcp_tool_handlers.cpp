#include <mcp_sandbox/mcp/mcp_tool_handlers.hpp>

#include <mcp_sandbox/core/deadline.hpp>
#include <mcp_sandbox/core/log.hpp>
#include <mcp_sandbox/tools/greeting_tool.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace mcp_sandbox {

namespace {

constexpr const char* kLogComponent = "tools";

using FileToolFn = ToolResult (*)(const SandboxGuard&, const FileToolOptions&,
                                  const nlohmann::json&);

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// Wrap a filesystem tool so it runs on a helper thread bounded by the I/O
// timeout. Everything the worker touches is owned by the worker.
ToolHandler WithTimeout(std::string name, FileToolFn fn,
                        std::shared_ptr<const SandboxGuard> guard,
                        FileToolOptions options) {
    return [name = std::move(name), fn, guard = std::move(guard),
            options](const nlohmann::json& args) {
        auto result = RunWithTimeout(
            [fn, guard, options, args]() { return fn(*guard, options, args); },
            options.io_timeout);
        if (!result) {
            LogWarn(kLogComponent, name + " timed out after " +
                                       std::to_string(options.io_timeout.count()) +
                                       " ms");
            return ToolResult::FromError(ToolError{
                ToolErrorKind::IOFailure,
                name + " timed out after " +
                    std::to_string(options.io_timeout.count()) + " ms"});
        }
        return std::move(*result);
    };
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// RegisterSandboxTools
// ---------------------------------------------------------------------------
Result<void, Error> RegisterSandboxTools(ToolRegistry& registry,
                                         const SandboxGuard& guard,
                                         const FileToolOptions& options) {
    auto shared_guard = std::make_shared<const SandboxGuard>(guard);

    auto result = registry.Register(
        "greeting",
        "Returns a greeting message with the user's name.",
        MakeSchema({{"name", StringProp("The name of the user")}}, {"name"}),
        HandleGreeting);
    if (result.IsErr()) return result;

    result = registry.Register(
        "read_file",
        "Read the complete contents of a file inside the allowed directories.",
        MakeSchema({{"path", StringProp("Path of the file to read")}}, {"path"}),
        WithTimeout("read_file", HandleReadFile, shared_guard, options));
    if (result.IsErr()) return result;

    result = registry.Register(
        "write_file",
        "Create a file or overwrite an existing one with the given content. "
        "The parent directory must already exist.",
        MakeSchema({{"path", StringProp("Path of the file to write")},
                    {"content", StringProp("Content to write to the file")}},
                   {"path", "content"}),
        WithTimeout("write_file", HandleWriteFile, shared_guard, options));
    if (result.IsErr()) return result;

    result = registry.Register(
        "list_directory",
        "List the files and subdirectories of a directory, sorted by name.",
        MakeSchema({{"path", StringProp("Path of the directory to list")}},
                   {"path"}),
        WithTimeout("list_directory", HandleListDirectory, shared_guard, options));
    if (result.IsErr()) return result;

    result = registry.Register(
        "create_directory",
        "Create a new directory. Succeeds if it already exists.",
        MakeSchema({{"path", StringProp("Path of the directory to create")}},
                   {"path"}),
        WithTimeout("create_directory", HandleCreateDirectory, shared_guard,
                    options));
    return result;
}

} // namespace mcp_sandbox
