#pragma once

#include <mcp_sandbox/core/result.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// ToolSchema — descriptor of a tool as advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — outcome of executing a tool (an MCP CallToolResult).
// A failed tool carries is_error and a structured {kind, message}.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();  // content blocks
    std::optional<nlohmann::json> structured_content;

    static ToolResult Text(const std::string& text);
    static ToolResult Text(const std::string& text, nlohmann::json structured);
    static ToolResult FromError(const ToolError& error);

    [[nodiscard]] nlohmann::json ToJson() const;
};

// A tool handler takes the call's arguments object and returns a ToolResult.
// Throwing is treated as an internal fault by the dispatcher.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — name -> (schema, handler). Filled at startup, frozen once
// the session is ready; order of Tools() is registration order.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    Result<void, Error> Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolHandler handler);

    void Freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool IsFrozen() const noexcept { return frozen_; }

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] Result<ToolHandler, Error> Resolve(const std::string& name) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
    bool frozen_ = false;
};

} // namespace mcp_sandbox
