#include <mcp_sandbox/mcp/tool_registry.hpp>

#include <mcp_sandbox/core/types.hpp>

namespace mcp_sandbox {

namespace {

Error MakeRegistryError(const std::string& name, const std::string& message) {
    return Error{"ToolRegistry", name, message, ErrorCategory::Registry};
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolResult
// ---------------------------------------------------------------------------
ToolResult ToolResult::Text(const std::string& text) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}}),
        std::nullopt};
}

ToolResult ToolResult::Text(const std::string& text, nlohmann::json structured) {
    auto result = Text(text);
    result.structured_content = std::move(structured);
    return result;
}

ToolResult ToolResult::FromError(const ToolError& error) {
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", error.ToString()}}}),
        nlohmann::json{{"error", {{"kind", error.KindName()},
                                  {"message", error.message}}}}};
}

nlohmann::json ToolResult::ToJson() const {
    nlohmann::json out;
    out["content"] = content;
    if (is_error) {
        out["isError"] = true;
    }
    if (structured_content) {
        out["structuredContent"] = *structured_content;
    }
    return out;
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------
Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    if (frozen_) {
        return Result<void, Error>::Err(
            MakeRegistryError(name, "Registry is frozen; tools can only be "
                                    "registered before the session is ready"));
    }
    auto valid = ToolName::Create(name);
    if (valid.IsErr()) {
        return Result<void, Error>::Err(MakeRegistryError(name, valid.Error()));
    }
    if (handlers_.count(name) > 0) {
        return Result<void, Error>::Err(
            MakeRegistryError(name, "Duplicate tool name"));
    }
    if (!handler) {
        return Result<void, Error>::Err(
            MakeRegistryError(name, "Tool handler must not be empty"));
    }

    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
    return Result<void, Error>::Ok();
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

Result<ToolHandler, Error> ToolRegistry::Resolve(const std::string& name) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return Result<ToolHandler, Error>::Err(
            MakeRegistryError(name, "Unknown tool: " + name));
    }
    return Result<ToolHandler, Error>::Ok(it->second);
}

} // namespace mcp_sandbox
