#pragma once

#include <mcp_sandbox/mcp/dispatcher.hpp>
#include <mcp_sandbox/mcp/i_transport.hpp>
#include <mcp_sandbox/mcp/session_state.hpp>
#include <mcp_sandbox/mcp/tool_registry.hpp>

#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// McpServer — MCP server over a line-delimited transport.
//
// Implements JSON-RPC 2.0 with the MCP methods:
//   - initialize, ping, shutdown
//   - tools/list, tools/call
//   - prompts/list, resources/list (always empty)
//   - logging/setLevel
//   - notifications/initialized, notifications/cancelled (no response)
//
// Requests are served one at a time, so responses leave in request order.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ToolRegistry registry, ServerInfo info, ITransport& transport);

    explicit McpServer(ToolRegistry registry,
                       ServerInfo info,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run the server loop (blocks until end of input). Leaves the session
    // Closed.
    void Run();

    // Process one raw line and return the encoded response (if any).
    // Returns nullopt for notifications, peer responses, and undecodable
    // input without a recoverable id.
    [[nodiscard]] std::optional<std::string> HandleLine(const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] const Session& GetSession() const noexcept { return session_; }
    [[nodiscard]] const ToolRegistry& Registry() const noexcept { return registry_; }

private:
    std::optional<Response> Dispatch(const Message& message);

    ToolRegistry registry_;
    Session session_;
    Dispatcher dispatcher_;
    std::unique_ptr<ITransport> owned_transport_;
    ITransport& transport_;
};

} // namespace mcp_sandbox
