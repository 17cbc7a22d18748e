#pragma once

#include <mcp_sandbox/mcp/message_codec.hpp>
#include <mcp_sandbox/mcp/session_state.hpp>
#include <mcp_sandbox/mcp/tool_registry.hpp>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// Dispatcher — routes decoded messages.
//
// Requests are checked against the session state before anything else runs.
// Handler exceptions stop here and become -32603 responses carrying the
// request id; they never reach the transport.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(Session& session, ToolRegistry& registry);

    [[nodiscard]] Response HandleRequest(const Request& request);

    void HandleNotification(const Notification& notification);

private:
    Response HandleInitialize(const Request& request);
    Response HandleShutdown(const Request& request);
    Response HandleToolsList(const Request& request);
    Response HandleToolsCall(const Request& request);
    Response HandleSetLogLevel(const Request& request);

    Session& session_;
    ToolRegistry& registry_;
};

} // namespace mcp_sandbox
