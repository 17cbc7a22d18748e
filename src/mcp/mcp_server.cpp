#include <mcp_sandbox/mcp/mcp_server.hpp>

#include <mcp_sandbox/core/log.hpp>
#include <mcp_sandbox/mcp/stdio_transport.hpp>

#include <string>
#include <variant>

namespace mcp_sandbox {

namespace {
constexpr const char* kLogComponent = "server";
} // anonymous namespace

McpServer::McpServer(ToolRegistry registry, ServerInfo info,
                     ITransport& transport)
    : registry_(std::move(registry)),
      session_(std::move(info)),
      dispatcher_(session_, registry_),
      transport_(transport) {}

McpServer::McpServer(ToolRegistry registry, ServerInfo info,
                     std::istream& in, std::ostream& out)
    : registry_(std::move(registry)),
      session_(std::move(info)),
      dispatcher_(session_, registry_),
      owned_transport_(std::make_unique<StdioTransport>(in, out)),
      transport_(*owned_transport_) {}

void McpServer::Run() {
    LogInfo(kLogComponent, "Serving " + std::to_string(registry_.Tools().size()) +
                               " tools; waiting for initialize");

    while (auto line = transport_.Receive()) {
        auto response = HandleLine(*line);
        if (!response) continue;

        if (!transport_.IsOpen()) {
            // The peer is gone; nobody is left to read the answer.
            LogDebug(kLogComponent, "Discarding response after end of stream");
            continue;
        }
        if (!transport_.Send(*response)) {
            LogError(kLogComponent, "Failed to write response; stopping");
            break;
        }
    }

    session_.Close();
    LogInfo(kLogComponent, "Input closed; session ended");
}

std::optional<std::string> McpServer::HandleLine(const std::string& line) {
    auto decoded = Decode(line);
    if (decoded.IsErr()) {
        const auto& error = decoded.Error();
        if (!error.id) {
            LogWarn(kLogComponent, "Dropping undecodable message without id: " +
                                       error.message);
            return std::nullopt;
        }
        LogWarn(kLogComponent, "Rejecting message " + IdToString(*error.id) +
                                   ": " + error.message);
        return Encode(Response::Failure(*error.id, error.code, error.message));
    }

    auto response = Dispatch(decoded.Value());
    if (!response) {
        return std::nullopt;
    }
    return Encode(*response);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    auto line = HandleLine(message.dump(-1, ' ', false,
                                        nlohmann::json::error_handler_t::replace));
    if (!line) {
        return std::nullopt;
    }
    return nlohmann::json::parse(*line);
}

std::optional<Response> McpServer::Dispatch(const Message& message) {
    if (const auto* request = std::get_if<Request>(&message)) {
        return dispatcher_.HandleRequest(*request);
    }
    if (const auto* notification = std::get_if<Notification>(&message)) {
        dispatcher_.HandleNotification(*notification);
        return std::nullopt;
    }
    // This server never issues requests, so a response has nothing to match.
    const auto& response = std::get<Response>(message);
    LogDebug(kLogComponent, "Ignoring unsolicited response " + IdToString(response.id));
    return std::nullopt;
}

} // namespace mcp_sandbox
