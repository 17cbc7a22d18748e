#include <mcp_sandbox/mcp/dispatcher.hpp>

#include <mcp_sandbox/core/log.hpp>

#include <exception>
#include <string>

namespace mcp_sandbox {

namespace {

constexpr const char* kLogComponent = "dispatch";

const nlohmann::json& EmptyObject() {
    static const nlohmann::json empty = nlohmann::json::object();
    return empty;
}

} // anonymous namespace

Dispatcher::Dispatcher(Session& session, ToolRegistry& registry)
    : session_(session), registry_(registry) {}

Response Dispatcher::HandleRequest(const Request& request) {
    if (auto rejected = session_.CheckRequest(request.method)) {
        LogDebug(kLogComponent, "Rejected " + request.method + " in state " +
                                    SessionStateName(session_.State()));
        return Response::Failure(request.id, std::move(*rejected));
    }

    const auto& method = request.method;
    try {
        if (method == "initialize") {
            return HandleInitialize(request);
        } else if (method == "ping") {
            return Response::Success(request.id, nlohmann::json::object());
        } else if (method == "shutdown") {
            return HandleShutdown(request);
        } else if (method == "tools/list") {
            return HandleToolsList(request);
        } else if (method == "tools/call") {
            return HandleToolsCall(request);
        } else if (method == "prompts/list") {
            return Response::Success(request.id,
                                     {{"prompts", nlohmann::json::array()}});
        } else if (method == "resources/list") {
            return Response::Success(request.id,
                                     {{"resources", nlohmann::json::array()}});
        } else if (method == "logging/setLevel") {
            return HandleSetLogLevel(request);
        }
        return Response::Failure(request.id, rpc_error::kMethodNotFound,
                                 "Method not found: " + method);
    } catch (const std::exception& e) {
        LogError(kLogComponent, "Internal error in " + method + " (id " +
                                    IdToString(request.id) + "): " + e.what());
        return Response::Failure(request.id, rpc_error::kInternalError,
                                 std::string("Internal error: ") + e.what());
    } catch (...) {
        LogError(kLogComponent, "Unknown fault in " + method + " (id " +
                                    IdToString(request.id) + ")");
        return Response::Failure(request.id, rpc_error::kInternalError,
                                 "Internal error");
    }
}

void Dispatcher::HandleNotification(const Notification& notification) {
    const auto& method = notification.method;
    if (!session_.AcceptsNotifications()) {
        LogDebug(kLogComponent, "Ignoring notification " + method + " in state " +
                                    SessionStateName(session_.State()));
        return;
    }
    if (method == "notifications/initialized") {
        LogInfo(kLogComponent, "Client confirmed initialization; server ready");
    } else if (method == "notifications/cancelled") {
        // Requests are answered synchronously, so there is never anything
        // in flight to cancel.
        LogDebug(kLogComponent, "Cancellation received after completion");
    } else {
        LogDebug(kLogComponent, "Ignoring notification " + method);
    }
}

Response Dispatcher::HandleInitialize(const Request& request) {
    auto result = session_.Initialize(request.params.value_or(EmptyObject()));
    if (result.IsErr()) {
        return Response::Failure(request.id, std::move(result).Error());
    }
    registry_.Freeze();
    return Response::Success(request.id, std::move(result).Value());
}

Response Dispatcher::HandleShutdown(const Request& request) {
    auto result = session_.BeginShutdown();
    if (result.IsErr()) {
        return Response::Failure(request.id, std::move(result).Error());
    }
    LogInfo(kLogComponent, "Shutdown requested; waiting for end of stream");
    return Response::Success(request.id, std::move(result).Value());
}

Response Dispatcher::HandleToolsList(const Request& request) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return Response::Success(request.id, {{"tools", tools}});
}

Response Dispatcher::HandleToolsCall(const Request& request) {
    const auto& params = request.params.value_or(EmptyObject());
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return Response::Failure(request.id, rpc_error::kInvalidParams,
                                 "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments")) {
        arguments = params["arguments"];
    }
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        return Response::Failure(request.id, rpc_error::kInvalidParams,
                                 "'arguments' must be an object");
    }

    auto handler = registry_.Resolve(tool_name);
    if (handler.IsErr()) {
        return Response::Failure(request.id, rpc_error::kInvalidParams,
                                 "Unknown tool: " + tool_name);
    }

    LogDebug(kLogComponent, "Calling tool " + tool_name + " (id " +
                                IdToString(request.id) + ")");
    auto result = handler.Value()(arguments);
    if (result.is_error && result.structured_content &&
        result.structured_content->contains("error")) {
        const auto& error = (*result.structured_content)["error"];
        LogInfo(kLogComponent, "Tool " + tool_name + " failed: " +
                                   error.value("kind", std::string("?")) + ": " +
                                   error.value("message", std::string()));
    }
    return Response::Success(request.id, result.ToJson());
}

Response Dispatcher::HandleSetLogLevel(const Request& request) {
    const auto& params = request.params.value_or(EmptyObject());
    if (!params.is_object() || !params.contains("level") ||
        !params["level"].is_string()) {
        return Response::Failure(request.id, rpc_error::kInvalidParams,
                                 "Missing 'level' parameter");
    }
    auto level_name = params["level"].get<std::string>();
    auto level = ParseSyslogLevel(level_name);
    if (!level) {
        return Response::Failure(request.id, rpc_error::kInvalidParams,
                                 "Unknown log level: " + level_name);
    }
    GlobalLogger().SetLevel(*level);
    LogInfo(kLogComponent, "Log level set to " + level_name);
    return Response::Success(request.id, nlohmann::json::object());
}

} // namespace mcp_sandbox
