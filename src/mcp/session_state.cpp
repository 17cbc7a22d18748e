#include <mcp_sandbox/mcp/session_state.hpp>

#include <mcp_sandbox/core/log.hpp>

#include <algorithm>

namespace mcp_sandbox {

namespace {

constexpr const char* kLogComponent = "session";

RpcError MakeRpcError(int code, std::string message) {
    return RpcError{code, std::move(message), std::nullopt};
}

} // anonymous namespace

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Uninitialized: return "uninitialized";
        case SessionState::Initializing:  return "initializing";
        case SessionState::Ready:         return "ready";
        case SessionState::ShuttingDown:  return "shutting_down";
        case SessionState::Closed:        return "closed";
    }
    return "unknown";
}

Session::Session(ServerInfo info) : info_(std::move(info)) {}

SessionState Session::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::optional<RpcError> Session::CheckRequest(std::string_view method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    switch (state_) {
        case SessionState::Uninitialized:
            if (method == "initialize") return std::nullopt;
            return MakeRpcError(rpc_error::kServerNotInitialized,
                                "Server not initialized");
        case SessionState::Initializing:
            if (method == "initialize") {
                return MakeRpcError(rpc_error::kInvalidRequest,
                                    "Initialization already in progress");
            }
            return MakeRpcError(rpc_error::kServerNotInitialized,
                                "Server not initialized");
        case SessionState::Ready:
            if (method == "initialize") {
                return MakeRpcError(rpc_error::kInvalidRequest,
                                    "Server already initialized");
            }
            return std::nullopt;
        case SessionState::ShuttingDown:
            return MakeRpcError(rpc_error::kInvalidRequest,
                                "Server is shutting down");
        case SessionState::Closed:
            return MakeRpcError(rpc_error::kInvalidRequest,
                                "Session is closed");
    }
    return MakeRpcError(rpc_error::kInternalError, "Unknown session state");
}

bool Session::AcceptsNotifications() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == SessionState::Ready;
}

Result<nlohmann::json, RpcError> Session::Initialize(const nlohmann::json& params) {
    using InitResult = Result<nlohmann::json, RpcError>;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Uninitialized) {
            return InitResult::Err(MakeRpcError(
                rpc_error::kInvalidRequest,
                std::string("initialize not allowed in state ") +
                    SessionStateName(state_)));
        }
        state_ = SessionState::Initializing;
    }

    // Validation runs outside the lock; nothing else can move the state while
    // it is Initializing.
    const auto& supported = SupportedProtocolVersions();
    const bool has_version = params.is_object() &&
                             params.contains("protocolVersion") &&
                             params["protocolVersion"].is_string();
    const std::string requested =
        has_version ? params["protocolVersion"].get<std::string>() : "";

    if (!has_version ||
        std::find(supported.begin(), supported.end(), requested) == supported.end()) {
        RpcError error = MakeRpcError(
            rpc_error::kInvalidParams,
            has_version ? "Unsupported protocol version: " + requested
                        : std::string("Missing protocolVersion"));
        error.data = nlohmann::json{
            {"supported", supported},
            {"requested", has_version ? nlohmann::json(requested) : nlohmann::json()}};

        std::lock_guard<std::mutex> lock(mutex_);
        state_ = SessionState::Uninitialized;
        LogWarn(kLogComponent, "Rejected initialize: " + error.message);
        return InitResult::Err(std::move(error));
    }

    nlohmann::json capabilities = nlohmann::json::object();
    if (params.contains("capabilities") && params["capabilities"].is_object()) {
        capabilities = params["capabilities"];
    }
    nlohmann::json client_info = nlohmann::json::object();
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        client_info = params["clientInfo"];
    }

    std::string client_name = "<unnamed>";
    if (client_info.contains("name") && client_info["name"].is_string()) {
        client_name = client_info["name"].get<std::string>();
    }

    nlohmann::json result;
    result["protocolVersion"] = requested;
    result["capabilities"] = ServerCapabilities();
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version}
    };
    if (info_.instructions) {
        result["instructions"] = *info_.instructions;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        protocol_version_ = requested;
        peer_capabilities_ = std::move(capabilities);
        peer_info_ = std::move(client_info);
        state_ = SessionState::Ready;
    }

    LogInfo(kLogComponent, "Initialized with protocol " + requested +
                               " for client " + client_name);
    return InitResult::Ok(std::move(result));
}

Result<nlohmann::json, RpcError> Session::BeginShutdown() {
    using ShutdownResult = Result<nlohmann::json, RpcError>;
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ != SessionState::Ready) {
        return ShutdownResult::Err(MakeRpcError(
            rpc_error::kInvalidRequest,
            std::string("shutdown not allowed in state ") + SessionStateName(state_)));
    }
    state_ = SessionState::ShuttingDown;
    return ShutdownResult::Ok(nlohmann::json::object());
}

void Session::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = SessionState::Closed;
}

std::string Session::ProtocolVersion() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return protocol_version_;
}

nlohmann::json Session::PeerCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_capabilities_;
}

nlohmann::json Session::PeerInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peer_info_;
}

const std::vector<std::string>& Session::SupportedProtocolVersions() {
    static const std::vector<std::string> versions = {
        "2024-11-05",
        "2025-03-26",
        "2025-06-18",
    };
    return versions;
}

nlohmann::json Session::ServerCapabilities() {
    return {
        {"tools", {{"listChanged", false}}},
        {"logging", nlohmann::json::object()},
        {"prompts", {{"listChanged", false}}},
        {"resources", {{"listChanged", false}, {"subscribe", false}}},
    };
}

} // namespace mcp_sandbox
