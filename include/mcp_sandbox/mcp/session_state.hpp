#pragma once

#include <mcp_sandbox/core/result.hpp>
#include <mcp_sandbox/mcp/message_codec.hpp>

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

enum class SessionState {
    Uninitialized,
    Initializing,
    Ready,
    ShuttingDown,
    Closed,
};

const char* SessionStateName(SessionState state);

// Identity advertised in the initialize result.
struct ServerInfo {
    std::string name;
    std::string version;
    std::optional<std::string> instructions;
};

// ---------------------------------------------------------------------------
// Session — lifecycle of the single peer connection.
//
//   Uninitialized --initialize--> Initializing --ok--> Ready
//                                              --bad version--> Uninitialized
//   Ready --shutdown--> ShuttingDown --EOF--> Closed
//
// Negotiated protocol version and peer capabilities are written once, by a
// successful Initialize(), and never change afterwards.
// ---------------------------------------------------------------------------
class Session {
public:
    explicit Session(ServerInfo info);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    [[nodiscard]] SessionState State() const;

    /// Returns the error a request for `method` must be answered with in the
    /// current state, or nullopt if the method may proceed.
    [[nodiscard]] std::optional<RpcError> CheckRequest(std::string_view method) const;

    /// Notifications are only acted upon once the session is Ready.
    [[nodiscard]] bool AcceptsNotifications() const;

    /// Handle the initialize handshake. On success the session is Ready and
    /// the returned JSON is the initialize result.
    Result<nlohmann::json, RpcError> Initialize(const nlohmann::json& params);

    /// Ready -> ShuttingDown.
    Result<nlohmann::json, RpcError> BeginShutdown();

    /// Any state -> Closed (end of stream).
    void Close();

    [[nodiscard]] std::string ProtocolVersion() const;
    [[nodiscard]] nlohmann::json PeerCapabilities() const;
    [[nodiscard]] nlohmann::json PeerInfo() const;
    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

    static const std::vector<std::string>& SupportedProtocolVersions();
    static nlohmann::json ServerCapabilities();

private:
    ServerInfo info_;
    mutable std::mutex mutex_;
    SessionState state_ = SessionState::Uninitialized;
    std::string protocol_version_;
    nlohmann::json peer_capabilities_ = nlohmann::json::object();
    nlohmann::json peer_info_ = nlohmann::json::object();
};

} // namespace mcp_sandbox
