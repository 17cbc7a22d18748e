#pragma once

#include <mcp_sandbox/core/result.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_sandbox {

// JSON-RPC 2.0 error codes, plus the MCP "server not initialized" code.
namespace rpc_error {
constexpr int kParseError           = -32700;
constexpr int kInvalidRequest       = -32600;
constexpr int kMethodNotFound       = -32601;
constexpr int kInvalidParams        = -32602;
constexpr int kInternalError        = -32603;
constexpr int kServerNotInitialized = -32002;
} // namespace rpc_error

// A request id is either an integer or a string. Never null or fractional.
using RequestId = std::variant<std::int64_t, std::string>;

nlohmann::json IdToJson(const RequestId& id);
std::string IdToString(const RequestId& id);

inline bool SameJson(const std::optional<nlohmann::json>& a,
                     const std::optional<nlohmann::json>& b) {
    if (a.has_value() != b.has_value()) return false;
    return !a.has_value() || *a == *b;
}

struct RpcError {
    int code = rpc_error::kInternalError;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               SameJson(data, other.data);
    }
    bool operator!=(const RpcError& other) const { return !(*this == other); }
};

struct Request {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Request& other) const {
        return id == other.id && method == other.method &&
               SameJson(params, other.params);
    }
    bool operator!=(const Request& other) const { return !(*this == other); }
};

struct Notification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const Notification& other) const {
        return method == other.method && SameJson(params, other.params);
    }
    bool operator!=(const Notification& other) const { return !(*this == other); }
};

// ---------------------------------------------------------------------------
// Response — carries exactly one of a result or an error.
// ---------------------------------------------------------------------------
struct Response {
    RequestId id;
    std::variant<nlohmann::json, RpcError> outcome;

    static Response Success(RequestId id, nlohmann::json result);
    static Response Failure(RequestId id, RpcError error);
    static Response Failure(RequestId id, int code, std::string message);

    [[nodiscard]] bool IsError() const noexcept { return outcome.index() == 1; }
    [[nodiscard]] const nlohmann::json& GetResult() const { return std::get<0>(outcome); }
    [[nodiscard]] const RpcError& GetError() const { return std::get<1>(outcome); }

    bool operator==(const Response& other) const {
        return id == other.id && outcome == other.outcome;
    }
    bool operator!=(const Response& other) const { return !(*this == other); }
};

using Message = std::variant<Request, Response, Notification>;

// ---------------------------------------------------------------------------
// DecodeError — why a line could not be turned into a Message. `id` is set
// when one could be recovered, so the peer can still be answered.
// ---------------------------------------------------------------------------
struct DecodeError {
    int code = rpc_error::kInvalidRequest;
    std::string message;
    std::optional<RequestId> id;
};

/// Parse one line of text into a JSON-RPC message and validate its envelope.
Result<Message, DecodeError> Decode(std::string_view text);

/// Validate an already-parsed JSON value as a JSON-RPC message.
Result<Message, DecodeError> DecodeJson(const nlohmann::json& value);

/// Serialize a message as single-line JSON. Invalid UTF-8 is replaced.
std::string Encode(const Message& message);

/// The JSON object form of a message (what Encode serializes).
nlohmann::json ToJson(const Message& message);

} // namespace mcp_sandbox
