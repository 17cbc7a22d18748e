#include <mcp_sandbox/mcp/message_codec.hpp>

#include <cctype>
#include <limits>

namespace mcp_sandbox {

namespace {

using DecodeResult = Result<Message, DecodeError>;

DecodeResult Fail(int code, std::string message,
                  std::optional<RequestId> id = std::nullopt) {
    return DecodeResult::Err(DecodeError{code, std::move(message), std::move(id)});
}

// Interpret a JSON value as a request id. Only strings and integers that
// fit in int64 qualify.
std::optional<RequestId> IdFromJson(const nlohmann::json& value) {
    if (value.is_string()) {
        return RequestId{value.get<std::string>()};
    }
    if (value.is_number_unsigned()) {
        const auto u = value.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return RequestId{static_cast<std::int64_t>(u)};
    }
    if (value.is_number_integer()) {
        return RequestId{value.get<std::int64_t>()};
    }
    return std::nullopt;
}

void SkipSpace(std::string_view text, size_t& pos) {
    while (pos < text.size() &&
           std::isspace(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
}

// Best-effort recovery of `"id": <int|string>` from text that failed to
// parse. Only the first "id" key is considered.
std::optional<RequestId> RecoverIdFromText(std::string_view text) {
    const auto key = text.find("\"id\"");
    if (key == std::string_view::npos) return std::nullopt;

    size_t pos = key + 4;
    SkipSpace(text, pos);
    if (pos >= text.size() || text[pos] != ':') return std::nullopt;
    ++pos;
    SkipSpace(text, pos);
    if (pos >= text.size()) return std::nullopt;

    if (text[pos] == '"') {
        std::string value;
        for (++pos; pos < text.size(); ++pos) {
            const char c = text[pos];
            if (c == '"') return RequestId{value};
            if (c == '\\') {
                if (++pos >= text.size()) return std::nullopt;
                const char esc = text[pos];
                if (esc != '"' && esc != '\\' && esc != '/') return std::nullopt;
                value.push_back(esc);
                continue;
            }
            value.push_back(c);
        }
        return std::nullopt;
    }

    const size_t start = pos;
    if (text[pos] == '-') ++pos;
    const size_t digits_start = pos;
    while (pos < text.size() &&
           std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == digits_start || pos - digits_start > 18) return std::nullopt;
    if (pos < text.size()) {
        const char next = text[pos];
        if (next != ',' && next != '}' &&
            !std::isspace(static_cast<unsigned char>(next))) {
            return std::nullopt;
        }
    }
    return RequestId{std::stoll(std::string(text.substr(start, pos - start)))};
}

std::optional<nlohmann::json> OptionalParams(const nlohmann::json& object) {
    auto it = object.find("params");
    if (it == object.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

nlohmann::json IdToJson(const RequestId& id) {
    if (std::holds_alternative<std::int64_t>(id)) {
        return std::get<std::int64_t>(id);
    }
    return std::get<std::string>(id);
}

std::string IdToString(const RequestId& id) {
    if (std::holds_alternative<std::int64_t>(id)) {
        return std::to_string(std::get<std::int64_t>(id));
    }
    return "\"" + std::get<std::string>(id) + "\"";
}

Response Response::Success(RequestId id, nlohmann::json result) {
    return Response{std::move(id),
                    std::variant<nlohmann::json, RpcError>(
                        std::in_place_index<0>, std::move(result))};
}

Response Response::Failure(RequestId id, RpcError error) {
    return Response{std::move(id),
                    std::variant<nlohmann::json, RpcError>(
                        std::in_place_index<1>, std::move(error))};
}

Response Response::Failure(RequestId id, int code, std::string message) {
    return Failure(std::move(id), RpcError{code, std::move(message), std::nullopt});
}

// ---------------------------------------------------------------------------
// Decode
// ---------------------------------------------------------------------------
Result<Message, DecodeError> Decode(std::string_view text) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(text.begin(), text.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Fail(rpc_error::kParseError,
                    std::string("Parse error: ") + e.what(),
                    RecoverIdFromText(text));
    }
    return DecodeJson(value);
}

Result<Message, DecodeError> DecodeJson(const nlohmann::json& value) {
    if (!value.is_object()) {
        return Fail(rpc_error::kInvalidRequest,
                    "Invalid Request: message must be a JSON object");
    }

    // Recover the id first so every later failure can still be answered.
    std::optional<RequestId> id;
    const bool has_id = value.contains("id");
    if (has_id) {
        id = IdFromJson(value["id"]);
        if (!id) {
            return Fail(rpc_error::kInvalidRequest,
                        "Invalid Request: id must be a string or an integer");
        }
    }

    auto version = value.find("jsonrpc");
    if (version == value.end() || !version->is_string() ||
        version->get<std::string>() != "2.0") {
        return Fail(rpc_error::kInvalidRequest,
                    "Invalid Request: jsonrpc must be \"2.0\"", id);
    }

    auto method = value.find("method");
    if (method != value.end()) {
        if (!method->is_string() || method->get<std::string>().empty()) {
            return Fail(rpc_error::kInvalidRequest,
                        "Invalid Request: method must be a non-empty string", id);
        }
        auto params = OptionalParams(value);
        if (params && !params->is_object() && !params->is_array()) {
            return Fail(rpc_error::kInvalidRequest,
                        "Invalid Request: params must be an object or an array", id);
        }
        if (has_id) {
            return DecodeResult::Ok(
                Request{*id, method->get<std::string>(), std::move(params)});
        }
        return DecodeResult::Ok(
            Notification{method->get<std::string>(), std::move(params)});
    }

    const bool has_result = value.contains("result");
    const bool has_error = value.contains("error");
    if (!has_id) {
        return Fail(rpc_error::kInvalidRequest,
                    "Invalid Request: missing method");
    }
    if (has_result == has_error) {
        return Fail(rpc_error::kInvalidRequest,
                    "Invalid Response: exactly one of result or error is required",
                    id);
    }
    if (has_result) {
        return DecodeResult::Ok(Response::Success(*id, value["result"]));
    }

    const auto& error = value["error"];
    if (!error.is_object() || !error.contains("code") ||
        !error["code"].is_number_integer() || !error.contains("message") ||
        !error["message"].is_string()) {
        return Fail(rpc_error::kInvalidRequest,
                    "Invalid Response: error needs an integer code and a string message",
                    id);
    }
    RpcError rpc{error["code"].get<int>(), error["message"].get<std::string>(),
                 std::nullopt};
    if (error.contains("data")) {
        rpc.data = error["data"];
    }
    return DecodeResult::Ok(Response::Failure(*id, std::move(rpc)));
}

// ---------------------------------------------------------------------------
// Encode
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const Message& message) {
    nlohmann::json out = {{"jsonrpc", "2.0"}};

    if (const auto* request = std::get_if<Request>(&message)) {
        out["id"] = IdToJson(request->id);
        out["method"] = request->method;
        if (request->params) out["params"] = *request->params;
    } else if (const auto* notification = std::get_if<Notification>(&message)) {
        out["method"] = notification->method;
        if (notification->params) out["params"] = *notification->params;
    } else {
        const auto& response = std::get<Response>(message);
        out["id"] = IdToJson(response.id);
        if (response.IsError()) {
            const auto& error = response.GetError();
            out["error"] = {{"code", error.code}, {"message", error.message}};
            if (error.data) out["error"]["data"] = *error.data;
        } else {
            out["result"] = response.GetResult();
        }
    }
    return out;
}

std::string Encode(const Message& message) {
    return ToJson(message).dump(-1, ' ', false,
                                nlohmann::json::error_handler_t::replace);
}

} // namespace mcp_sandbox
