#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <utility>
#include <variant>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// Result<T, E> — a discriminated union that holds either a value or an error.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) const& -> Result<std::invoke_result_t<Fn, const T&>, E> {
        using U = std::invoke_result_t<Fn, const T&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(storage_)));
        }
        return Result<U, E>::Err(std::get<1>(storage_));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E> — specialization for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory — classifies startup/internal errors for exit codes.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    Sandbox,
    Registry,
    Protocol,
    Io,
    Internal,
};

// ---------------------------------------------------------------------------
// Error — structured error for configuration, registry and sandbox setup.
// `target` names the offending thing (a path, a tool name, a flag).
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string target;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:   return 2;
            case ErrorCategory::Sandbox:  return 3;
            case ErrorCategory::Registry: return 99;
            case ErrorCategory::Protocol: return 99;
            case ErrorCategory::Io:       return 99;
            case ErrorCategory::Internal: return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Sandbox:  return "sandbox";
            case ErrorCategory::Registry: return "registry";
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Io:       return "io";
            case ErrorCategory::Internal: return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation;
        if (!target.empty()) {
            oss << " [" << target << "]";
        }
        oss << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               target == other.target &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

// ---------------------------------------------------------------------------
// ToolErrorKind / ToolError — failures of a tool invocation. These travel
// inside a successful tools/call response, never as a JSON-RPC error.
// ---------------------------------------------------------------------------
enum class ToolErrorKind {
    AccessDenied,
    NotFound,
    IOFailure,
    TooLarge,
    NotADirectory,
    InvalidArguments,
};

struct ToolError {
    ToolErrorKind kind = ToolErrorKind::IOFailure;
    std::string message;

    /// Classify a filesystem error code. `action` is prefixed to the
    /// message, e.g. "Cannot open file".
    static ToolError FromErrorCode(const std::error_code& ec,
                                   const std::string& action);

    [[nodiscard]] std::string KindName() const {
        switch (kind) {
            case ToolErrorKind::AccessDenied:     return "AccessDenied";
            case ToolErrorKind::NotFound:         return "NotFound";
            case ToolErrorKind::IOFailure:        return "IOFailure";
            case ToolErrorKind::TooLarge:         return "TooLarge";
            case ToolErrorKind::NotADirectory:    return "NotADirectory";
            case ToolErrorKind::InvalidArguments: return "InvalidArguments";
        }
        return "IOFailure";
    }

    [[nodiscard]] std::string ToString() const {
        return KindName() + ": " + message;
    }

    bool operator==(const ToolError& other) const {
        return kind == other.kind && message == other.message;
    }

    bool operator!=(const ToolError& other) const {
        return !(*this == other);
    }
};

} // namespace mcp_sandbox
