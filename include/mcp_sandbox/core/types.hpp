#pragma once

#include <mcp_sandbox/core/result.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// ToolName — validated MCP tool name.
//
// Rules:
//   - 1 to 64 characters
//   - ASCII letters, digits, '_' and '-'
// ---------------------------------------------------------------------------
class ToolName {
public:
    static Result<ToolName, std::string> Create(std::string_view name);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }

    bool operator==(const ToolName& other) const { return value_ == other.value_; }
    bool operator!=(const ToolName& other) const { return value_ != other.value_; }

    ToolName(const ToolName&) = default;
    ToolName& operator=(const ToolName&) = default;
    ToolName(ToolName&&) noexcept = default;
    ToolName& operator=(ToolName&&) noexcept = default;

private:
    explicit ToolName(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// ByteSize — a positive byte count, parsed from "1048576", "512K", "10MB",
// "2 GiB". Suffixes are binary multiples (K = 1024).
// ---------------------------------------------------------------------------
class ByteSize {
public:
    static Result<ByteSize, std::string> Parse(std::string_view text);
    static Result<ByteSize, std::string> FromBytes(std::uint64_t bytes);

    [[nodiscard]] std::uint64_t Bytes() const noexcept { return bytes_; }

    /// Human-readable form, e.g. "10 MiB" or "1500 bytes".
    [[nodiscard]] std::string ToString() const;

    bool operator==(const ByteSize& other) const { return bytes_ == other.bytes_; }
    bool operator!=(const ByteSize& other) const { return bytes_ != other.bytes_; }

private:
    explicit ByteSize(std::uint64_t bytes) : bytes_(bytes) {}
    std::uint64_t bytes_;
};

} // namespace mcp_sandbox
