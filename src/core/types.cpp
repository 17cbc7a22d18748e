#include <mcp_sandbox/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <limits>

namespace mcp_sandbox {

namespace {

bool IsToolNameChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

std::string ToUpper(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return out;
}

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ToolName
// ---------------------------------------------------------------------------
Result<ToolName, std::string> ToolName::Create(std::string_view name) {
    if (name.empty()) {
        return Result<ToolName, std::string>::Err("Tool name must not be empty");
    }
    if (name.size() > 64) {
        return Result<ToolName, std::string>::Err(
            "Tool name must be at most 64 characters, got " +
            std::to_string(name.size()));
    }
    if (!std::all_of(name.begin(), name.end(), IsToolNameChar)) {
        return Result<ToolName, std::string>::Err(
            "Tool name must contain only letters, digits, '_' and '-'");
    }
    return Result<ToolName, std::string>::Ok(ToolName(std::string(name)));
}

// ---------------------------------------------------------------------------
// ByteSize
// ---------------------------------------------------------------------------
Result<ByteSize, std::string> ByteSize::FromBytes(std::uint64_t bytes) {
    if (bytes == 0) {
        return Result<ByteSize, std::string>::Err("Size must be positive");
    }
    return Result<ByteSize, std::string>::Ok(ByteSize(bytes));
}

Result<ByteSize, std::string> ByteSize::Parse(std::string_view text) {
    auto trimmed = Trim(text);
    if (trimmed.empty()) {
        return Result<ByteSize, std::string>::Err("Size must not be empty");
    }

    size_t digits = 0;
    while (digits < trimmed.size() &&
           std::isdigit(static_cast<unsigned char>(trimmed[digits]))) {
        ++digits;
    }
    if (digits == 0) {
        return Result<ByteSize, std::string>::Err(
            "Size must start with a number: '" + std::string(text) + "'");
    }

    std::uint64_t value = 0;
    for (size_t i = 0; i < digits; ++i) {
        const auto d = static_cast<std::uint64_t>(trimmed[i] - '0');
        if (value > (std::numeric_limits<std::uint64_t>::max() - d) / 10) {
            return Result<ByteSize, std::string>::Err(
                "Size is out of range: '" + std::string(text) + "'");
        }
        value = value * 10 + d;
    }

    const auto suffix = ToUpper(Trim(trimmed.substr(digits)));
    std::uint64_t multiplier = 1;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        multiplier = 1024ULL;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        multiplier = 1024ULL * 1024;
    } else if (suffix == "G" || suffix == "GB" || suffix == "GIB") {
        multiplier = 1024ULL * 1024 * 1024;
    } else {
        return Result<ByteSize, std::string>::Err(
            "Unknown size suffix '" + suffix + "' (use K, M or G)");
    }

    if (value > std::numeric_limits<std::uint64_t>::max() / multiplier) {
        return Result<ByteSize, std::string>::Err(
            "Size is out of range: '" + std::string(text) + "'");
    }
    return FromBytes(value * multiplier);
}

std::string ByteSize::ToString() const {
    constexpr std::uint64_t kKiB = 1024ULL;
    constexpr std::uint64_t kMiB = kKiB * 1024;
    constexpr std::uint64_t kGiB = kMiB * 1024;
    if (bytes_ % kGiB == 0) return std::to_string(bytes_ / kGiB) + " GiB";
    if (bytes_ % kMiB == 0) return std::to_string(bytes_ / kMiB) + " MiB";
    if (bytes_ % kKiB == 0) return std::to_string(bytes_ / kKiB) + " KiB";
    return std::to_string(bytes_) + " bytes";
}

} // namespace mcp_sandbox
