#include <mcp_sandbox/sandbox/sandbox_guard.hpp>

#include <mcp_sandbox/core/log.hpp>

#include <algorithm>
#include <system_error>

namespace mcp_sandbox {

namespace fs = std::filesystem;

namespace {

constexpr const char* kLogComponent = "sandbox";

Result<fs::path, ToolError> Deny(std::string_view requested) {
    return Result<fs::path, ToolError>::Err(ToolError{
        ToolErrorKind::AccessDenied,
        "Access denied: '" + std::string(requested) +
            "' is outside the allowed directories"});
}

bool IsAncestorOrSelf(const fs::path& root, const fs::path& candidate) {
    auto r = root.begin();
    auto c = candidate.begin();
    for (; r != root.end(); ++r, ++c) {
        if (c == candidate.end() || *r != *c) {
            return false;
        }
    }
    return true;
}

} // anonymous namespace

Result<SandboxGuard, Error> SandboxGuard::Create(const std::vector<std::string>& roots) {
    std::vector<fs::path> canonical_roots;

    for (const auto& root : roots) {
        if (root.empty()) {
            LogWarn(kLogComponent, "Skipping empty allowed path");
            continue;
        }
        std::error_code ec;
        auto canonical = fs::canonical(fs::path(root), ec);
        if (ec) {
            LogWarn(kLogComponent, "Skipping allowed path '" + root + "': " + ec.message());
            continue;
        }
        if (!fs::is_directory(canonical, ec)) {
            LogWarn(kLogComponent, "Skipping allowed path '" + root +
                                       "': not a directory");
            continue;
        }
        if (std::find(canonical_roots.begin(), canonical_roots.end(), canonical) !=
            canonical_roots.end()) {
            continue;
        }
        LogInfo(kLogComponent, "Allowed root: " + canonical.string());
        canonical_roots.push_back(std::move(canonical));
    }

    if (canonical_roots.empty()) {
        return Result<SandboxGuard, Error>::Err(Error{
            "SandboxGuard", "",
            "No usable allowed directory (checked " +
                std::to_string(roots.size()) + " path(s))",
            ErrorCategory::Sandbox});
    }
    return Result<SandboxGuard, Error>::Ok(SandboxGuard(std::move(canonical_roots)));
}

Result<fs::path, ToolError> SandboxGuard::Authorize(std::string_view requested) const {
    if (requested.empty() || requested.find('\0') != std::string_view::npos) {
        return Deny(requested);
    }

    std::error_code ec;
    const auto absolute = fs::absolute(fs::path(std::string(requested)), ec);
    if (ec) {
        return Deny(requested);
    }

    fs::path resolved;
    const auto status = fs::symlink_status(absolute, ec);
    if (!ec && fs::exists(status)) {
        // Existing entry (possibly a symlink): resolve it completely. A
        // dangling symlink fails here and is refused.
        resolved = fs::canonical(absolute, ec);
        if (ec) {
            return Deny(requested);
        }
    } else {
        // Not there yet: the parent must resolve, the leaf is taken as is.
        const auto leaf = absolute.filename();
        if (leaf.empty() || leaf == "." || leaf == "..") {
            return Deny(requested);
        }
        const auto parent = fs::canonical(absolute.parent_path(), ec);
        if (ec) {
            return Deny(requested);
        }
        resolved = parent / leaf;
    }

    if (!IsWithinRoots(resolved)) {
        LogDebug(kLogComponent, "Denied '" + std::string(requested) +
                                    "' (resolved to " + resolved.string() + ")");
        return Deny(requested);
    }
    return Result<fs::path, ToolError>::Ok(std::move(resolved));
}

bool SandboxGuard::IsWithinRoots(const fs::path& canonical) const {
    return std::any_of(roots_.begin(), roots_.end(), [&](const fs::path& root) {
        return IsAncestorOrSelf(root, canonical);
    });
}

} // namespace mcp_sandbox
