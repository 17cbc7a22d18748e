#pragma once

#include <mcp_sandbox/core/result.hpp>

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace mcp_sandbox {

// ---------------------------------------------------------------------------
// SandboxGuard — confines filesystem tools to a set of allowed root
// directories.
//
// Roots are canonicalized once at construction. Authorize() canonicalizes
// the requested path on every call (resolving ".", ".." and symlinks) and
// admits it only if it equals a root or lies below one. A path whose final
// component does not exist yet is admitted when its parent resolves inside
// a root, so tools can create files. Every refusal, including a path that
// cannot be resolved, is reported as AccessDenied with the same message so
// nothing about the filesystem outside the roots leaks.
//
// The returned path is the one callers must open.
// ---------------------------------------------------------------------------
class SandboxGuard {
public:
    /// Build a guard from configured roots. Missing roots and roots that are
    /// not directories are skipped with a warning; if none remain the
    /// result is an error.
    static Result<SandboxGuard, Error> Create(const std::vector<std::string>& roots);

    [[nodiscard]] Result<std::filesystem::path, ToolError> Authorize(
        std::string_view requested) const;

    [[nodiscard]] const std::vector<std::filesystem::path>& Roots() const noexcept {
        return roots_;
    }

    /// True if `canonical` equals a root or has one as an ancestor.
    /// Component-wise: "/data/ab" is not inside "/data/a".
    [[nodiscard]] bool IsWithinRoots(const std::filesystem::path& canonical) const;

private:
    explicit SandboxGuard(std::vector<std::filesystem::path> roots)
        : roots_(std::move(roots)) {}

    std::vector<std::filesystem::path> roots_;
};

} // namespace mcp_sandbox
