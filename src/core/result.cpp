#include <mcp_sandbox/core/result.hpp>

namespace mcp_sandbox {

ToolError ToolError::FromErrorCode(const std::error_code& ec,
                                   const std::string& action) {
    ToolErrorKind kind;
    if (ec == std::errc::no_such_file_or_directory) {
        kind = ToolErrorKind::NotFound;
    } else if (ec == std::errc::not_a_directory) {
        kind = ToolErrorKind::NotADirectory;
    } else if (ec == std::errc::file_too_large) {
        kind = ToolErrorKind::TooLarge;
    } else if (ec == std::errc::permission_denied ||
               ec == std::errc::operation_not_permitted) {
        // The OS refused inside an allowed root; still an access problem.
        kind = ToolErrorKind::AccessDenied;
    } else if (ec == std::errc::too_many_symbolic_link_levels) {
        // Tool I/O never follows a symlink at the leaf.
        kind = ToolErrorKind::AccessDenied;
    } else {
        kind = ToolErrorKind::IOFailure;
    }

    std::string message = action;
    if (ec) {
        message += ": " + ec.message();
    }
    return ToolError{kind, std::move(message)};
}

} // namespace mcp_sandbox
