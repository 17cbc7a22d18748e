#include <mcp_sandbox/core/terminal.hpp>

#include <cstdlib>
#include <cstring>

#include <unistd.h>

namespace mcp_sandbox {

bool IsTerminal(int fd) {
    return fd >= 0 && ::isatty(fd) == 1;
}

bool ColorDisabledByEnvironment() {
    const char* no_color = std::getenv("NO_COLOR");
    if (no_color != nullptr && no_color[0] != '\0') {
        return true;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::strcmp(term, "dumb") == 0;
}

bool UseColorFor(int fd) {
    return IsTerminal(fd) && !ColorDisabledByEnvironment();
}

bool UseColorForStderr() {
    return UseColorFor(STDERR_FILENO);
}

} // namespace mcp_sandbox
