#pragma once

namespace mcp_sandbox {

// Escape sequences for the coloured console sink and startup errors.
namespace ansi {
constexpr const char* kReset  = "\033[0m";
constexpr const char* kDim    = "\033[90m";
constexpr const char* kRed    = "\033[1;31m";
constexpr const char* kYellow = "\033[33m";
constexpr const char* kCyan   = "\033[36m";
} // namespace ansi

bool IsTerminal(int fd);

/// True when the environment asks for plain output: NO_COLOR set to a
/// non-empty value (https://no-color.org/) or TERM=dumb.
bool ColorDisabledByEnvironment();

/// Colour on `fd` needs a terminal and an environment that allows it.
bool UseColorFor(int fd);

/// Diagnostics and the console log sink both go to stderr; stdout carries
/// protocol frames and is never coloured.
bool UseColorForStderr();

} // namespace mcp_sandbox
