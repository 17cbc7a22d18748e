#pragma once

#include <mcp_sandbox/core/log.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mcp_sandbox {

enum class LogFormat { Text, Json };

struct AppConfig {
    std::vector<std::string> allowed_paths;
    std::uint64_t max_file_size = 10ULL * 1024 * 1024;
    int io_timeout_seconds = 30;
    LogLevel log_level = LogLevel::Info;
    LogFormat log_format = LogFormat::Text;
    std::optional<std::string> log_file;
    std::string server_name = "mcp-sandbox";
    std::optional<std::string> instructions; // sent back from initialize
};

// Values given on the command line. Unset fields leave the YAML (or
// default) value in place when merged.
struct CliConfig {
    std::optional<std::string> config_path;
    std::vector<std::string> allowed_paths;
    std::optional<std::uint64_t> max_file_size;
    std::optional<int> io_timeout_seconds;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
    std::optional<std::string> server_name;
};

} // namespace mcp_sandbox
