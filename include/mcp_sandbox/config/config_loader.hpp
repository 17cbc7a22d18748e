#pragma once

#include <mcp_sandbox/config/app_config.hpp>
#include <mcp_sandbox/core/result.hpp>

#include <string>
#include <string_view>

namespace mcp_sandbox {

// Parse a YAML config file into an AppConfig. Keys that are absent keep
// their defaults.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse CLI arguments. --help and --version print and exit the process.
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge: values set on the command line replace those from the file.
// A non-empty --allowed-paths replaces the whole YAML list.
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliConfig& cli_overrides);

// Validate that required fields are present and values are sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

// "text" or "json".
std::optional<LogFormat> ParseLogFormat(std::string_view text);

} // namespace mcp_sandbox
