#include <mcp_sandbox/config/config_loader.hpp>

#include <mcp_sandbox/core/types.hpp>
#include <mcp_sandbox/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace mcp_sandbox {

namespace {

Error MakeConfigError(const std::string& message, const std::string& target = "") {
    return Error{"ConfigLoader", target, message, ErrorCategory::Config};
}

Result<std::uint64_t, Error> ParseSize(const std::string& text,
                                       const std::string& what) {
    auto bytes = ByteSize::Parse(text).Map(
        [](const ByteSize& size) { return size.Bytes(); });
    if (bytes.IsErr()) {
        return Result<std::uint64_t, Error>::Err(
            MakeConfigError("Invalid " + what + ": " + bytes.Error()));
    }
    return Result<std::uint64_t, Error>::Ok(bytes.Value());
}

Result<AppConfig, Error> ParseYamlRoot(const YAML::Node& root,
                                       const std::string& file) {
    AppConfig config;
    if (!root || root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }
    if (!root.IsMap()) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Top level of the config file must be a mapping", file));
    }

    // -- Sandbox --
    if (const auto paths = root["allowed_paths"]) {
        if (paths.IsSequence()) {
            for (const auto& path : paths) {
                config.allowed_paths.push_back(path.as<std::string>());
            }
        } else if (paths.IsScalar()) {
            config.allowed_paths.push_back(paths.as<std::string>());
        } else {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("'allowed_paths' must be a list of paths", file));
        }
    }
    if (root["max_file_size"]) {
        auto size = ParseSize(root["max_file_size"].as<std::string>(), "max_file_size");
        if (size.IsErr()) {
            auto error = std::move(size).Error();
            error.target = file;
            return Result<AppConfig, Error>::Err(std::move(error));
        }
        config.max_file_size = size.Value();
    }
    if (root["io_timeout"]) {
        config.io_timeout_seconds = root["io_timeout"].as<int>();
    }

    // -- Logging --
    if (root["log_level"]) {
        auto text = root["log_level"].as<std::string>();
        auto level = ParseLogLevel(text);
        if (!level) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid log_level: " + text, file));
        }
        config.log_level = *level;
    }
    if (root["log_format"]) {
        auto text = root["log_format"].as<std::string>();
        auto format = ParseLogFormat(text);
        if (!format) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Invalid log_format: " + text, file));
        }
        config.log_format = *format;
    }
    if (root["log_file"]) {
        config.log_file = root["log_file"].as<std::string>();
    }

    // -- Server identity --
    if (root["server_name"]) {
        config.server_name = root["server_name"].as<std::string>();
    }
    if (root["instructions"]) {
        config.instructions = root["instructions"].as<std::string>();
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

} // anonymous namespace

std::optional<LogFormat> ParseLogFormat(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "text") return LogFormat::Text;
    if (lower == "json") return LogFormat::Json;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    const std::string file(file_path);
    try {
        return ParseYamlRoot(YAML::LoadFile(file), file);
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what()),
                            file));
    }
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-sandbox", kVersion);
    program.add_description(
        "MCP server over stdio exposing file tools confined to allowed directories.");

    program.add_argument("--allowed-paths")
        .help("Directories the file tools may access")
        .nargs(argparse::nargs_pattern::at_least_one);
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--max-file-size")
        .help("Largest file read or written, e.g. 1048576, 512K, 10MB (default: 10MB)");
    program.add_argument("--io-timeout")
        .help("Seconds a file operation may take (default: 30)")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error (default: info)");
    program.add_argument("--log-format")
        .help("text or json (default: text)");
    program.add_argument("--log-file")
        .help("Append log lines to this file instead of stderr");
    program.add_argument("--server-name")
        .help("Name reported in serverInfo (default: mcp-sandbox)");

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliConfig config;

    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--allowed-paths")) {
        config.allowed_paths = *val;
    }
    if (auto val = program.present("--max-file-size")) {
        auto size = ParseSize(*val, "--max-file-size");
        if (size.IsErr()) {
            return Result<CliConfig, Error>::Err(std::move(size).Error());
        }
        config.max_file_size = size.Value();
    }
    if (auto val = program.present<int>("--io-timeout")) {
        config.io_timeout_seconds = *val;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliConfig, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        config.log_level = *level;
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseLogFormat(*val);
        if (!format) {
            return Result<CliConfig, Error>::Err(
                MakeConfigError("Invalid --log-format: " + *val));
        }
        config.log_format = *format;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    if (auto val = program.present("--server-name")) {
        config.server_name = *val;
    }

    return Result<CliConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliConfig& cli_overrides) {
    AppConfig merged = yaml_base;

    if (!cli_overrides.allowed_paths.empty()) {
        merged.allowed_paths = cli_overrides.allowed_paths;
    }
    if (cli_overrides.max_file_size) {
        merged.max_file_size = *cli_overrides.max_file_size;
    }
    if (cli_overrides.io_timeout_seconds) {
        merged.io_timeout_seconds = *cli_overrides.io_timeout_seconds;
    }
    if (cli_overrides.log_level) {
        merged.log_level = *cli_overrides.log_level;
    }
    if (cli_overrides.log_format) {
        merged.log_format = *cli_overrides.log_format;
    }
    if (cli_overrides.log_file) {
        merged.log_file = cli_overrides.log_file;
    }
    if (cli_overrides.server_name) {
        merged.server_name = *cli_overrides.server_name;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.allowed_paths.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "At least one allowed path is required (--allowed-paths or "
            "allowed_paths in the config file)"));
    }
    if (config.max_file_size == 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_file_size must be positive"));
    }
    if (config.io_timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("I/O timeout must be positive, got " +
                            std::to_string(config.io_timeout_seconds)));
    }
    if (config.server_name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("server_name must not be empty"));
    }
    return Result<void, Error>::Ok();
}

} // namespace mcp_sandbox
