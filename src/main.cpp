#include <mcp_sandbox/config/config_loader.hpp>
#include <mcp_sandbox/core/log.hpp>
#include <mcp_sandbox/core/terminal.hpp>
#include <mcp_sandbox/core/types.hpp>
#include <mcp_sandbox/core/version.hpp>
#include <mcp_sandbox/mcp/mcp_server.hpp>
#include <mcp_sandbox/mcp/mcp_tool_handlers.hpp>
#include <mcp_sandbox/sandbox/sandbox_guard.hpp>

#include <chrono>
#include <exception>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess  = 0;
constexpr int kExitConfig   = 2;
constexpr int kExitInternal = 99;

constexpr const char* kLogComponent = "main";

// Startup errors happen before (or instead of) the logger; print directly.
void PrintError(const mcp_sandbox::Error& error) {
    using namespace mcp_sandbox;
    if (UseColorForStderr()) {
        std::cerr << ansi::kRed << "Error: " << ansi::kReset << error.ToString() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Install the global logger. Returns false when the log file cannot be
// opened.
bool InitLogging(const mcp_sandbox::AppConfig& config) {
    using namespace mcp_sandbox;
    const bool json = config.log_format == LogFormat::Json;

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file, json);
        if (!sink->IsOpen()) {
            return false;
        }
        InitGlobalLogger(std::move(sink), config.log_level);
        return true;
    }
    if (json) {
        InitGlobalLogger(std::make_unique<JsonSink>(std::cerr), config.log_level);
    } else {
        InitGlobalLogger(std::make_unique<ColorConsoleSink>(UseColorForStderr()),
                         config.log_level);
    }
    return true;
}

int Run(int argc, const char* argv[]) {
    using namespace mcp_sandbox;

    // Step 1: command line (exits on --help / --version).
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error());
        return cli_result.Error().ExitCode();
    }
    const auto& cli = cli_result.Value();

    // Step 2: optional YAML file, overridden by the command line.
    AppConfig base;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error());
            return yaml_result.Error().ExitCode();
        }
        base = std::move(yaml_result).Value();
    }
    auto config = MergeConfigs(base, cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error());
        return valid.Error().ExitCode();
    }

    // Step 3: logging. Never on stdout; stdout belongs to the protocol.
    if (!InitLogging(config)) {
        PrintError(Error{"Logging", *config.log_file, "Cannot open log file",
                         ErrorCategory::Config});
        return kExitConfig;
    }
    LogInfo(kLogComponent, std::string("mcp-sandbox ") + kVersion + " starting");

    // Step 4: sandbox roots.
    auto guard_result = SandboxGuard::Create(config.allowed_paths);
    if (guard_result.IsErr()) {
        LogError(kLogComponent, guard_result.Error().ToString());
        PrintError(guard_result.Error());
        return guard_result.Error().ExitCode();
    }
    const auto& guard = guard_result.Value();

    FileToolOptions options;
    options.max_file_size = config.max_file_size;
    options.io_timeout = std::chrono::seconds(config.io_timeout_seconds);
    const auto size_text =
        ByteSize::FromBytes(config.max_file_size)
            .Map([](const ByteSize& size) { return size.ToString(); })
            .ValueOr(std::to_string(config.max_file_size) + " bytes");
    LogInfo(kLogComponent, "Max file size: " + size_text + ", I/O timeout: " +
                               std::to_string(config.io_timeout_seconds) + "s");

    // Step 5: tools.
    ToolRegistry registry;
    auto registered = RegisterSandboxTools(registry, guard, options);
    if (registered.IsErr()) {
        LogError(kLogComponent, registered.Error().ToString());
        return registered.Error().ExitCode();
    }

    // Step 6: serve stdin/stdout until end of stream.
    McpServer server(std::move(registry),
                     ServerInfo{config.server_name, kVersion, config.instructions});
    server.Run();

    LogInfo(kLogComponent, "Exiting");
    return kExitSuccess;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    try {
        return Run(argc, argv);
    } catch (const std::exception& e) {
        mcp_sandbox::LogError(kLogComponent, std::string("Fatal: ") + e.what());
        std::cerr << "Fatal: " << e.what() << "\n";
        return kExitInternal;
    }
}
