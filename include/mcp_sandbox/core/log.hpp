#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace mcp_sandbox {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

/// Map an MCP (syslog) severity from logging/setLevel onto our levels:
/// notice folds into info; critical, alert and emergency into error.
std::optional<LogLevel> ParseSyslogLevel(std::string_view text);

/// Lower-case name of a level, the inverse of ParseLogLevel.
const char* LogLevelName(LogLevel level);

// Abstract log sink — implementations decide where/how to write.
// Sinks must never write to stdout: it carries protocol traffic.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Color console sink — colored, compact output to a stream (stderr).
// When use_color is false, writes "<ts> [LEVEL] [component] message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink — machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
};

// File sink — appends lines to a file it owns (--log-file). Plain lines
// carry no color; json selects the JsonSink line format.
class FileSink : public ILogSink {
public:
    FileSink(const std::string& path, bool json);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }

    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
    bool json_;
};

// Thread-safe logger that dispatches to a sink. The threshold can change
// at runtime (logging/setLevel).
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] LogLevel Level() const;

    void Log(LogLevel level, std::string_view component,
             std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger — set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace mcp_sandbox
