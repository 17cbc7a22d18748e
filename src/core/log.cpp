#include <mcp_sandbox/core/log.hpp>
#include <mcp_sandbox/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mcp_sandbox {

namespace {

struct LevelStyle {
    const char* name;    // lower case, as accepted on the command line
    const char* tag;     // upper case, used in plain and JSON lines
    const char* padded;  // fixed width for the colored console
    const char* color;
};

const LevelStyle& StyleOf(LogLevel level) {
    static const LevelStyle kStyles[] = {
        {"debug", "DEBUG", "DEBUG", ansi::kDim},
        {"info",  "INFO",  "INFO ", ansi::kCyan},
        {"warn",  "WARN",  "WARN ", ansi::kYellow},
        {"error", "ERROR", "ERROR", ansi::kRed},
    };
    const auto index = static_cast<size_t>(level);
    return kStyles[index < 4 ? index : 1];
}

std::string ToLower(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

// UTC with milliseconds ("2024-01-31T12:00:00.123Z") for files and JSON,
// local wall-clock time ("12:00:00") for an interactive terminal.
std::string Timestamp(bool iso_utc) {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);

    std::tm parts{};
    if (iso_utc) {
        gmtime_r(&seconds, &parts);
    } else {
        localtime_r(&seconds, &parts);
    }

    std::ostringstream oss;
    if (!iso_utc) {
        oss << std::put_time(&parts, "%H:%M:%S");
        return oss.str();
    }
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    oss << std::put_time(&parts, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

void WritePlain(std::ostream& out, LogLevel level, std::string_view component,
                std::string_view message) {
    out << Timestamp(true) << " [" << StyleOf(level).tag << "] [" << component
        << "] " << message << '\n';
}

void WriteJson(std::ostream& out, LogLevel level, std::string_view component,
               std::string_view message) {
    const nlohmann::json line = {
        {"ts", Timestamp(true)},
        {"level", StyleOf(level).tag},
        {"component", std::string(component)},
        {"message", std::string(message)},
    };
    // Log text may carry arbitrary bytes from file names.
    out << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
        << '\n';
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    const auto lower = ToLower(text);
    if (lower == "warning") return LogLevel::Warn;
    for (auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        if (lower == StyleOf(level).name) return level;
    }
    return std::nullopt;
}

std::optional<LogLevel> ParseSyslogLevel(std::string_view text) {
    if (text == "debug") return LogLevel::Debug;
    if (text == "info" || text == "notice") return LogLevel::Info;
    if (text == "warning") return LogLevel::Warn;
    if (text == "error" || text == "critical" || text == "alert" ||
        text == "emergency") {
        return LogLevel::Error;
    }
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    return StyleOf(level).name;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        WritePlain(out_, level, component, message);
        out_.flush();
        return;
    }

    const auto& style = StyleOf(level);
    out_ << ansi::kDim << Timestamp(false) << ansi::kReset << ' '
         << style.color << style.padded << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << style.color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
    out_.flush();
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    WriteJson(out_, level, component, message);
    out_.flush();
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path, bool json)
    : file_(path, std::ios::out | std::ios::app), json_(json) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    if (json_) {
        WriteJson(file_, level, component, message);
    } else {
        WritePlain(file_, level, component, message);
    }
    file_.flush();
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

LogLevel Logger::Level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_level_;
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < min_level_) return;
    sink_->Write(level, component, message);
}

void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Debug, component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Info, component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Warn, component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Log(LogLevel::Error, component, message);
}

} // namespace mcp_sandbox
