#pragma once

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace querygraph {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "debug", "info", "warn"/"warning", "error" (case-insensitive).
std::optional<LogLevel> ParseLogLevel(std::string_view text);

const char* LogLevelName(LogLevel level);

// One log event as handed to a sink. The views are only valid for the
// duration of ILogSink::Write.
struct LogRecord {
    LogLevel level = LogLevel::Info;
    std::string_view component; // "graph", "from", "session", ...
    std::string_view message;
    std::chrono::system_clock::time_point time;
};

// "2024-05-01T12:30:00.123Z [INFO] [from] message", without trailing newline.
std::string FormatPlainRecord(const LogRecord& record);

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogRecord& record) = 0;
};

// Console sink for interactive use: "HH:MM:SS LEVEL [component] message"
// with escape sequences, or the plain format when color is off.
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(const LogRecord& record) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// One JSON object per line: {"ts", "level", "component", "message"}.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(const LogRecord& record) override;
private:
    std::ostream& out_;
};

// Appends plain lines to `path`; check IsOpen() after construction.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);
    [[nodiscard]] bool IsOpen() const { return out_.is_open(); }
    void Write(const LogRecord& record) override;
private:
    std::ofstream out_;
};

// Serializes writes to a single sink and drops records below the minimum
// level.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Log(LogLevel level, std::string_view component, std::string_view message);

private:
    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Process-wide logger. Logging is a no-op until InitGlobalLogger is called.
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

Logger& GlobalLogger();

/// True if the global logger would keep a record at `level`. Use it to skip
/// building messages that would be dropped.
bool LogEnabled(LogLevel level);

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace querygraph
