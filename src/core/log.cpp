#include <querygraph/core/log.hpp>
#include <querygraph/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace querygraph {

namespace {

std::tm ToTm(std::chrono::system_clock::time_point time, bool utc) {
    const auto seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    if (utc) gmtime_s(&tm, &seconds); else localtime_s(&tm, &seconds);
#else
    if (utc) gmtime_r(&seconds, &tm); else localtime_r(&seconds, &tm);
#endif
    return tm;
}

std::string UtcTimestamp(std::chrono::system_clock::time_point time) {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            time.time_since_epoch()).count() % 1000;
    const auto tm = ToTm(time, true);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string LocalClock(std::chrono::system_clock::time_point time) {
    const auto tm = ToTm(time, false);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%H:%M:%S");
    return oss.str();
}

const char* LevelStyle(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return style::kMuted;
        case LogLevel::Info:  return style::kNotice;
        case LogLevel::Warn:  return style::kWarning;
        case LogLevel::Error: return style::kFailure;
    }
    return style::kReset;
}

class NullSink : public ILogSink {
public:
    void Write(const LogRecord&) override {}
};

std::unique_ptr<Logger>& GlobalLoggerSlot() {
    static auto slot = std::make_unique<Logger>(std::make_unique<NullSink>(),
                                                LogLevel::Error);
    return slot;
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string name(text);
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "debug") return LogLevel::Debug;
    if (name == "info") return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return std::nullopt;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::string FormatPlainRecord(const LogRecord& record) {
    std::string line = UtcTimestamp(record.time);
    line += " [";
    line += LogLevelName(record.level);
    line += "] [";
    line += record.component;
    line += "] ";
    line += record.message;
    return line;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(const LogRecord& record) {
    if (!use_color_) {
        out_ << FormatPlainRecord(record) << '\n';
        return;
    }

    const char* level_style = LevelStyle(record.level);
    std::string tag = LogLevelName(record.level);
    tag.resize(5, ' ');

    out_ << style::kMuted << LocalClock(record.time) << style::kReset << ' '
         << level_style << tag << style::kReset << ' '
         << style::kMuted << '[' << record.component << ']' << style::kReset << ' ';
    // Errors stand out in full; other levels only color the tag.
    if (record.level == LogLevel::Error) {
        out_ << level_style << record.message << style::kReset;
    } else {
        out_ << record.message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(const LogRecord& record) {
    const nlohmann::json line = {
        {"ts", UtcTimestamp(record.time)},
        {"level", LogLevelName(record.level)},
        {"component", std::string(record.component)},
        {"message", std::string(record.message)},
    };
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path) : out_(path, std::ios::app) {}

void FileSink::Write(const LogRecord& record) {
    if (!out_.is_open()) {
        return;
    }
    out_ << FormatPlainRecord(record) << '\n';
    out_.flush();
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

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= min_level_;
}

void Logger::Log(LogLevel level, std::string_view component, std::string_view message) {
    const LogRecord record{level, component, message, std::chrono::system_clock::now()};
    std::lock_guard<std::mutex> lock(mutex_);
    if (level >= min_level_) {
        sink_->Write(record);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerSlot() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerSlot();
}

bool LogEnabled(LogLevel level) {
    return GlobalLogger().IsEnabled(level);
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

} // namespace querygraph
