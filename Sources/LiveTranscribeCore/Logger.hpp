#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

namespace lt {

enum class LogLevel {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

const char* level_to_string(LogLevel level);

/// Parse "debug" / "info" / "warning" / "error".  Throws std::invalid_argument.
LogLevel level_from_string(const std::string& s);

struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel    level;
    std::string source;     // component name, e.g. "ModelManager"
    std::string message;
};

using LogSink = std::function<void(const LogEntry&)>;

/// Process-wide structured logger.  Entries below the minimum level are
/// dropped before reaching the sink.  The default sink writes to stderr.
class Logger {
public:
    static Logger& instance();

    void log(LogLevel level, const std::string& source, const std::string& message);

    void debug(const std::string& source, const std::string& message)   { log(LogLevel::debug, source, message); }
    void info(const std::string& source, const std::string& message)    { log(LogLevel::info, source, message); }
    void warn(const std::string& source, const std::string& message)    { log(LogLevel::warning, source, message); }
    void error(const std::string& source, const std::string& message)   { log(LogLevel::error, source, message); }

    /// Replace the sink.  Passing nullptr restores the stderr sink.
    void set_sink(LogSink sink);

    void set_level(LogLevel level);
    LogLevel level() const;

    /// Route whisper.cpp and FFmpeg diagnostics into this logger.
    void capture_library_logs();

private:
    Logger();

    static void stderr_sink(const LogEntry& entry);

    mutable std::mutex  mu_;
    LogSink             sink_;
    LogLevel            level_ = LogLevel::info;
};

} // namespace lt
