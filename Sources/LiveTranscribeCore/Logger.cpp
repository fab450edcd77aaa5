#include "Logger.hpp"

#include <cstdarg>
#include <cstdio>
#include <stdexcept>

#include "whisper.h"

extern "C" {
#include <libavutil/log.h>
}

namespace lt {

namespace {

std::string strip_newlines(const char* text) {
    std::string s = text ? text : "";
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

void whisper_log_callback(enum ggml_log_level level, const char* text, void* /*user_data*/) {
    std::string message = strip_newlines(text);
    if (message.empty()) return;

    LogLevel mapped = LogLevel::debug;
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: mapped = LogLevel::error;   break;
        case GGML_LOG_LEVEL_WARN:  mapped = LogLevel::warning; break;
        case GGML_LOG_LEVEL_INFO:  mapped = LogLevel::info;    break;
        default:                   mapped = LogLevel::debug;   break;
    }
    Logger::instance().log(mapped, "whisper", message);
}

void ffmpeg_log_callback(void* /*avcl*/, int level, const char* fmt, va_list args) {
    if (level > av_log_get_level()) return;

    char buf[1024];
    vsnprintf(buf, sizeof(buf), fmt, args);
    std::string message = strip_newlines(buf);
    if (message.empty()) return;

    LogLevel mapped = LogLevel::debug;
    if (level <= AV_LOG_ERROR) {
        mapped = LogLevel::error;
    } else if (level <= AV_LOG_WARNING) {
        mapped = LogLevel::warning;
    } else if (level <= AV_LOG_INFO) {
        mapped = LogLevel::info;
    }
    Logger::instance().log(mapped, "ffmpeg", message);
}

} // namespace

// ---------------------------------------------------------------------------
// Level names
// ---------------------------------------------------------------------------

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug:   return "DEBUG";
        case LogLevel::info:    return "INFO";
        case LogLevel::warning: return "WARN";
        case LogLevel::error:   return "ERROR";
    }
    return "UNKNOWN";
}

LogLevel level_from_string(const std::string& s) {
    if (s == "debug")   return LogLevel::debug;
    if (s == "info")    return LogLevel::info;
    if (s == "warning" || s == "warn") return LogLevel::warning;
    if (s == "error")   return LogLevel::error;
    throw std::invalid_argument("unknown log level '" + s + "'");
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------

Logger::Logger() : sink_(&Logger::stderr_sink) {}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::log(LogLevel level, const std::string& source, const std::string& message) {
    LogSink sink;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (level < level_) return;
        sink = sink_;
    }

    LogEntry entry{std::chrono::system_clock::now(), level, source, message};
    if (sink) sink(entry);
}

void Logger::set_sink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mu_);
    sink_ = sink ? std::move(sink) : LogSink(&Logger::stderr_sink);
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::capture_library_logs() {
    whisper_log_set(whisper_log_callback, nullptr);

    switch (level()) {
        case LogLevel::debug:   av_log_set_level(AV_LOG_VERBOSE); break;
        case LogLevel::info:    av_log_set_level(AV_LOG_INFO);    break;
        case LogLevel::warning: av_log_set_level(AV_LOG_WARNING); break;
        case LogLevel::error:   av_log_set_level(AV_LOG_ERROR);   break;
    }
    av_log_set_callback(ffmpeg_log_callback);
}

void Logger::stderr_sink(const LogEntry& entry) {
    fprintf(stderr, "[%s] %s: %s\n",
            entry.source.c_str(), level_to_string(entry.level), entry.message.c_str());
}

} // namespace lt
