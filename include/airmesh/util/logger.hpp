#pragma once

#include <string>
#include <string_view>
#include <format>
#include <functional>
#include <iostream>
#include <mutex>
#include <chrono>
#include <optional>

namespace airmesh::util {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Fatal
};

// Parses "trace", "debug", "info", "warning"/"warn", "error", "fatal"
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    // Receives fully formatted lines; replaces the stderr writer when set
    using Sink = std::function<void(LogLevel, std::string_view)>;

    static Logger& instance();

    void set_level(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }

    void set_sink(Sink sink) {
        std::lock_guard lock(mutex_);
        sink_ = std::move(sink);
    }

    void reset_sink() { set_sink(nullptr); }

    template<typename... Args>
    void log(LogLevel level, std::format_string<Args...> fmt, Args&&... args) {
        if (level < level_) return;

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf;
        localtime_r(&time, &tm_buf);

        std::string line = std::format("[{:04d}-{:02d}-{:02d} {:02d}:{:02d}:{:02d}.{:03d}] {} ",
            tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
            tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
            static_cast<int>(ms.count()), level_string(level));
        line += std::format(fmt, std::forward<Args>(args)...);

        std::lock_guard lock(mutex_);
        if (sink_) {
            sink_(level, line);
            return;
        }
        std::cerr << line << std::endl;
    }

    template<typename... Args>
    void trace(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warning(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Warning, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void fatal(std::format_string<Args...> fmt, Args&&... args) {
        log(LogLevel::Fatal, fmt, std::forward<Args>(args)...);
    }

private:
    Logger() = default;

    static std::string_view level_string(LogLevel level);

    LogLevel level_ = LogLevel::Info;
    Sink sink_;
    std::mutex mutex_;
};

// Global logging macros
#define LOG_TRACE(...) airmesh::util::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) airmesh::util::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) airmesh::util::Logger::instance().info(__VA_ARGS__)
#define LOG_WARNING(...) airmesh::util::Logger::instance().warning(__VA_ARGS__)
#define LOG_ERROR(...) airmesh::util::Logger::instance().error(__VA_ARGS__)
#define LOG_FATAL(...) airmesh::util::Logger::instance().fatal(__VA_ARGS__)

} // namespace airmesh::util
