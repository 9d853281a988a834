#include "airmesh/util/logger.hpp"

#include <algorithm>
#include <cctype>

namespace airmesh::util {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

std::string_view Logger::level_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "[TRACE]";
        case LogLevel::Debug: return "[DEBUG]";
        case LogLevel::Info: return "[INFO] ";
        case LogLevel::Warning: return "[WARN] ";
        case LogLevel::Error: return "[ERROR]";
        case LogLevel::Fatal: return "[FATAL]";
    }
    return "[?????]";
}

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "fatal") return LogLevel::Fatal;
    return std::nullopt;
}

} // namespace airmesh::util
