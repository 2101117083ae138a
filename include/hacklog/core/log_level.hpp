#ifndef HACKLOG_LEVEL_HPP
#define HACKLOG_LEVEL_HPP

#include <string>
#include <cctype>

namespace hacklog {
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    /// Upper-case label used by the pretty formatter and diagnostics.
    inline const char *getLevelString(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::INFO: return "INFO";
            case LogLevel::WARN: return "WARN";
            case LogLevel::ERROR: return "ERROR";
            default: return "UNKNOWN";
        }
    }

    /// Lower-case wire name ("debug", "info", "warn", "error").
    inline const char *getLevelName(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "debug";
            case LogLevel::INFO: return "info";
            case LogLevel::WARN: return "warn";
            case LogLevel::ERROR: return "error";
            default: return "info";
        }
    }

    /// Map a free-form level string onto the four-value scale.
    /// Unknown names resolve to INFO.
    inline LogLevel normalizeLevelName(const std::string &raw) {
        size_t begin = 0;
        size_t end = raw.size();
        while (begin < end && std::isspace(static_cast<unsigned char>(raw[begin]))) ++begin;
        while (end > begin && std::isspace(static_cast<unsigned char>(raw[end - 1]))) --end;

        std::string v;
        v.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            v += static_cast<char>(std::tolower(static_cast<unsigned char>(raw[i])));
        }

        if (v == "debug") return LogLevel::DEBUG;
        if (v == "warn" || v == "warning") return LogLevel::WARN;
        if (v == "error" || v == "fatal" || v == "panic") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

    /// Pino numeric levels: 10 trace, 20 debug, 30 info, 40 warn, 50 error, 60 fatal.
    inline LogLevel normalizePinoLevel(double level) {
        if (level >= 50) return LogLevel::ERROR;
        if (level >= 40) return LogLevel::WARN;
        if (level >= 30) return LogLevel::INFO;
        return LogLevel::DEBUG;
    }
} // namespace hacklog

#endif // HACKLOG_LEVEL_HPP
