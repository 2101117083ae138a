#ifndef HACKLOG_ENTRY_HPP
#define HACKLOG_ENTRY_HPP

#include "log_level.hpp"
#include <string>
#include <map>

namespace hacklog {
    enum class Backend {
        COMPOSE,
        LOKI
    };

    inline const char *getBackendName(Backend backend) {
        return backend == Backend::LOKI ? "loki" : "compose";
    }

    enum class StreamKind {
        NONE,
        STDOUT,
        STDERR
    };

    inline const char *getStreamName(StreamKind stream) {
        switch (stream) {
            case StreamKind::STDOUT: return "stdout";
            case StreamKind::STDERR: return "stderr";
            default: return "";
        }
    }

    /// Canonical log record produced by both backends.
    ///
    /// `message` and `raw` are always set.  Every other member is best-effort:
    /// empty strings and empty maps mean "absent" and are omitted on the wire,
    /// and `level` is meaningful only when `hasLevel` is true.
    struct LogEntry {
        Backend source;
        std::string message;
        std::string raw;
        StreamKind stream;
        std::string project;
        std::string service;
        std::string instance;
        std::map<std::string, std::string> labels;
        std::string timestamp;
        std::string timestampNs;
        bool hasLevel;
        LogLevel level;
        std::map<std::string, std::string> fields;

        LogEntry()
            : source(Backend::COMPOSE)
            , stream(StreamKind::NONE)
            , hasLevel(false)
            , level(LogLevel::INFO) {}

        /// Level used for rendering and filtering; INFO when none was inferred.
        LogLevel effectiveLevel() const {
            return hasLevel ? level : LogLevel::INFO;
        }
    };
} // namespace hacklog

#endif // HACKLOG_ENTRY_HPP
