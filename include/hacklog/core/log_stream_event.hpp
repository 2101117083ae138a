#ifndef HACKLOG_STREAM_EVENT_HPP
#define HACKLOG_STREAM_EVENT_HPP

#include "log_entry.hpp"
#include "time_util.hpp"
#include <string>
#include <vector>

namespace hacklog {
    enum class EventType {
        START,
        LOG,
        HEARTBEAT,
        ERROR,
        END
    };

    inline const char *getEventTypeName(EventType type) {
        switch (type) {
            case EventType::START: return "start";
            case EventType::LOG: return "log";
            case EventType::HEARTBEAT: return "heartbeat";
            case EventType::ERROR: return "error";
            case EventType::END: return "end";
            default: return "log";
        }
    }

    /// Per-session context copied into every event.  Empty strings and an
    /// empty service list are treated as absent.
    struct LogStreamContext {
        Backend backend;
        std::string project;
        std::string branch;
        std::vector<std::string> services;
        bool follow;
        std::string since;
        std::string until;

        LogStreamContext() : backend(Backend::COMPOSE), follow(false) {}
    };

    /// One NDJSON record of a log session.
    ///
    /// The payload members are tied to the tag: `entry` is only set for LOG,
    /// `message` only for ERROR and `reason` only for END.  Build events with
    /// the make*Event functions below rather than by hand.
    class LogStreamEvent {
    public:
        EventType type() const { return m_type; }
        const std::string &ts() const { return m_ts; }
        const LogStreamContext &context() const { return m_context; }
        const LogEntry &entry() const { return m_entry; }
        const std::string &message() const { return m_message; }
        const std::string &reason() const { return m_reason; }

        friend LogStreamEvent makeStartEvent(const LogStreamContext &context);
        friend LogStreamEvent makeLogEvent(const LogStreamContext &context, const LogEntry &entry);
        friend LogStreamEvent makeHeartbeatEvent(const LogStreamContext &context);
        friend LogStreamEvent makeErrorEvent(const LogStreamContext &context, const std::string &message);
        friend LogStreamEvent makeEndEvent(const LogStreamContext &context, const std::string &reason);

    private:
        LogStreamEvent(EventType type, std::string ts, const LogStreamContext &context)
            : m_type(type), m_ts(std::move(ts)), m_context(context) {}

        EventType m_type;
        std::string m_ts;
        LogStreamContext m_context;
        LogEntry m_entry;
        std::string m_message;
        std::string m_reason;
    };

    inline LogStreamEvent makeStartEvent(const LogStreamContext &context) {
        return LogStreamEvent(EventType::START, nowIso(), context);
    }

    /// The event time mirrors the entry's source timestamp when known so that
    /// replay order reflects when the line was produced, not when it arrived.
    inline LogStreamEvent makeLogEvent(const LogStreamContext &context, const LogEntry &entry) {
        LogStreamEvent event(EventType::LOG, entry.timestamp.empty() ? nowIso() : entry.timestamp, context);
        event.m_entry = entry;
        return event;
    }

    inline LogStreamEvent makeHeartbeatEvent(const LogStreamContext &context) {
        return LogStreamEvent(EventType::HEARTBEAT, nowIso(), context);
    }

    inline LogStreamEvent makeErrorEvent(const LogStreamContext &context, const std::string &message) {
        LogStreamEvent event(EventType::ERROR, nowIso(), context);
        event.m_message = message;
        return event;
    }

    inline LogStreamEvent makeEndEvent(const LogStreamContext &context, const std::string &reason) {
        LogStreamEvent event(EventType::END, nowIso(), context);
        event.m_reason = reason;
        return event;
    }
} // namespace hacklog

#endif // HACKLOG_STREAM_EVENT_HPP
