#ifndef HACKLOG_COLLECTOR_SINK_HPP
#define HACKLOG_COLLECTOR_SINK_HPP

#include "sink_interface.hpp"
#include "../core/stop_controller.hpp"
#include "../formatter/json_formatter.hpp"
#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hacklog {

    /// Limits for CollectorSink.
    ///
    /// @code
    ///   CollectorOptions opts;
    ///   opts.setMaxEvents(50).setMaxMs(2000);
    /// @endcode
    struct CollectorOptions {
        size_t maxEvents;
        int64_t maxMs;

        CollectorOptions()
            : maxEvents(200)
            , maxMs(5000) {}

        CollectorOptions &setMaxEvents(size_t n) {
            maxEvents = n;
            return *this;
        }
        CollectorOptions &setMaxMs(int64_t ms) {
            maxMs = ms;
            return *this;
        }
    };

    /// Gathers a bounded window of a session in memory for automation
    /// callers that want one result instead of a stream.
    ///
    /// Reaching maxEvents requests a stop with reason `max_events`; the
    /// maxMs deadline requests `timeout`.  Events received after any stop
    /// request are ignored, everything before it is kept.
    class CollectorSink : public ISink {
    public:
        CollectorSink(StopController &stop, CollectorOptions opts = CollectorOptions())
            : m_stop(stop)
            , m_opts(opts)
            , m_startMs(nowMs()) {
            if (m_opts.maxMs > 0) m_stop.setDeadlineAfter(m_opts.maxMs, "timeout");
        }

        void write(const LogStreamEvent &event) override {
            if (m_stop.stopRequested()) return;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_events.push_back(eventToJson(event));
                if (m_opts.maxEvents == 0 || m_events.size() < m_opts.maxEvents) return;
            }
            m_stop.requestStop("max_events");
        }

        size_t count() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_events.size();
        }

        std::vector<nlohmann::ordered_json> events() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_events;
        }

        /// `eof` unless a stop was requested.
        std::string stopReason() const {
            std::string reason = m_stop.reason();
            return reason.empty() ? "eof" : reason;
        }

        /// {events, count, stop_reason, duration_ms, exit_code}
        nlohmann::ordered_json summary(int exitCode) const {
            nlohmann::ordered_json j;
            nlohmann::ordered_json list = nlohmann::ordered_json::array();
            for (const auto &e : events()) list.push_back(e);
            j["events"] = list;
            j["count"] = list.size();
            j["stop_reason"] = stopReason();
            j["duration_ms"] = nowMs() - m_startMs;
            j["exit_code"] = exitCode;
            return j;
        }

    private:
        StopController &m_stop;
        CollectorOptions m_opts;
        int64_t m_startMs;
        mutable std::mutex m_mutex;
        std::vector<nlohmann::ordered_json> m_events;
    };

} // namespace hacklog

#endif // HACKLOG_COLLECTOR_SINK_HPP
