#ifndef HACKLOG_LOG_SESSION_HPP
#define HACKLOG_LOG_SESSION_HPP

#include "log_source.hpp"
#include "../core/diagnostics.hpp"
#include "../core/log_stream_event.hpp"
#include "../stream_manager.hpp"
#include <exception>
#include <string>
#include <utility>

namespace hacklog {

    /// Wraps one source run into a protocol session: exactly one `start`,
    /// then `log` events, then exactly one `end`, with an `error` event
    /// before the `end` on connectivity failures.
    class LogSession : public ISourceListener {
    public:
        LogSession(LogStreamContext context, StreamManager &manager)
            : m_context(std::move(context))
            , m_manager(manager)
            , m_started(false)
            , m_errored(false)
            , m_ended(false)
            , m_entries(0) {}

        /// Run @p source to completion and return the process exit code.
        int run(ILogSource &source, StopController &stop) {
            SourceResult result;
            try {
                result = source.run(*this, stop);
            } catch (const std::exception &e) {
                Diagnostics::global().error(std::string("log source failed: ") + e.what());
                onError(e.what());
                result = SourceResult(1, "error");
            }
            if (result.exitCode != 0 && result.reason.empty()) result.reason = "error";
            finish(result.reason);
            return result.exitCode;
        }

        void onStart() override {
            ensureStarted();
        }

        void onEntry(const LogEntry &entry) override {
            ensureStarted();
            ++m_entries;
            m_manager.dispatch(makeLogEvent(m_context, entry));
        }

        void onError(const std::string &message) override {
            ensureStarted();
            m_errored = true;
            m_manager.dispatch(makeErrorEvent(m_context, message));
        }

        const LogStreamContext &context() const { return m_context; }
        size_t entryCount() const { return m_entries; }
        bool errored() const { return m_errored; }

    private:
        void ensureStarted() {
            if (m_started) return;
            m_started = true;
            m_manager.dispatch(makeStartEvent(m_context));
        }

        void finish(const std::string &reason) {
            if (m_ended) return;
            ensureStarted();
            m_ended = true;
            m_manager.dispatch(makeEndEvent(m_context, reason));
        }

        LogStreamContext m_context;
        StreamManager &m_manager;
        bool m_started;
        bool m_errored;
        bool m_ended;
        size_t m_entries;
    };

} // namespace hacklog

#endif // HACKLOG_LOG_SESSION_HPP
