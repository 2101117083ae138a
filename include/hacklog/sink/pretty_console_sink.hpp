#ifndef HACKLOG_PRETTY_CONSOLE_SINK_HPP
#define HACKLOG_PRETTY_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../core/terminal.hpp"
#include "../formatter/pretty_formatter.hpp"
#include "../transport/stdout_transport.hpp"
#include <memory>

namespace hacklog {
    /// Human-readable console output.
    ///
    /// Compose stderr entries go to stderr and everything else to stdout;
    /// each stream gets its own color decision.  Lifecycle events print
    /// nothing, failures are reported through Diagnostics instead.
    class PrettyConsoleSink : public ISink {
    public:
        PrettyConsoleSink()
            : m_outFormatter(detectColorSupport(ConsoleStream::STDOUT))
            , m_errFormatter(detectColorSupport(ConsoleStream::STDERR))
            , m_errTransport(detail::make_unique<StderrTransport>()) {
            setTransport(detail::make_unique<StdoutTransport>());
        }

        PrettyConsoleSink(std::unique_ptr<ITransport> out, std::unique_ptr<ITransport> err, bool color = false)
            : m_outFormatter(color)
            , m_errFormatter(color)
            , m_errTransport(std::move(err)) {
            setTransport(std::move(out));
        }

        void write(const LogStreamEvent &event) override {
            if (event.type() != EventType::LOG) return;
            const LogEntry &entry = event.entry();
            if (entry.source == Backend::COMPOSE && entry.stream == StreamKind::STDERR) {
                if (m_errTransport) m_errTransport->write(m_errFormatter.formatEntry(entry));
                return;
            }
            if (m_transport) m_transport->write(m_outFormatter.formatEntry(entry));
        }

    private:
        PrettyFormatter m_outFormatter;
        PrettyFormatter m_errFormatter;
        std::unique_ptr<ITransport> m_errTransport;
    };
} // namespace hacklog

#endif // HACKLOG_PRETTY_CONSOLE_SINK_HPP
