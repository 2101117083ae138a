#ifndef HACKLOG_SINK_INTERFACE_HPP
#define HACKLOG_SINK_INTERFACE_HPP

#include "../core/log_stream_event.hpp"
#include "../formatter/formatter_interface.hpp"
#include "../transport/transport_interface.hpp"
#include <memory>

namespace hacklog {
    class ISink {
    public:
        virtual ~ISink() = default;

        virtual void write(const LogStreamEvent &event) = 0;

        void setFormatter(std::unique_ptr<IFormatter> formatter) {
            m_formatter = std::move(formatter);
        }

        void setTransport(std::unique_ptr<ITransport> transport) {
            m_transport = std::move(transport);
        }

        IFormatter *formatter() const { return m_formatter.get(); }
        ITransport *transport() const { return m_transport.get(); }

    protected:
        /// Format then transport; events the formatter renders as nothing
        /// are dropped.
        void emit(const LogStreamEvent &event) {
            if (!m_formatter || !m_transport) return;
            std::string line = m_formatter->format(event);
            if (!line.empty()) m_transport->write(line);
        }

        std::unique_ptr<IFormatter> m_formatter;
        std::unique_ptr<ITransport> m_transport;
    };
} // namespace hacklog

#endif // HACKLOG_SINK_INTERFACE_HPP
