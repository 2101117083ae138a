#ifndef HACKLOG_CONSOLE_SINK_HPP
#define HACKLOG_CONSOLE_SINK_HPP

#include "sink_interface.hpp"
#include "../core/log_common.hpp"
#include "../formatter/json_formatter.hpp"
#include "../transport/stdout_transport.hpp"

namespace hacklog {
    /// NDJSON on stdout.  With rawEntries set, only bare entries are written
    /// and the session envelope is left out.
    class ConsoleSink : public ISink {
    public:
        explicit ConsoleSink(bool rawEntries = false) {
            if (rawEntries) {
                setFormatter(detail::make_unique<RawEntryJsonFormatter>());
            } else {
                setFormatter(detail::make_unique<JsonFormatter>());
            }
            setTransport(detail::make_unique<StdoutTransport>());
        }

        void write(const LogStreamEvent &event) override {
            emit(event);
        }
    };
} // namespace hacklog

#endif // HACKLOG_CONSOLE_SINK_HPP
