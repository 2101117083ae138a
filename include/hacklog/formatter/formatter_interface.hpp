#ifndef HACKLOG_FORMATTER_INTERFACE_HPP
#define HACKLOG_FORMATTER_INTERFACE_HPP

#include "../core/log_stream_event.hpp"
#include <string>

namespace hacklog {
    class IFormatter {
    public:
        virtual ~IFormatter() = default;

        /// Render one event as a single line.  An empty result means the
        /// formatter has nothing to show for this event type.
        virtual std::string format(const LogStreamEvent &event) const = 0;
    };
} // namespace hacklog

#endif // HACKLOG_FORMATTER_INTERFACE_HPP
