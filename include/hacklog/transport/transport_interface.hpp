#ifndef HACKLOG_TRANSPORT_INTERFACE_HPP
#define HACKLOG_TRANSPORT_INTERFACE_HPP

#include <string>

namespace hacklog {

    class ITransport {
    public:
        virtual ~ITransport() = default;
        /// Write one already-formatted record; the transport appends the newline.
        virtual void write(const std::string &formattedLine) = 0;
    };

} // namespace hacklog

#endif // HACKLOG_TRANSPORT_INTERFACE_HPP
