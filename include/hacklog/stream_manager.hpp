#ifndef HACKLOG_STREAM_MANAGER_HPP
#define HACKLOG_STREAM_MANAGER_HPP

#include "sink/sink_interface.hpp"
#include <memory>
#include <vector>

namespace hacklog {
    /// Fans every event of a session out to the registered sinks, in
    /// registration order.
    class StreamManager {
    public:
        void addSink(std::unique_ptr<ISink> sink) {
            m_sinks.push_back(std::move(sink));
        }

        void dispatch(const LogStreamEvent &event) {
            for (const auto &sink : m_sinks) {
                sink->write(event);
            }
        }

        size_t sinkCount() const { return m_sinks.size(); }

    private:
        std::vector<std::unique_ptr<ISink> > m_sinks;
    };
} // namespace hacklog

#endif // HACKLOG_STREAM_MANAGER_HPP
