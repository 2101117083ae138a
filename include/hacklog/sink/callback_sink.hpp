#ifndef HACKLOG_CALLBACK_SINK_HPP
#define HACKLOG_CALLBACK_SINK_HPP

#include "sink_interface.hpp"
#include "../formatter/json_formatter.hpp"
#include "../core/log_common.hpp"
#include <functional>
#include <memory>
#include <string>

namespace hacklog {

    /// Sink that hands each event to a user callback.
    ///
    /// Two variants:
    ///   1. EventCallback receives the LogStreamEvent itself.
    ///   2. StringCallback receives the formatted line (JsonFormatter by
    ///      default, or a caller-supplied formatter).
    ///
    /// Callbacks run on the source's loop; a throwing callback aborts the
    /// session like any other sink failure.
    class CallbackSink : public ISink {
    public:
        using EventCallback  = std::function<void(const LogStreamEvent&)>;
        using StringCallback = std::function<void(const std::string&)>;

        explicit CallbackSink(EventCallback cb)
            : m_eventCallback(std::move(cb))
            , m_mode(Mode::EVENT) {}

        explicit CallbackSink(StringCallback cb, std::unique_ptr<IFormatter> fmt = nullptr)
            : m_stringCallback(std::move(cb))
            , m_mode(Mode::STRING) {
            if (fmt) {
                setFormatter(std::move(fmt));
            } else {
                setFormatter(detail::make_unique<JsonFormatter>());
            }
        }

        void write(const LogStreamEvent &event) override {
            if (m_mode == Mode::EVENT) {
                if (m_eventCallback) m_eventCallback(event);
                return;
            }
            if (!m_stringCallback || !m_formatter) return;
            std::string line = m_formatter->format(event);
            if (!line.empty()) m_stringCallback(line);
        }

    private:
        enum class Mode { EVENT, STRING };

        EventCallback  m_eventCallback;
        StringCallback m_stringCallback;
        Mode           m_mode;
    };

} // namespace hacklog

#endif // HACKLOG_CALLBACK_SINK_HPP
