#ifndef HACKLOG_DIAGNOSTICS_HPP
#define HACKLOG_DIAGNOSTICS_HPP

#include "log_level.hpp"
#include "log_common.hpp"
#include "terminal.hpp"
#include "../transport/stdout_transport.hpp"
#include <atomic>
#include <cstdlib>
#include <memory>
#include <string>

namespace hacklog {

    /// Leveled logger for the pipeline's own messages (probe results,
    /// fallbacks, connectivity failures).  Always writes to stderr so the
    /// NDJSON stream on stdout stays clean.
    ///
    /// @code
    ///   hacklog::Diagnostics::global().warn("Loki not reachable, using compose");
    /// @endcode
    class Diagnostics {
    public:
        explicit Diagnostics(std::unique_ptr<ITransport> transport, bool color = false)
            : m_transport(std::move(transport))
            , m_color(color)
            , m_minLevel(static_cast<int>(LogLevel::WARN)) {}

        void setMinLevel(LogLevel level) {
            m_minLevel.store(static_cast<int>(level), std::memory_order_relaxed);
        }

        LogLevel minLevel() const {
            return static_cast<LogLevel>(m_minLevel.load(std::memory_order_relaxed));
        }

        bool isEnabled(LogLevel level) const {
            return static_cast<int>(level) >= m_minLevel.load(std::memory_order_relaxed);
        }

        void log(LogLevel level, const std::string &message) {
            if (!isEnabled(level) || !m_transport) return;
            m_transport->write(formatLine(level, message));
        }

        void debug(const std::string &message) { log(LogLevel::DEBUG, message); }
        void info(const std::string &message) { log(LogLevel::INFO, message); }
        void warn(const std::string &message) { log(LogLevel::WARN, message); }
        void error(const std::string &message) { log(LogLevel::ERROR, message); }

        /// "[WARN] message", with the bracket colored when enabled.
        std::string formatLine(LogLevel level, const std::string &message) const {
            std::string bracket = "[";
            bracket += getLevelString(level);
            bracket += "]";
            if (!m_color) return bracket + " " + message;
            return colorCode(level) + bracket + "\033[0m " + message;
        }

        /// WARN by default; `HACKLOG_DEBUG` set to anything but "" or "0"
        /// lowers it to DEBUG.
        static LogLevel levelFromEnvironment() {
            const char *raw = std::getenv("HACKLOG_DEBUG");
            if (raw && raw[0] != '\0' && std::string(raw) != "0") return LogLevel::DEBUG;
            return LogLevel::WARN;
        }

        /// Process-wide stderr instance.
        static Diagnostics &global() {
            static Diagnostics s_instance(detail::make_unique<StderrTransport>(),
                                          detectColorSupport(ConsoleStream::STDERR));
            static bool s_configured = (s_instance.setMinLevel(levelFromEnvironment()), true);
            (void)s_configured;
            return s_instance;
        }

    private:
        static std::string colorCode(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "\033[2m";
                case LogLevel::INFO:  return "\033[36m";
                case LogLevel::WARN:  return "\033[33m";
                case LogLevel::ERROR: return "\033[31m";
                default: return "";
            }
        }

        std::unique_ptr<ITransport> m_transport;
        bool m_color;
        std::atomic<int> m_minLevel;
    };

} // namespace hacklog

#endif // HACKLOG_DIAGNOSTICS_HPP
