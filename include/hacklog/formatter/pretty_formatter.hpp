#ifndef HACKLOG_PRETTY_FORMATTER_HPP
#define HACKLOG_PRETTY_FORMATTER_HPP

#include "formatter_interface.hpp"
#include "../parse/compose_line.hpp"
#include <cstdint>
#include <string>

namespace hacklog {
namespace detail {

    inline const char *ansiDim() { return "\033[2m"; }
    inline const char *ansiReset() { return "\033[0m"; }

    inline std::string paint(const std::string &text, const char *code) {
        return std::string(code) + text + ansiReset();
    }

    inline uint32_t fnv1a32(const std::string &text) {
        uint32_t hash = 0x811c9dc5u;
        for (unsigned char c : text) {
            hash ^= c;
            hash *= 0x01000193u;
        }
        return hash;
    }

    /// Stable per-service 256-color code.
    inline int serviceColorCode(const std::string &service) {
        static const int palette[] = {
            33, 39, 45, 69, 75, 81, 87, 93, 99, 105,
            111, 141, 147, 153, 159, 165, 171, 177, 183, 189
        };
        static const size_t count = sizeof(palette) / sizeof(palette[0]);
        return palette[fnv1a32(service) % count];
    }

    inline const char *levelColorCode(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG: return "\033[2m";
            case LogLevel::INFO:  return "\033[36m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            default: return "";
        }
    }

} // namespace detail

    /// Human-oriented single-line rendering:
    ///
    ///   [03:30:48.866] [INFO] [shop/api#2] hello foo=1
    ///
    /// The clock only appears when the entry has a timestamp and the level tag
    /// only when a level was inferred.  Lifecycle events render as nothing.
    class PrettyFormatter : public IFormatter {
    public:
        explicit PrettyFormatter(bool color = false) : m_color(color) {}

        std::string format(const LogStreamEvent &event) const override {
            if (event.type() != EventType::LOG) return std::string();
            return formatEntry(event.entry());
        }

        std::string formatEntry(const LogEntry &entry) const {
            std::string out;
            if (!entry.timestamp.empty()) {
                out += bracket(isoToClock(entry.timestamp), detail::ansiDim());
                out += ' ';
            }
            if (entry.hasLevel) {
                out += bracket(getLevelString(entry.level), detail::levelColorCode(entry.level));
                out += ' ';
            }

            std::string base;
            std::string instance;
            labelParts(entry, base, instance);
            if (!base.empty()) {
                out += labelText(base, instance);
                out += ' ';
            }

            out += entry.message;

            if (!entry.fields.empty()) {
                for (const auto &kv : entry.fields) {
                    out += ' ';
                    out += m_color ? detail::paint(kv.first, detail::ansiDim()) : kv.first;
                    out += '=';
                    out += kv.second;
                }
            }
            return out;
        }

        bool colorEnabled() const { return m_color; }

    private:
        static void labelParts(const LogEntry &entry, std::string &base, std::string &instance) {
            if (entry.service.empty()) return;
            if (entry.source == Backend::LOKI) {
                base = entry.project.empty() ? entry.service : entry.project + "/" + entry.service;
                return;
            }
            base = formatComposeLabel(entry.project, entry.service, std::string());
            if (!entry.instance.empty()) instance = "#" + entry.instance;
        }

        std::string bracket(const std::string &text, const char *code) const {
            if (!m_color) return "[" + text + "]";
            return detail::paint("[", detail::ansiDim())
                + detail::paint(text, code)
                + detail::paint("]", detail::ansiDim());
        }

        std::string labelText(const std::string &base, const std::string &instance) const {
            if (!m_color) return "[" + base + instance + "]";
            std::string code = "\033[1m\033[38;5;" + std::to_string(detail::serviceColorCode(base)) + "m";
            std::string out = detail::paint("[", detail::ansiDim());
            out += code + base + detail::ansiReset();
            if (!instance.empty()) out += detail::paint(instance, detail::ansiDim());
            out += detail::paint("]", detail::ansiDim());
            return out;
        }

        bool m_color;
    };
} // namespace hacklog

#endif // HACKLOG_PRETTY_FORMATTER_HPP
