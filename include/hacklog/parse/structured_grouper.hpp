#ifndef HACKLOG_STRUCTURED_GROUPER_HPP
#define HACKLOG_STRUCTURED_GROUPER_HPP

#include "compose_line.hpp"
#include "json_heuristics.hpp"
#include "../core/log_common.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace hacklog {
namespace detail {

    /// Timestamp stripping used only for the grouping decision: the stamp
    /// must be followed by whitespace, and all of it is consumed.
    inline std::string stripTimestampForGrouping(const std::string &payload) {
        size_t len = matchIsoTimestampPrefix(payload);
        if (len == 0 || len >= payload.size() || !isSpace(payload[len])) return payload;
        size_t rest = len;
        while (rest < payload.size() && isSpace(payload[rest])) ++rest;
        return payload.substr(rest);
    }

} // namespace detail

    /// Re-joins pretty-printed JSON records that a container-log multiplexer
    /// split into one transport line per source newline.
    ///
    /// Lines are keyed by their service prefix.  A line whose payload opens a
    /// JSON object or array without closing it opens a buffer for that key;
    /// continuation lines are appended until the buffered payload parses, a
    /// non-continuation line arrives, or a bound is hit.  Every line handed to
    /// handleLine() reaches the callback exactly once, in order per key.
    ///
    /// Not thread-safe; owned by the single loop draining one stream.
    class StructuredLogGrouper {
    public:
        using GroupCallback = std::function<void(const std::vector<std::string> &rawLines)>;

        static constexpr size_t MAX_LINES = 200;
        static constexpr size_t MAX_CHARS = 64000;

        explicit StructuredLogGrouper(GroupCallback emit)
            : m_emit(std::move(emit)) {}

        void handleLine(const std::string &line) {
            ComposePrefixSplit split = splitComposePrefix(line);
            if (!split.valid) {
                emitSingle(line);
                return;
            }

            std::string payload = detail::stripTimestampForGrouping(split.payload);
            std::string trimmed = detail::trim(payload);
            const std::string &key = split.service;

            auto it = m_buffers.find(key);
            if (it != m_buffers.end()) {
                if (!looksLikeJsonContinuation(trimmed)) {
                    flushKey(key);
                    // The line starts a fresh decision once the old group is out.
                    startOrEmit(key, line, payload, trimmed);
                    return;
                }

                Buffer &buffer = it->second;
                buffer.rawLines.push_back(line);
                buffer.jsonLines.push_back(payload);
                buffer.size += payload.size();

                if (buffer.jsonLines.size() >= MAX_LINES
                    || buffer.size >= MAX_CHARS
                    || isJsonComplete(buffer.jsonLines)) {
                    flushKey(key);
                }
                return;
            }

            startOrEmit(key, line, payload, trimmed);
        }

        /// Emit every open buffer.  Called at end of stream.
        void flush() {
            while (!m_buffers.empty()) {
                flushKey(m_buffers.begin()->first);
            }
        }

        size_t openBuffers() const { return m_buffers.size(); }

        /// Lines currently held for @p key (0 when no buffer is open).
        size_t pendingLines(const std::string &key) const {
            auto it = m_buffers.find(key);
            return it == m_buffers.end() ? 0 : it->second.rawLines.size();
        }

        size_t pendingChars(const std::string &key) const {
            auto it = m_buffers.find(key);
            return it == m_buffers.end() ? 0 : it->second.size;
        }

    private:
        struct Buffer {
            std::vector<std::string> rawLines;
            std::vector<std::string> jsonLines;
            size_t size;

            Buffer() : size(0) {}
        };

        void startOrEmit(const std::string &key, const std::string &line,
                         const std::string &payload, const std::string &trimmed) {
            if (looksLikeJsonStart(trimmed) && !isJsonComplete(payload)) {
                Buffer &buffer = m_buffers[key];
                buffer.rawLines.push_back(line);
                buffer.jsonLines.push_back(payload);
                buffer.size = payload.size();
                return;
            }
            emitSingle(line);
        }

        void flushKey(const std::string &key) {
            auto it = m_buffers.find(key);
            if (it == m_buffers.end()) return;
            std::vector<std::string> lines;
            lines.swap(it->second.rawLines);
            m_buffers.erase(it);
            if (m_emit) m_emit(lines);
        }

        void emitSingle(const std::string &line) {
            if (m_emit) m_emit(std::vector<std::string>(1, line));
        }

        GroupCallback m_emit;
        std::map<std::string, Buffer> m_buffers;
    };

} // namespace hacklog

#endif // HACKLOG_STRUCTURED_GROUPER_HPP
