#ifndef HACKLOG_LINE_READER_HPP
#define HACKLOG_LINE_READER_HPP

#include <cstddef>
#include <functional>
#include <string>

namespace hacklog {

    /// Incremental splitter turning raw reads into lines.
    ///
    /// A trailing '\r' is stripped from each line.  A partial line is carried
    /// over to the next feed(); finish() yields whatever is left at EOF.  A
    /// pending line longer than MAX_LINE_BYTES is emitted as-is so a producer
    /// that never writes a newline cannot grow the buffer without bound.
    class LineReader {
    public:
        using LineCallback = std::function<void(const std::string &line)>;

        static constexpr size_t MAX_LINE_BYTES = 1024 * 1024;

        void feed(const char *data, size_t size, const LineCallback &onLine) {
            size_t start = 0;
            for (size_t i = 0; i < size; ++i) {
                if (data[i] != '\n') continue;
                m_pending.append(data + start, i - start);
                emit(onLine);
                start = i + 1;
            }
            if (start < size) {
                m_pending.append(data + start, size - start);
                if (m_pending.size() >= MAX_LINE_BYTES) emit(onLine);
            }
        }

        void feed(const std::string &chunk, const LineCallback &onLine) {
            feed(chunk.data(), chunk.size(), onLine);
        }

        void finish(const LineCallback &onLine) {
            if (!m_pending.empty()) emit(onLine);
        }

        bool hasPending() const { return !m_pending.empty(); }

    private:
        void emit(const LineCallback &onLine) {
            std::string line;
            line.swap(m_pending);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (onLine) onLine(line);
        }

        std::string m_pending;
    };

} // namespace hacklog

#endif // HACKLOG_LINE_READER_HPP
