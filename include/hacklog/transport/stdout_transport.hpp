#ifndef HACKLOG_STDOUT_TRANSPORT_HPP
#define HACKLOG_STDOUT_TRANSPORT_HPP

#include "transport_interface.hpp"
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace hacklog {
    /// One NDJSON record per call, flushed immediately so downstream readers
    /// (pipes, the TUI) see each event as soon as it is produced.
    ///
    /// @note All StdoutTransport instances share a single mutex so a record is
    ///       never interleaved with another.  StderrTransport has its own.
    class StdoutTransport : public ITransport {
    public:
        void write(const std::string &formattedLine) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cout << formattedLine << '\n' << std::flush;
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    class StderrTransport : public ITransport {
    public:
        void write(const std::string &formattedLine) override {
            std::lock_guard<std::mutex> lock(sharedMutex());
            std::cerr << formattedLine << '\n' << std::flush;
        }

    private:
        static std::mutex &sharedMutex() {
            static std::mutex s_mutex;
            return s_mutex;
        }
    };

    /// Collects lines in memory instead of writing them out.
    class MemoryTransport : public ITransport {
    public:
        void write(const std::string &formattedLine) override {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_lines.push_back(formattedLine);
        }

        std::vector<std::string> lines() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_lines;
        }

    private:
        mutable std::mutex m_mutex;
        std::vector<std::string> m_lines;
    };
} // namespace hacklog

#endif // HACKLOG_STDOUT_TRANSPORT_HPP
