#ifndef HACKLOG_TERMINAL_HPP
#define HACKLOG_TERMINAL_HPP

#include <cstdio>
#include <cstdlib>
#include <unistd.h>

namespace hacklog {
    enum class ConsoleStream {
        STDOUT,
        STDERR
    };

    /// Color is disabled when the stream is not a TTY, when `NO_COLOR` is set
    /// (any value, https://no-color.org/), or when `HACKLOG_NO_COLOR` is
    /// non-empty.
    inline bool detectColorSupport(ConsoleStream stream) {
        if (std::getenv("NO_COLOR") != nullptr) return false;

        const char *noColor = std::getenv("HACKLOG_NO_COLOR");
        if (noColor && noColor[0] != '\0') return false;

        FILE *fp = (stream == ConsoleStream::STDOUT) ? stdout : stderr;
        return isatty(fileno(fp)) != 0;
    }

    inline bool isStdinTty() {
        return isatty(STDIN_FILENO) != 0;
    }
} // namespace hacklog

#endif // HACKLOG_TERMINAL_HPP
