#ifndef HACKLOG_ERRORS_HPP
#define HACKLOG_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace hacklog {
    /// Raised when a configuration file exists but cannot be read.
    class ConfigError : public std::runtime_error {
    public:
        ConfigError(const std::string &path, const std::string &what)
            : std::runtime_error(path + ": " + what)
            , m_path(path) {}

        const std::string &path() const { return m_path; }

    private:
        std::string m_path;
    };

    /// Raised for invalid flag values and flag combinations.
    class UsageError : public std::invalid_argument {
    public:
        explicit UsageError(const std::string &what) : std::invalid_argument(what) {}
    };
} // namespace hacklog

#endif // HACKLOG_ERRORS_HPP
