#ifndef HACKLOG_COMMON_HPP
#define HACKLOG_COMMON_HPP

#include <string>
#include <vector>
#include <set>
#include <memory>
#include <utility>
#include <cctype>

namespace hacklog {
namespace detail {
#if __cplusplus < 201402L
    template<typename T, typename... Args>
    std::unique_ptr<T> make_unique(Args&&... args) {
        return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
    }
#else
    using std::make_unique;
#endif

    inline bool isSpace(char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    }

    inline std::string trim(const std::string &s) {
        size_t begin = 0;
        size_t end = s.size();
        while (begin < end && isSpace(s[begin])) ++begin;
        while (end > begin && isSpace(s[end - 1])) --end;
        return s.substr(begin, end - begin);
    }

    inline bool startsWith(const std::string &s, const std::string &prefix) {
        return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
    }

    inline bool endsWith(const std::string &s, const std::string &suffix) {
        return s.size() >= suffix.size()
            && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
    }

    inline bool isAllDigits(const std::string &s) {
        if (s.empty()) return false;
        for (char c : s) {
            if (c < '0' || c > '9') return false;
        }
        return true;
    }

    inline std::string join(const std::vector<std::string> &parts, const std::string &sep) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) out += sep;
            out += parts[i];
        }
        return out;
    }

    /// Split a comma-separated list, trimming items and dropping blanks
    /// and duplicates while keeping first-seen order.
    inline std::vector<std::string> splitCsvUnique(const std::string &value) {
        std::vector<std::string> out;
        std::set<std::string> seen;
        size_t start = 0;
        while (start <= value.size()) {
            size_t comma = value.find(',', start);
            if (comma == std::string::npos) comma = value.size();
            std::string part = trim(value.substr(start, comma - start));
            if (!part.empty() && seen.insert(part).second) {
                out.push_back(part);
            }
            start = comma + 1;
        }
        return out;
    }
} // namespace detail
} // namespace hacklog

#endif // HACKLOG_COMMON_HPP
