#ifndef HACKLOG_JSON_HEURISTICS_HPP
#define HACKLOG_JSON_HEURISTICS_HPP

#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace hacklog {
    // Cheap shape tests used by the structured grouper.  They look at the
    // first character only and are deliberately approximate; isJsonComplete
    // is the single authoritative check.

    /// True when a trimmed payload opens an object or array.
    inline bool looksLikeJsonStart(const std::string &trimmed) {
        if (trimmed.empty()) return false;
        return trimmed[0] == '{' || trimmed[0] == '[';
    }

    /// True when a trimmed payload could be the next line of a pretty-printed
    /// JSON document.  Blank lines count as continuations.
    inline bool looksLikeJsonContinuation(const std::string &trimmed) {
        if (trimmed.empty()) return true;
        char head = trimmed[0];
        return head == '{' || head == '}' || head == '[' || head == ']' || head == '"' || head == ',';
    }

    /// True when the newline-joined lines form one complete JSON object or array.
    inline bool isJsonComplete(const std::vector<std::string> &lines) {
        std::string joined = detail::trim(detail::join(lines, "\n"));
        if (joined.empty()) return false;
        if (joined[0] != '{' && joined[0] != '[') return false;
        return nlohmann::json::accept(joined);
    }

    inline bool isJsonComplete(const std::string &text) {
        return isJsonComplete(std::vector<std::string>(1, text));
    }
} // namespace hacklog

#endif // HACKLOG_JSON_HEURISTICS_HPP
