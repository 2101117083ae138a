#ifndef HACKLOG_PAYLOAD_PARSER_HPP
#define HACKLOG_PAYLOAD_PARSER_HPP

#include "../core/log_level.hpp"
#include "../core/log_common.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <map>
#include <cmath>
#include <cstdio>

namespace hacklog {

    /// Result of best-effort payload decoding.  For anything that is not a
    /// JSON object the message is the payload itself and nothing else is set.
    struct ParsedPayload {
        std::string message;
        bool hasLevel;
        LogLevel level;
        std::map<std::string, std::string> fields;
        bool structured;

        ParsedPayload() : hasLevel(false), level(LogLevel::INFO), structured(false) {}
    };

namespace detail {

    inline bool isReservedKey(const std::string &key) {
        return key == "level" || key == "lvl" || key == "severity"
            || key == "msg" || key == "message"
            || key == "ts" || key == "time" || key == "timestamp";
    }

    /// Number to text the way a log viewer would print it: integral values
    /// without a fraction, everything else in shortest round-trip form.
    inline std::string numberToString(const nlohmann::json &value) {
        if (value.is_number_integer()) {
            return value.dump();
        }
        double d = value.get<double>();
        if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 1e15) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%lld", static_cast<long long>(d));
            return std::string(buf);
        }
        return value.dump();
    }

    /// Returns false when @p raw is neither a string nor a number.
    inline bool levelFromJson(const nlohmann::json &raw, LogLevel &out) {
        if (raw.is_string()) {
            out = normalizeLevelName(raw.get<std::string>());
            return true;
        }
        if (raw.is_number()) {
            out = normalizePinoLevel(raw.get<double>());
            return true;
        }
        return false;
    }

    /// Strict object parse: the trimmed text must start with '{' and end with '}'.
    inline bool tryParseJsonObject(const std::string &text, nlohmann::json &out) {
        std::string trimmed = trim(text);
        if (trimmed.size() < 2 || trimmed.front() != '{' || trimmed.back() != '}') return false;
        nlohmann::json parsed = nlohmann::json::parse(trimmed, nullptr, false);
        if (parsed.is_discarded() || !parsed.is_object()) return false;
        out = std::move(parsed);
        return true;
    }

} // namespace detail

    /// Extract level, message and extra fields from a raw payload.
    ///
    /// Level lookup order is `level`, `lvl`, `severity`; each may be a name or
    /// a pino number.  Message is `msg`, then `message`, then the payload.
    /// Extra fields keep only string, number and boolean values.  Never throws.
    inline ParsedPayload parseLogPayload(const std::string &payload) {
        ParsedPayload result;
        result.message = payload;

        nlohmann::json json;
        if (!detail::tryParseJsonObject(payload, json)) return result;
        result.structured = true;

        static const char *const levelKeys[] = {"level", "lvl", "severity"};
        for (const char *key : levelKeys) {
            auto it = json.find(key);
            if (it != json.end() && detail::levelFromJson(*it, result.level)) {
                result.hasLevel = true;
                break;
            }
        }

        auto msg = json.find("msg");
        auto message = json.find("message");
        if (msg != json.end() && msg->is_string()) {
            result.message = msg->get<std::string>();
        } else if (message != json.end() && message->is_string()) {
            result.message = message->get<std::string>();
        }

        for (auto it = json.begin(); it != json.end(); ++it) {
            if (detail::isReservedKey(it.key())) continue;
            const nlohmann::json &v = it.value();
            if (v.is_string()) {
                result.fields[it.key()] = v.get<std::string>();
            } else if (v.is_boolean()) {
                result.fields[it.key()] = v.get<bool>() ? "true" : "false";
            } else if (v.is_number()) {
                result.fields[it.key()] = detail::numberToString(v);
            }
        }

        return result;
    }

} // namespace hacklog

#endif // HACKLOG_PAYLOAD_PARSER_HPP
