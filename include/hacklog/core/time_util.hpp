#ifndef HACKLOG_TIME_UTIL_HPP
#define HACKLOG_TIME_UTIL_HPP

#include "log_common.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace hacklog {

    /// Milliseconds bound of a valid ECMAScript-style date (±100,000,000 days).
    static const int64_t kMaxTimestampMs = 8640000000000000LL;

namespace detail {

    // Days since 1970-01-01 for a proleptic Gregorian civil date.
    inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) {
        y -= m <= 2;
        const int64_t era = (y >= 0 ? y : y - 399) / 400;
        const unsigned yoe = static_cast<unsigned>(y - era * 400);
        const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
        const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
        return era * 146097 + static_cast<int64_t>(doe) - 719468;
    }

    inline void civilFromDays(int64_t z, int64_t &y, unsigned &m, unsigned &d) {
        z += 719468;
        const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
        const unsigned doe = static_cast<unsigned>(z - era * 146097);
        const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
        y = static_cast<int64_t>(yoe) + era * 400;
        const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
        const unsigned mp = (5 * doy + 2) / 153;
        d = doy - (153 * mp + 2) / 5 + 1;
        m = mp < 10 ? mp + 3 : mp - 9;
        y += (m <= 2);
    }

    inline int64_t floorDiv(int64_t a, int64_t b) {
        int64_t q = a / b;
        if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
        return q;
    }

    inline bool readDigits(const std::string &s, size_t pos, size_t count, int &out) {
        if (pos + count > s.size()) return false;
        int v = 0;
        for (size_t i = pos; i < pos + count; ++i) {
            if (s[i] < '0' || s[i] > '9') return false;
            v = v * 10 + (s[i] - '0');
        }
        out = v;
        return true;
    }

    inline bool isDigitAt(const std::string &s, size_t pos) {
        return pos < s.size() && s[pos] >= '0' && s[pos] <= '9';
    }

} // namespace detail

    inline int64_t nowMs() {
        return static_cast<int64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());
    }

    /// Format epoch milliseconds as "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC).
    /// Returns an empty string when the instant falls outside years 0000-9999.
    inline std::string formatIsoUtc(int64_t epochMs) {
        int64_t days = detail::floorDiv(epochMs, 86400000LL);
        int64_t msOfDay = epochMs - days * 86400000LL;
        int64_t year;
        unsigned month, day;
        detail::civilFromDays(days, year, month, day);
        if (year < 0 || year > 9999) return std::string();

        int hours = static_cast<int>(msOfDay / 3600000LL);
        int minutes = static_cast<int>((msOfDay / 60000LL) % 60);
        int seconds = static_cast<int>((msOfDay / 1000LL) % 60);
        int millis = static_cast<int>(msOfDay % 1000LL);

        char buf[32];
        std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03dZ",
                      static_cast<int>(year), month, day, hours, minutes, seconds, millis);
        return std::string(buf);
    }

    /// RFC3339 without fractional seconds, e.g. "2025-01-02T03:04:05Z".
    inline std::string formatRfc3339Seconds(int64_t epochMs) {
        std::string iso = formatIsoUtc(epochMs);
        if (iso.size() == 24) {
            iso.erase(19, 4);
        }
        return iso;
    }

    inline std::string nowIso() {
        return formatIsoUtc(nowMs());
    }

    /// Convert a decimal nanosecond string to an ISO-8601 timestamp by
    /// integer-dividing down to milliseconds.  Returns false (and leaves
    /// @p out untouched) for anything that is not a representable integer.
    inline bool nsToIso(const std::string &ns, std::string &out) {
        std::string v = detail::trim(ns);
        bool negative = false;
        if (!v.empty() && (v[0] == '-' || v[0] == '+')) {
            negative = v[0] == '-';
            v.erase(0, 1);
        }
        if (!detail::isAllDigits(v)) return false;

        size_t firstNonZero = v.find_first_not_of('0');
        if (firstNonZero == std::string::npos) {
            v = "0";
        } else {
            v.erase(0, firstNonZero);
        }

        int64_t ms = 0;
        if (v.size() > 6) {
            std::string msDigits = v.substr(0, v.size() - 6);
            if (msDigits.size() > 16) return false;
            ms = std::strtoll(msDigits.c_str(), nullptr, 10);
        }
        if (ms > kMaxTimestampMs) return false;
        if (negative) ms = -ms;

        std::string iso = formatIsoUtc(ms);
        if (iso.empty()) return false;
        out = iso;
        return true;
    }

    /// Length of a leading "YYYY-MM-DDTHH:MM:SS[.fraction]Z" timestamp, or 0.
    inline size_t matchIsoTimestampPrefix(const std::string &s) {
        static const char *const shape = "dddd-dd-ddTdd:dd:dd";
        size_t i = 0;
        for (; shape[i] != '\0'; ++i) {
            if (i >= s.size()) return 0;
            if (shape[i] == 'd') {
                if (!detail::isDigitAt(s, i)) return 0;
            } else if (s[i] != shape[i]) {
                return 0;
            }
        }
        if (i < s.size() && s[i] == '.') {
            size_t fracStart = i + 1;
            size_t j = fracStart;
            while (detail::isDigitAt(s, j)) ++j;
            if (j == fracStart) return 0;
            i = j;
        }
        if (i >= s.size() || s[i] != 'Z') return 0;
        return i + 1;
    }

    /// "2025-12-30T03:30:48.866Z" -> "03:30:48.866"; input returned unchanged
    /// when it does not look like a UTC timestamp.
    inline std::string isoToClock(const std::string &iso) {
        size_t t = iso.find('T');
        if (t == std::string::npos || !detail::endsWith(iso, "Z")) return iso;
        std::string rest = iso.substr(t + 1, iso.size() - t - 2);
        if (rest.size() < 8) return iso;
        std::string hms = rest.substr(0, 8);
        if (rest.size() == 8) return hms;
        if (rest[8] != '.') return iso;
        std::string frac = rest.substr(9, 3);
        while (frac.size() < 3) frac += '0';
        return hms + "." + frac;
    }

    /// Parse "<n><s|m|h|d|w>" (whitespace allowed before the unit, case-insensitive).
    inline bool parseDurationMs(const std::string &input, int64_t &outMs) {
        std::string raw = detail::trim(input);
        if (raw.size() < 2) return false;
        char unit = static_cast<char>(std::tolower(static_cast<unsigned char>(raw.back())));
        std::string num = detail::trim(raw.substr(0, raw.size() - 1));
        if (!detail::isAllDigits(num) || num.size() > 12) return false;

        int64_t n = std::strtoll(num.c_str(), nullptr, 10);
        if (n <= 0) return false;

        int64_t unitMs;
        switch (unit) {
            case 's': unitMs = 1000LL; break;
            case 'm': unitMs = 60000LL; break;
            case 'h': unitMs = 3600000LL; break;
            case 'd': unitMs = 86400000LL; break;
            case 'w': unitMs = 604800000LL; break;
            default: return false;
        }
        outMs = n * unitMs;
        return true;
    }

    /// Parse an RFC3339 / ISO-8601 instant: a date ("2025-01-02", taken as UTC)
    /// or a date-time with optional fraction and a "Z" or "+HH:MM" offset.
    /// Date-times without a zone are read as local time.
    inline bool parseIsoInstant(const std::string &input, int64_t &outMs) {
        std::string s = detail::trim(input);
        int year, month, day;
        if (!detail::readDigits(s, 0, 4, year) || s.size() < 10 || s[4] != '-' || s[7] != '-'
            || !detail::readDigits(s, 5, 2, month) || !detail::readDigits(s, 8, 2, day)) {
            return false;
        }
        if (month < 1 || month > 12 || day < 1 || day > 31) return false;

        int64_t days = detail::daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
        if (s.size() == 10) {
            outMs = days * 86400000LL;
            return true;
        }
        if (s[10] != 'T' && s[10] != 't' && s[10] != ' ') return false;

        int hour, minute, second = 0;
        if (!detail::readDigits(s, 11, 2, hour) || s.size() < 16 || s[13] != ':'
            || !detail::readDigits(s, 14, 2, minute)) {
            return false;
        }
        size_t pos = 16;
        if (pos < s.size() && s[pos] == ':') {
            if (!detail::readDigits(s, pos + 1, 2, second)) return false;
            pos += 3;
        }
        if (hour > 23 || minute > 59 || second > 59) return false;

        int millis = 0;
        if (pos < s.size() && s[pos] == '.') {
            size_t j = pos + 1;
            int digits = 0;
            while (detail::isDigitAt(s, j)) {
                if (digits < 3) millis = millis * 10 + (s[j] - '0');
                ++digits;
                ++j;
            }
            if (digits == 0) return false;
            for (int k = digits; k < 3; ++k) millis *= 10;
            pos = j;
        }

        int64_t local = days * 86400000LL + hour * 3600000LL + minute * 60000LL
                      + second * 1000LL + millis;

        if (pos == s.size()) {
            std::tm tm = {};
            tm.tm_year = year - 1900;
            tm.tm_mon = month - 1;
            tm.tm_mday = day;
            tm.tm_hour = hour;
            tm.tm_min = minute;
            tm.tm_sec = second;
            tm.tm_isdst = -1;
            std::time_t t = std::mktime(&tm);
            if (t == static_cast<std::time_t>(-1)) return false;
            outMs = static_cast<int64_t>(t) * 1000LL + millis;
            return true;
        }
        if ((s[pos] == 'Z' || s[pos] == 'z') && pos + 1 == s.size()) {
            outMs = local;
            return true;
        }
        if (s[pos] == '+' || s[pos] == '-') {
            int offH, offM;
            if (!detail::readDigits(s, pos + 1, 2, offH)) return false;
            size_t mPos = pos + 3;
            if (mPos < s.size() && s[mPos] == ':') ++mPos;
            if (!detail::readDigits(s, mPos, 2, offM) || mPos + 2 != s.size()) return false;
            int64_t offset = (offH * 60LL + offM) * 60000LL;
            outMs = s[pos] == '+' ? local - offset : local + offset;
            return true;
        }
        return false;
    }

    /// Resolve a --since/--until value: "now", a duration before @p nowMsValue,
    /// or an absolute ISO-8601 instant.
    inline bool parseTimeInput(const std::string &raw, int64_t nowMsValue, int64_t &outMs) {
        std::string trimmed = detail::trim(raw);
        if (trimmed.empty()) return false;

        std::string lower;
        for (char c : trimmed) lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (lower == "now") {
            outMs = nowMsValue;
            return true;
        }

        int64_t durationMs = 0;
        if (parseDurationMs(trimmed, durationMs)) {
            outMs = nowMsValue - durationMs;
            return true;
        }

        return parseIsoInstant(trimmed, outMs);
    }

} // namespace hacklog

#endif // HACKLOG_TIME_UTIL_HPP
