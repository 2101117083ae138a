#ifndef HACKLOG_COMPOSE_LINE_HPP
#define HACKLOG_COMPOSE_LINE_HPP

#include "payload_parser.hpp"
#include "../core/log_entry.hpp"
#include "../core/log_common.hpp"
#include "../core/time_util.hpp"
#include <string>
#include <vector>

namespace hacklog {

    /// "<service-prefix> | <payload>" split at the first '|'.
    struct ComposePrefixSplit {
        std::string service;
        std::string payload;
        bool valid;

        ComposePrefixSplit() : valid(false) {}
    };

    struct ComposeServiceInfo {
        std::string service;
        std::string instance;
    };

    struct TimestampSplit {
        std::string timestamp;
        std::string payload;
    };

    /// Split a multiplexed container-log line.  Invalid when there is no '|'
    /// or the prefix is blank.  One space after the separator is dropped.
    inline ComposePrefixSplit splitComposePrefix(const std::string &line) {
        ComposePrefixSplit result;
        size_t idx = line.find('|');
        if (idx == std::string::npos) return result;

        result.service = detail::trim(line.substr(0, idx));
        if (result.service.empty()) return result;

        size_t payloadStart = idx + 1;
        if (payloadStart < line.size() && line[payloadStart] == ' ') ++payloadStart;
        result.payload = line.substr(payloadStart);
        result.valid = true;
        return result;
    }

    /// Derive service and replica number from a container label such as
    /// "myproj-api-2".  The "<projectName>-" prefix is stripped first; a
    /// trailing "-<digits>" becomes the instance.
    inline ComposeServiceInfo parseComposeServiceAndInstance(const std::string &rawPrefix,
                                                             const std::string &projectName) {
        ComposeServiceInfo info;
        std::string trimmed = detail::trim(rawPrefix);
        if (trimmed.empty()) return info;

        std::string withoutProject = trimmed;
        if (!projectName.empty() && detail::startsWith(trimmed, projectName + "-")) {
            withoutProject = trimmed.substr(projectName.size() + 1);
        }

        info.service = withoutProject;
        size_t dash = withoutProject.rfind('-');
        if (dash == std::string::npos) return info;

        std::string digits = withoutProject.substr(dash + 1);
        if (digits.empty() || !detail::isAllDigits(digits)) return info;

        std::string base = withoutProject.substr(0, dash);
        info.instance = digits;
        if (base.empty()) {
            info.service = withoutProject;
        } else {
            info.service = base;
        }
        return info;
    }

    /// Strip a leading RFC3339 UTC timestamp plus one following space.
    inline TimestampSplit splitIsoTimestampPrefix(const std::string &payload) {
        TimestampSplit result;
        size_t len = matchIsoTimestampPrefix(payload);
        if (len == 0) {
            result.payload = payload;
            return result;
        }
        result.timestamp = payload.substr(0, len);
        size_t rest = len;
        if (rest < payload.size() && payload[rest] == ' ') ++rest;
        result.payload = payload.substr(rest);
        return result;
    }

    /// Visible label for a compose service: "<project>/<service>[#<instance>]".
    inline std::string formatComposeLabel(const std::string &project,
                                          const std::string &service,
                                          const std::string &instance) {
        std::string label = project.empty() ? service : project + "/" + service;
        if (!instance.empty()) {
            label += "#";
            label += instance;
        }
        return label;
    }

namespace detail {

    inline void applyPayload(LogEntry &entry, const std::string &payload, StreamKind stream) {
        ParsedPayload parsed = parseLogPayload(payload);
        entry.message = parsed.message;
        entry.fields = parsed.fields;
        if (stream == StreamKind::STDERR) {
            entry.hasLevel = true;
            entry.level = LogLevel::ERROR;
        } else if (parsed.hasLevel) {
            entry.hasLevel = true;
            entry.level = parsed.level;
        }
    }

} // namespace detail

    /// Normalize one compose line.  With @p splitPrefix false the whole line is
    /// treated as payload (no service), as for plain piped input.
    inline LogEntry parseComposeLogLine(const std::string &line,
                                        StreamKind stream,
                                        const std::string &projectName = std::string(),
                                        bool splitPrefix = true) {
        LogEntry entry;
        entry.source = Backend::COMPOSE;
        entry.raw = line;
        entry.stream = stream;
        entry.project = projectName;

        std::string payload = line;
        if (splitPrefix) {
            ComposePrefixSplit split = splitComposePrefix(line);
            if (split.valid) {
                ComposeServiceInfo info = parseComposeServiceAndInstance(split.service, projectName);
                entry.service = info.service;
                entry.instance = info.instance;
                payload = split.payload;
            }
        }

        TimestampSplit ts = splitIsoTimestampPrefix(payload);
        entry.timestamp = ts.timestamp;
        detail::applyPayload(entry, ts.payload, stream);
        return entry;
    }

    /// Normalize a group of raw lines reassembled by the structured grouper.
    /// Service and timestamp come from the first line; the payloads of all
    /// lines are joined with newlines and decoded as one document.
    inline LogEntry parseComposeLogGroup(const std::vector<std::string> &rawLines,
                                         StreamKind stream,
                                         const std::string &projectName = std::string()) {
        if (rawLines.size() == 1) {
            return parseComposeLogLine(rawLines[0], stream, projectName);
        }

        LogEntry entry;
        entry.source = Backend::COMPOSE;
        entry.raw = detail::join(rawLines, "\n");
        entry.stream = stream;
        entry.project = projectName;

        std::vector<std::string> payloads;
        payloads.reserve(rawLines.size());
        for (size_t i = 0; i < rawLines.size(); ++i) {
            ComposePrefixSplit split = splitComposePrefix(rawLines[i]);
            std::string payload = split.valid ? split.payload : rawLines[i];
            if (i == 0 && split.valid) {
                ComposeServiceInfo info = parseComposeServiceAndInstance(split.service, projectName);
                entry.service = info.service;
                entry.instance = info.instance;
            }
            TimestampSplit ts = splitIsoTimestampPrefix(payload);
            if (i == 0) entry.timestamp = ts.timestamp;
            payloads.push_back(ts.payload);
        }

        detail::applyPayload(entry, detail::join(payloads, "\n"), stream);
        return entry;
    }

} // namespace hacklog

#endif // HACKLOG_COMPOSE_LINE_HPP
