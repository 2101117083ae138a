#ifndef HACKLOG_LOKI_LINE_HPP
#define HACKLOG_LOKI_LINE_HPP

#include "payload_parser.hpp"
#include "../core/log_entry.hpp"
#include "../core/time_util.hpp"
#include <map>
#include <string>

namespace hacklog {

    /// Normalize one line returned by Loki.  The `project` and `service`
    /// labels are promoted to top-level members; the full label set is kept.
    /// An unparsable @p tsNs leaves `timestamp` empty but is still echoed as
    /// `timestampNs`.
    inline LogEntry parseLokiLogLine(const std::map<std::string, std::string> &labels,
                                     const std::string &tsNs,
                                     const std::string &line) {
        LogEntry entry;
        entry.source = Backend::LOKI;
        entry.raw = line;
        entry.labels = labels;
        entry.timestampNs = tsNs;

        auto project = labels.find("project");
        if (project != labels.end()) entry.project = project->second;
        auto service = labels.find("service");
        if (service != labels.end()) entry.service = service->second;

        if (!tsNs.empty()) {
            std::string iso;
            if (nsToIso(tsNs, iso)) entry.timestamp = iso;
        }

        ParsedPayload parsed = parseLogPayload(line);
        entry.message = parsed.message;
        entry.fields = parsed.fields;
        entry.hasLevel = parsed.hasLevel;
        entry.level = parsed.level;
        return entry;
    }

} // namespace hacklog

#endif // HACKLOG_LOKI_LINE_HPP
