#ifndef HACKLOG_JSON_FORMATTER_HPP
#define HACKLOG_JSON_FORMATTER_HPP

#include "formatter_interface.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace hacklog {
namespace detail {

    /// Dump to a single line.  Invalid UTF-8 from a container is replaced
    /// rather than failing the whole event.
    inline std::string dumpLine(const nlohmann::ordered_json &j) {
        return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
    }

} // namespace detail

    /// Canonical entry as a JSON object.  Absent members are omitted.
    inline nlohmann::ordered_json entryToJson(const LogEntry &entry) {
        nlohmann::ordered_json j;
        j["source"] = getBackendName(entry.source);
        j["message"] = entry.message;
        j["raw"] = entry.raw;
        if (entry.stream != StreamKind::NONE) j["stream"] = getStreamName(entry.stream);
        if (!entry.project.empty()) j["project"] = entry.project;
        if (!entry.service.empty()) j["service"] = entry.service;
        if (!entry.instance.empty()) j["instance"] = entry.instance;
        if (!entry.labels.empty()) {
            nlohmann::ordered_json labels = nlohmann::ordered_json::object();
            for (const auto &kv : entry.labels) labels[kv.first] = kv.second;
            j["labels"] = labels;
        }
        if (!entry.timestamp.empty()) j["timestamp"] = entry.timestamp;
        if (!entry.timestampNs.empty()) j["timestamp_ns"] = entry.timestampNs;
        if (entry.hasLevel) j["level"] = getLevelName(entry.level);
        if (!entry.fields.empty()) {
            nlohmann::ordered_json fields = nlohmann::ordered_json::object();
            for (const auto &kv : entry.fields) fields[kv.first] = kv.second;
            j["fields"] = fields;
        }
        return j;
    }

    /// Session envelope.  Context members other than backend/project/branch
    /// only appear on `start`.
    inline nlohmann::ordered_json eventToJson(const LogStreamEvent &event) {
        const LogStreamContext &ctx = event.context();
        nlohmann::ordered_json j;
        j["type"] = getEventTypeName(event.type());
        j["ts"] = event.ts();
        if (!ctx.project.empty()) j["project"] = ctx.project;
        j["backend"] = getBackendName(ctx.backend);
        if (!ctx.branch.empty()) j["branch"] = ctx.branch;

        switch (event.type()) {
            case EventType::START:
                if (!ctx.services.empty()) j["services"] = ctx.services;
                j["follow"] = ctx.follow;
                if (!ctx.since.empty()) j["since"] = ctx.since;
                if (!ctx.until.empty()) j["until"] = ctx.until;
                break;
            case EventType::LOG:
                j["entry"] = entryToJson(event.entry());
                break;
            case EventType::ERROR:
                j["message"] = event.message();
                break;
            case EventType::END:
                if (!event.reason().empty()) j["reason"] = event.reason();
                break;
            default:
                break;
        }
        return j;
    }

    /// NDJSON session stream: one envelope per line.
    class JsonFormatter : public IFormatter {
    public:
        std::string format(const LogStreamEvent &event) const override {
            return detail::dumpLine(eventToJson(event));
        }
    };

    /// Entry-only NDJSON.  Lifecycle events produce nothing.
    class RawEntryJsonFormatter : public IFormatter {
    public:
        std::string format(const LogStreamEvent &event) const override {
            if (event.type() != EventType::LOG) return std::string();
            return detail::dumpLine(entryToJson(event.entry()));
        }
    };
} // namespace hacklog

#endif // HACKLOG_JSON_FORMATTER_HPP
