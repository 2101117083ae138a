#ifndef HACKLOG_LOGS_OPTIONS_HPP
#define HACKLOG_LOGS_OPTIONS_HPP

#include "../core/errors.hpp"
#include "../core/log_common.hpp"
#include "../core/log_entry.hpp"
#include "../core/log_stream_event.hpp"
#include "../core/time_util.hpp"
#include "../parse/selector.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hacklog {

    /// Raw values of the `logs` command line.  The has* flags record that an
    /// option was given at all, even with an empty value.
    struct LogsArgs {
        std::string service;
        bool json;
        bool pretty;
        bool loki;
        bool compose;
        bool noFollow;
        int tail;
        bool hasSince;
        std::string since;
        bool hasUntil;
        std::string until;
        bool hasServices;
        std::string services;
        bool hasQuery;
        std::string query;
        std::vector<std::string> profiles;
        std::string branch;

        LogsArgs()
            : json(false)
            , pretty(false)
            , loki(false)
            , compose(false)
            , noFollow(false)
            , tail(200)
            , hasSince(false)
            , hasUntil(false)
            , hasServices(false)
            , hasQuery(false) {}
    };

    /// Validated form of LogsArgs.
    struct LogsPlan {
        bool json;
        bool follow;
        int tail;
        bool forceCompose;
        bool wantsLokiExplicit;
        bool hasStart;
        int64_t startMs;
        bool hasEnd;
        int64_t endMs;
        std::string service;
        /// --services plus the positional service.
        std::vector<std::string> lokiServices;
        std::vector<std::string> profiles;
        std::string branch;

        LogsPlan()
            : json(false)
            , follow(true)
            , tail(200)
            , forceCompose(false)
            , wantsLokiExplicit(false)
            , hasStart(false)
            , startMs(0)
            , hasEnd(false)
            , endMs(0) {}
    };

namespace detail {

    inline void parseTimeFlag(const char *flag, const std::string &raw, int64_t now,
                              bool &has, int64_t &out) {
        std::string v = trim(raw);
        if (v.empty()) return;
        if (!parseTimeInput(v, now, out)) {
            throw UsageError(std::string("Invalid ") + flag + ": \"" + v
                             + "\" (expected RFC3339 or duration like 15m)");
        }
        has = true;
    }

} // namespace detail

    /// Check flag combinations and resolve time bounds against @p now.
    /// Throws UsageError with the message shown to the user.
    inline LogsPlan planLogs(const LogsArgs &args, int64_t now) {
        LogsPlan plan;
        plan.json = args.json;
        plan.follow = !args.noFollow;
        plan.tail = args.tail;
        plan.forceCompose = args.compose;
        plan.wantsLokiExplicit = args.loki || args.hasServices || args.hasQuery || args.hasSince || args.hasUntil;
        plan.service = detail::trim(args.service);
        plan.branch = detail::trim(args.branch);

        if (args.compose && plan.wantsLokiExplicit) {
            throw UsageError("Cannot combine --compose with --loki/--services/--query/--since/--until.");
        }
        if (args.json && args.pretty) {
            throw UsageError("Cannot combine --json with --pretty.");
        }
        if (args.tail < 0) {
            throw UsageError("Invalid --tail: " + std::to_string(args.tail));
        }

        detail::parseTimeFlag("--since", args.since, now, plan.hasStart, plan.startMs);
        detail::parseTimeFlag("--until", args.until, now, plan.hasEnd, plan.endMs);
        if (plan.hasStart && plan.hasEnd && plan.startMs > plan.endMs) {
            throw UsageError("--since must be before --until.");
        }
        if (plan.follow && plan.hasEnd) {
            throw UsageError("Cannot combine --until with --follow.");
        }

        plan.lokiServices = detail::splitCsvUnique(args.services);
        if (!plan.service.empty()) {
            bool present = false;
            for (const auto &s : plan.lokiServices) {
                if (s == plan.service) present = true;
            }
            if (!present) plan.lokiServices.push_back(plan.service);
        }

        for (const auto &p : args.profiles) {
            for (const auto &item : detail::splitCsvUnique(p)) plan.profiles.push_back(item);
        }
        return plan;
    }

    /// --query when given and non-blank, otherwise the project selector.
    inline std::string resolveLokiQuery(const LogsArgs &args, const LogsPlan &plan, const std::string &project) {
        std::string q = detail::trim(args.query);
        if (!q.empty()) return q;
        return buildLogSelector(project, plan.lokiServices);
    }

    /// Event context for a session on @p backend.
    inline LogStreamContext makeLogsContext(const LogsArgs &args, const LogsPlan &plan,
                                            Backend backend, const std::string &project) {
        LogStreamContext ctx;
        ctx.backend = backend;
        ctx.project = project;
        ctx.branch = plan.branch;
        ctx.follow = plan.follow;
        ctx.since = detail::trim(args.since);
        ctx.until = detail::trim(args.until);
        if (backend == Backend::LOKI) {
            ctx.services = plan.lokiServices;
        } else if (!plan.service.empty()) {
            ctx.services.push_back(plan.service);
        }
        return ctx;
    }

} // namespace hacklog

#endif // HACKLOG_LOGS_OPTIONS_HPP
