#ifndef HACKLOG_LOKI_MAINTENANCE_HPP
#define HACKLOG_LOKI_MAINTENANCE_HPP

#include "loki_client.hpp"
#include "../core/diagnostics.hpp"
#include "../core/time_util.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace hacklog {

    /// Deletes reach back this far; it covers the default global retention.
    constexpr int64_t LOKI_DELETE_LOOKBACK_MS = 30LL * 24 * 60 * 60 * 1000;

    struct MaintenanceResult {
        enum class Status {
            DONE,
            SKIPPED,
            FAILED
        };

        Status status;
        std::string message;

        MaintenanceResult() : status(Status::SKIPPED) {}
        MaintenanceResult(Status s, std::string msg) : status(s), message(std::move(msg)) {}

        bool ok() const { return status != Status::FAILED; }
    };

    /// Ask Loki to delete every line matching @p selector from the last
    /// 30 days.  Skipped when Loki does not answer its readiness probe.
    inline MaintenanceResult clearProjectLogs(const LokiClient &client,
                                              const std::string &selector,
                                              int64_t nowMsValue,
                                              int readyTimeoutMs) {
        if (!client.isReady(readyTimeoutMs)) {
            Diagnostics::global().info("Loki is not reachable at " + client.baseUrl() + "; skipping clear");
            return MaintenanceResult(MaintenanceResult::Status::SKIPPED, "Loki not reachable");
        }
        Diagnostics::global().info("Clearing Loki logs for " + selector);
        LokiDeleteResult res = client.requestDelete(selector, nowMsValue - LOKI_DELETE_LOOKBACK_MS, -1);
        if (!res.ok) {
            Diagnostics::global().warn(res.message);
            return MaintenanceResult(MaintenanceResult::Status::FAILED, res.message);
        }
        return MaintenanceResult(MaintenanceResult::Status::DONE,
                                 "Requested Loki log deletion (may take time due to cancellation window)");
    }

    /// Delete lines older than @p retention (a duration such as "7d").
    /// Nothing is requested when the cut-off falls before the lookback
    /// window.  @p configPath only appears in the invalid-duration warning.
    inline MaintenanceResult pruneProjectLogs(const LokiClient &client,
                                              const std::string &selector,
                                              const std::string &retention,
                                              const std::string &configPath,
                                              int64_t nowMsValue,
                                              int readyTimeoutMs) {
        int64_t retentionMs = 0;
        if (!parseDurationMs(retention, retentionMs)) {
            std::string message = "Invalid logs.retention_period in " + configPath + ": \"" + retention
                + "\" (expected e.g. \"24h\", \"7d\")";
            Diagnostics::global().warn(message);
            return MaintenanceResult(MaintenanceResult::Status::FAILED, message);
        }

        int64_t lookbackStart = nowMsValue - LOKI_DELETE_LOOKBACK_MS;
        int64_t pruneEnd = nowMsValue - retentionMs;
        if (pruneEnd <= lookbackStart) {
            return MaintenanceResult(MaintenanceResult::Status::SKIPPED, "retention exceeds lookback window");
        }
        if (!client.isReady(readyTimeoutMs)) {
            Diagnostics::global().info("Loki is not reachable at " + client.baseUrl() + "; skipping prune");
            return MaintenanceResult(MaintenanceResult::Status::SKIPPED, "Loki not reachable");
        }

        Diagnostics::global().info("Pruning Loki logs older than " + retention + " for " + selector);
        LokiDeleteResult res = client.requestDelete(selector, lookbackStart, pruneEnd);
        if (!res.ok) {
            Diagnostics::global().warn(res.message);
            return MaintenanceResult(MaintenanceResult::Status::FAILED, res.message);
        }
        return MaintenanceResult(MaintenanceResult::Status::DONE,
                                 "Requested Loki log prune (may take time due to cancellation window)");
    }

} // namespace hacklog

#endif // HACKLOG_LOKI_MAINTENANCE_HPP
