#ifndef HACKLOG_BACKEND_SELECTOR_HPP
#define HACKLOG_BACKEND_SELECTOR_HPP

#include "../core/log_entry.hpp"
#include <functional>

namespace hacklog {

    /// Whether Loki is worth probing for this request.  --compose always
    /// wins; an explicit Loki request always tries; otherwise the
    /// configured default for the current mode decides.
    inline bool resolveShouldTryLoki(bool forceCompose,
                                     bool wantsLokiExplicit,
                                     bool follow,
                                     Backend followBackend,
                                     Backend snapshotBackend) {
        if (forceCompose) return false;
        if (wantsLokiExplicit) return true;
        return (follow ? followBackend : snapshotBackend) == Backend::LOKI;
    }

    /// Final choice.  An explicit Loki request is honored even when Loki is
    /// unreachable so that it fails loudly instead of falling back.
    inline bool resolveUseLoki(bool forceCompose,
                               bool wantsLokiExplicit,
                               bool shouldTryLoki,
                               bool lokiReachable) {
        if (forceCompose) return false;
        if (wantsLokiExplicit) return true;
        return shouldTryLoki && lokiReachable;
    }

    struct BackendRequest {
        bool forceCompose;
        bool wantsLokiExplicit;
        bool follow;
        Backend followBackend;
        Backend snapshotBackend;

        BackendRequest()
            : forceCompose(false)
            , wantsLokiExplicit(false)
            , follow(true)
            , followBackend(Backend::COMPOSE)
            , snapshotBackend(Backend::LOKI) {}
    };

    struct BackendChoice {
        Backend backend;
        /// The readiness probe ran.
        bool probed;
        /// Probe outcome; meaningful only when probed.
        bool reachable;

        BackendChoice() : backend(Backend::COMPOSE), probed(false), reachable(false) {}
    };

    using ReadinessProbe = std::function<bool()>;

    /// Run both decisions, calling @p probe only when Loki is a candidate
    /// and was not requested explicitly.
    inline BackendChoice selectBackend(const BackendRequest &req, const ReadinessProbe &probe) {
        BackendChoice choice;
        bool shouldTry = resolveShouldTryLoki(req.forceCompose, req.wantsLokiExplicit, req.follow,
                                              req.followBackend, req.snapshotBackend);
        if (shouldTry && !req.wantsLokiExplicit && probe) {
            choice.probed = true;
            choice.reachable = probe();
        }
        bool useLoki = resolveUseLoki(req.forceCompose, req.wantsLokiExplicit, shouldTry, choice.reachable);
        choice.backend = useLoki ? Backend::LOKI : Backend::COMPOSE;
        return choice;
    }

} // namespace hacklog

#endif // HACKLOG_BACKEND_SELECTOR_HPP
