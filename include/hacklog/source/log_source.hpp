#ifndef HACKLOG_LOG_SOURCE_HPP
#define HACKLOG_LOG_SOURCE_HPP

#include "../core/log_entry.hpp"
#include "../core/stop_controller.hpp"
#include <string>
#include <utility>

namespace hacklog {

    /// How a source finished.  `reason` becomes the `end` event's reason;
    /// empty means none.
    struct SourceResult {
        int exitCode;
        std::string reason;

        SourceResult() : exitCode(0) {}
        SourceResult(int code, std::string why) : exitCode(code), reason(std::move(why)) {}
    };

    /// Receives what a source produces, in order, on the source's thread.
    class ISourceListener {
    public:
        virtual ~ISourceListener() = default;

        /// The source is about to deliver entries.
        virtual void onStart() = 0;
        virtual void onEntry(const LogEntry &entry) = 0;
        /// A connectivity failure; the source will return a non-zero result.
        virtual void onError(const std::string &message) = 0;
    };

    /// A backend producing canonical entries until it ends or is stopped.
    ///
    /// run() blocks.  It returns once the backend is exhausted, fails, or
    /// after @p stop has been requested and the backend has been torn down
    /// (subprocess killed, socket closed).  Entries already received when
    /// the stop arrives are still delivered; nothing read afterwards is.
    class ILogSource {
    public:
        virtual ~ILogSource() = default;

        virtual Backend backend() const = 0;
        virtual SourceResult run(ISourceListener &listener, StopController &stop) = 0;
    };

} // namespace hacklog

#endif // HACKLOG_LOG_SOURCE_HPP
