#ifndef HACKLOG_LOKI_LOG_SOURCE_HPP
#define HACKLOG_LOKI_LOG_SOURCE_HPP

#include "log_source.hpp"
#include "loki_client.hpp"
#include "../core/diagnostics.hpp"
#include "../core/time_util.hpp"
#include "../net/http_client.hpp"
#include "../net/websocket_client.hpp"
#include "../parse/loki_line.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <poll.h>

namespace hacklog {

    /// Settings for LokiLogSource.
    ///
    /// Time bounds are epoch milliseconds.  Without an explicit window a
    /// snapshot covers the 15 minutes before now; a tail starts at the
    /// server's default position unless a start is given.
    struct LokiSourceOptions {
        std::string baseUrl;
        std::string query;
        bool follow;
        int tail;
        bool hasStart;
        int64_t startMs;
        bool hasEnd;
        int64_t endMs;
        int requestTimeoutMs;
        int connectTimeoutMs;
        /// Time allowed for the peer to answer a close frame.
        int closeGraceMs;

        LokiSourceOptions()
            : baseUrl("http://127.0.0.1:3100")
            , follow(false)
            , tail(200)
            , hasStart(false)
            , startMs(0)
            , hasEnd(false)
            , endMs(0)
            , requestTimeoutMs(10000)
            , connectTimeoutMs(5000)
            , closeGraceMs(1000) {}

        LokiSourceOptions &setBaseUrl(const std::string &url) {
            baseUrl = url;
            return *this;
        }
        LokiSourceOptions &setQuery(const std::string &q) {
            query = q;
            return *this;
        }
        LokiSourceOptions &setFollow(bool f) {
            follow = f;
            return *this;
        }
        LokiSourceOptions &setTail(int n) {
            tail = n;
            return *this;
        }
        LokiSourceOptions &setStartMs(int64_t ms) {
            hasStart = true;
            startMs = ms;
            return *this;
        }
        LokiSourceOptions &setEndMs(int64_t ms) {
            hasEnd = true;
            endMs = ms;
            return *this;
        }
        LokiSourceOptions &setRequestTimeoutMs(int ms) {
            requestTimeoutMs = ms;
            return *this;
        }
        LokiSourceOptions &setConnectTimeoutMs(int ms) {
            connectTimeoutMs = ms;
            return *this;
        }
        LokiSourceOptions &setCloseGraceMs(int ms) {
            closeGraceMs = ms;
            return *this;
        }
    };

namespace detail {

    /// Decimal nanosecond string without leading zeros, or empty when @p ts
    /// is not a plain unsigned number.
    inline std::string nsSortKey(const std::string &ts) {
        if (ts.empty()) return std::string();
        for (char c : ts) {
            if (c < '0' || c > '9') return std::string();
        }
        size_t first = ts.find_first_not_of('0');
        return first == std::string::npos ? std::string("0") : ts.substr(first);
    }

    inline bool nsKeyLess(const std::string &a, const std::string &b) {
        if (a.size() != b.size()) return a.size() < b.size();
        return a < b;
    }

} // namespace detail

    /// Flatten query_range streams and put them in chronological order.
    /// Loki answers BACKWARD queries newest-first within each stream and one
    /// stream per label set, so the entries are reversed and then stably
    /// sorted by timestamp.  Entries without a numeric timestamp keep their
    /// position.
    inline std::vector<LogEntry> flattenSnapshot(const std::vector<LokiStream> &streams) {
        std::vector<LogEntry> entries;
        for (const auto &stream : streams) {
            for (const auto &value : stream.values) {
                entries.push_back(parseLokiLogLine(stream.labels, value.first, value.second));
            }
        }
        std::reverse(entries.begin(), entries.end());

        std::vector<size_t> slots;
        std::vector<std::pair<std::string, size_t>> keyed;
        for (size_t i = 0; i < entries.size(); ++i) {
            std::string key = detail::nsSortKey(entries[i].timestampNs);
            if (key.empty()) continue;
            slots.push_back(i);
            keyed.push_back(std::make_pair(key, i));
        }
        std::stable_sort(keyed.begin(), keyed.end(),
                         [](const std::pair<std::string, size_t> &a, const std::pair<std::string, size_t> &b) {
                             return detail::nsKeyLess(a.first, b.first);
                         });

        std::vector<LogEntry> ordered(entries);
        for (size_t k = 0; k < slots.size(); ++k) {
            ordered[slots[k]] = entries[keyed[k].second];
        }
        return ordered;
    }

    /// Reads a project's logs from Loki, either as a bounded range query or
    /// as a live tail over WebSocket.
    class LokiLogSource : public ILogSource {
    public:
        explicit LokiLogSource(LokiSourceOptions opts)
            : m_opts(std::move(opts))
            , m_client(m_opts.baseUrl) {}

        Backend backend() const override { return Backend::LOKI; }

        const LokiSourceOptions &options() const { return m_opts; }

        SourceResult run(ISourceListener &listener, StopController &stop) override {
            return m_opts.follow ? runTail(listener, stop) : runSnapshot(listener, stop);
        }

    private:
        SourceResult runSnapshot(ISourceListener &listener, StopController &stop) {
            int64_t endMs = m_opts.hasEnd ? m_opts.endMs : nowMs();
            int64_t startMs = m_opts.hasStart ? m_opts.startMs : endMs - 15 * 60 * 1000;
            std::string url = m_client.queryRangeUrl(m_opts.query, m_opts.tail, startMs, endMs);
            Diagnostics::global().debug("loki query_range: " + url);

            HttpResponse res;
            std::string error;
            if (!HttpClient::get(url, m_opts.requestTimeoutMs, res, error)) {
                std::string message = "Failed to connect to Loki at " + m_client.baseUrl() + ": " + error;
                Diagnostics::global().error(message);
                listener.onError(message);
                return SourceResult(1, "error");
            }
            if (!res.ok()) {
                Diagnostics::global().error("Failed to query Loki (" + std::to_string(res.status) + "): "
                                            + detail::trim(res.body));
                listener.onError("Loki HTTP " + std::to_string(res.status));
                return SourceResult(1, "error");
            }

            LokiQueryResponse parsed;
            if (!parseQueryRangeResponse(res.body, parsed)) {
                Diagnostics::global().error("Failed to parse Loki query response");
                listener.onError("Failed to parse Loki query response");
                return SourceResult(1, "error");
            }
            if (!parsed.success) {
                std::string message = "Loki error: " + (parsed.error.empty() ? std::string("unknown error") : parsed.error);
                Diagnostics::global().error(message);
                listener.onError(message);
                return SourceResult(1, "error");
            }

            listener.onStart();
            for (const auto &entry : flattenSnapshot(parsed.result)) {
                stop.check();
                if (stop.stopRequested()) return SourceResult(0, stop.reason());
                listener.onEntry(entry);
            }
            return SourceResult();
        }

        SourceResult runTail(ISourceListener &listener, StopController &stop) {
            std::string url = m_client.tailUrl(m_opts.query, m_opts.tail, m_opts.hasStart ? m_opts.startMs : -1);
            Diagnostics::global().debug("loki tail: " + url);
            listener.onStart();

            WebSocketClient ws;
            std::string error;
            if (!ws.connect(url, m_opts.connectTimeoutMs, error)) {
                Diagnostics::global().error("Failed to connect to Loki at " + m_client.baseUrl() + ": " + error);
                listener.onError("Loki WebSocket error");
                return SourceResult(1, "error");
            }

            SourceResult result;
            // Frames can arrive together with the upgrade response.
            if (consume(ws, listener, stop, result)) return result;

            for (;;) {
                struct pollfd fds[2];
                fds[0] = {stop.waitFd(), POLLIN, 0};
                fds[1] = {ws.fd(), POLLIN, 0};
                int pr = ::poll(fds, 2, stop.waitTimeoutMs());
                if (pr < 0 && errno != EINTR) {
                    Diagnostics::global().error("Loki tail poll failed");
                    ws.abort();
                    listener.onError("Loki WebSocket error");
                    return SourceResult(1, "error");
                }

                stop.drain();
                if (stop.stopRequested()) {
                    closeGracefully(ws);
                    return SourceResult(0, stop.reason());
                }
                if (pr <= 0 || !(fds[1].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                if (consume(ws, listener, stop, result)) return result;
            }
        }

        /// Pump the socket once and deliver what arrived.  True once the
        /// connection is over, with @p result set.
        bool consume(WebSocketClient &ws, ISourceListener &listener, StopController &stop, SourceResult &result) {
            std::vector<std::string> messages;
            WebSocketClient::State state = ws.pump(messages, 0);
            deliver(messages, listener, stop);

            if (state == WebSocketClient::State::CLOSED) {
                Diagnostics::global().info("Loki closed the tail (code " + std::to_string(ws.closeCode()) + ")");
                result = SourceResult(0, "closed");
                return true;
            }
            if (state == WebSocketClient::State::FAILED) {
                std::string why = ws.lastError().empty() ? "connection dropped" : ws.lastError();
                Diagnostics::global().error("Loki tail failed: " + why);
                listener.onError("Loki WebSocket error");
                result = SourceResult(1, "error");
                return true;
            }
            return false;
        }

        void deliver(const std::vector<std::string> &messages, ISourceListener &listener, StopController &stop) {
            for (const auto &text : messages) {
                std::vector<LokiStream> streams;
                if (!parseTailMessage(text, streams)) {
                    Diagnostics::global().debug("skipping malformed tail message");
                    continue;
                }
                for (const auto &stream : streams) {
                    for (const auto &value : stream.values) {
                        if (stop.stopRequested()) return;
                        listener.onEntry(parseLokiLogLine(stream.labels, value.first, value.second));
                    }
                }
            }
        }

        /// Send a close frame and wait briefly for the echo; messages that
        /// arrive meanwhile are dropped.
        void closeGracefully(WebSocketClient &ws) {
            ws.close();
            Deadline deadline(m_opts.closeGraceMs);
            std::vector<std::string> ignored;
            while (ws.state() == WebSocketClient::State::OPEN && !deadline.expired()) {
                ws.pump(ignored, deadline.pollMs());
                ignored.clear();
            }
            ws.abort();
        }

        LokiSourceOptions m_opts;
        LokiClient m_client;
    };

} // namespace hacklog

#endif // HACKLOG_LOKI_LOG_SOURCE_HPP
