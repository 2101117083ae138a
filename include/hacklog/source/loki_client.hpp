#ifndef HACKLOG_LOKI_CLIENT_HPP
#define HACKLOG_LOKI_CLIENT_HPP

#include "../core/diagnostics.hpp"
#include "../core/log_common.hpp"
#include "../core/time_util.hpp"
#include "../net/http_client.hpp"
#include "../net/url.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hacklog {

    /// One Loki stream: its label set and (timestamp_ns, line) pairs.
    struct LokiStream {
        std::map<std::string, std::string> labels;
        std::vector<std::pair<std::string, std::string>> values;
    };

    /// Decoded /loki/api/v1/query_range body.
    struct LokiQueryResponse {
        bool success;
        std::string error;
        std::vector<LokiStream> result;

        LokiQueryResponse() : success(false) {}
    };

    struct LokiDeleteResult {
        bool ok;
        std::string message;

        LokiDeleteResult() : ok(false) {}
    };

    /// Read one `{stream: {...}, values: [[ts, line], ...]}` object.
    /// Non-string labels and malformed value pairs are skipped.
    inline bool parseLokiStream(const nlohmann::json &value, LokiStream &out) {
        if (!value.is_object()) return false;
        auto stream = value.find("stream");
        auto values = value.find("values");
        if (stream == value.end() || values == value.end()) return false;
        if (!stream->is_object() || !values->is_array()) return false;

        for (auto it = stream->begin(); it != stream->end(); ++it) {
            if (it.value().is_string()) out.labels[it.key()] = it.value().get<std::string>();
        }
        for (const auto &pair : *values) {
            if (!pair.is_array() || pair.size() < 2) continue;
            if (!pair[0].is_string() || !pair[1].is_string()) continue;
            out.values.emplace_back(pair[0].get<std::string>(), pair[1].get<std::string>());
        }
        return true;
    }

    /// False when the body is not JSON or `status` is neither "success" nor
    /// "error".
    inline bool parseQueryRangeResponse(const std::string &body, LokiQueryResponse &out) {
        nlohmann::json root = nlohmann::json::parse(body, nullptr, false);
        if (root.is_discarded() || !root.is_object()) return false;

        auto status = root.find("status");
        if (status == root.end() || !status->is_string()) return false;
        std::string s = status->get<std::string>();
        if (s != "success" && s != "error") return false;
        out.success = (s == "success");

        auto error = root.find("error");
        if (error != root.end() && error->is_string()) out.error = error->get<std::string>();

        auto data = root.find("data");
        if (data != root.end() && data->is_object()) {
            auto result = data->find("result");
            if (result != data->end() && result->is_array()) {
                for (const auto &item : *result) {
                    LokiStream stream;
                    if (parseLokiStream(item, stream)) out.result.push_back(std::move(stream));
                }
            }
        }
        return true;
    }

    /// Decode one tail frame.  False for anything that is not an object
    /// with a `streams` array.
    inline bool parseTailMessage(const std::string &text, std::vector<LokiStream> &out) {
        nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
        if (root.is_discarded() || !root.is_object()) return false;
        auto streams = root.find("streams");
        if (streams == root.end() || !streams->is_array()) return false;
        for (const auto &item : *streams) {
            LokiStream stream;
            if (parseLokiStream(item, stream)) out.push_back(std::move(stream));
        }
        return true;
    }

    inline std::string msToNs(int64_t ms) {
        return std::to_string(ms) + "000000";
    }

    /// HTTP side of a Loki server: readiness, range queries, deletes, and
    /// the URL for the tail WebSocket.
    class LokiClient {
    public:
        explicit LokiClient(const std::string &baseUrl)
            : m_baseUrl(normalizeBaseUrl(baseUrl)) {}

        const std::string &baseUrl() const { return m_baseUrl; }

        /// GET /ready answered with 2xx within @p timeoutMs.
        bool isReady(int timeoutMs) const {
            HttpResponse res;
            std::string error;
            bool ok = HttpClient::get(m_baseUrl + "/ready", timeoutMs, res, error) && res.ok();
            Diagnostics::global().debug("loki ready probe " + m_baseUrl + ": "
                                        + (ok ? std::string("ok") : (error.empty() ? "HTTP " + std::to_string(res.status) : error)));
            return ok;
        }

        std::string queryRangeUrl(const std::string &query, int limit, int64_t startMs, int64_t endMs) const {
            QueryParams params;
            params.emplace_back("query", query);
            params.emplace_back("direction", "BACKWARD");
            params.emplace_back("limit", std::to_string(limit));
            params.emplace_back("start", msToNs(startMs));
            params.emplace_back("end", msToNs(endMs));
            return buildUrl(m_baseUrl, "/loki/api/v1/query_range", params);
        }

        /// ws:// URL for the tail endpoint.  @p startMs < 0 leaves `start` out.
        std::string tailUrl(const std::string &query, int limit, int64_t startMs) const {
            QueryParams params;
            params.emplace_back("query", query);
            params.emplace_back("limit", std::to_string(limit));
            if (startMs >= 0) params.emplace_back("start", msToNs(startMs));
            return buildUrl(toWsUrl(m_baseUrl), "/loki/api/v1/tail", params);
        }

        /// POST /loki/api/v1/delete.  Loki acknowledges with 204.
        /// @p endMs < 0 leaves `end` out.
        LokiDeleteResult requestDelete(const std::string &query, int64_t startMs, int64_t endMs,
                                       int timeoutMs = 10000) const {
            QueryParams params;
            params.emplace_back("query", query);
            params.emplace_back("start", formatRfc3339Seconds(startMs));
            if (endMs >= 0) params.emplace_back("end", formatRfc3339Seconds(endMs));
            std::string url = buildUrl(m_baseUrl, "/loki/api/v1/delete", params);

            HttpRequestOptions opts;
            opts.setMethod("POST").setTimeoutMs(timeoutMs);
            HttpResponse res;
            std::string error;
            LokiDeleteResult result;
            if (!HttpClient::request(url, opts, res, error)) {
                result.message = "Failed to connect to Loki at " + m_baseUrl + ": " + error;
                return result;
            }
            if (res.status == 204) {
                result.ok = true;
                return result;
            }
            std::string text = detail::trim(res.body);
            result.message = "Loki delete failed (" + std::to_string(res.status) + "): "
                + (text.empty() ? "unknown error" : text);
            return result;
        }

    private:
        std::string m_baseUrl;
    };

} // namespace hacklog

#endif // HACKLOG_LOKI_CLIENT_HPP
