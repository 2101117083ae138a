#ifndef HACKLOG_URL_HPP
#define HACKLOG_URL_HPP

#include "../core/log_common.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <string>
#include <utility>
#include <vector>

namespace hacklog {

    /// Scheme, host, port and path-with-query of an http(s)/ws(s) URL.
    struct ParsedUrl {
        std::string scheme;
        std::string host;
        int port;
        std::string target;
        bool valid;

        ParsedUrl() : port(80), valid(false) {}

        bool isSecure() const { return scheme == "https" || scheme == "wss"; }

        /// Value for the Host header: the port is omitted when it is the
        /// scheme's default.
        std::string hostHeader() const {
            int defaultPort = isSecure() ? 443 : 80;
            if (port == defaultPort) return host;
            return host + ":" + std::to_string(port);
        }
    };

    inline ParsedUrl parseUrl(const std::string &url) {
        ParsedUrl result;
        size_t schemeEnd = url.find("://");
        if (schemeEnd == std::string::npos) return result;
        result.scheme = url.substr(0, schemeEnd);
        std::transform(result.scheme.begin(), result.scheme.end(), result.scheme.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (result.scheme != "http" && result.scheme != "https"
            && result.scheme != "ws" && result.scheme != "wss") {
            return result;
        }

        size_t hostStart = schemeEnd + 3;
        if (hostStart >= url.size()) return result;

        size_t pathStart = url.find_first_of("/?", hostStart);
        std::string hostPort;
        if (pathStart == std::string::npos) {
            hostPort = url.substr(hostStart);
            result.target = "/";
        } else {
            hostPort = url.substr(hostStart, pathStart - hostStart);
            result.target = url.substr(pathStart);
            if (result.target[0] == '?') result.target = "/" + result.target;
        }

        // IPv6 literals are not supported.
        if (!hostPort.empty() && hostPort[0] == '[') return result;

        size_t colonPos = hostPort.find(':');
        if (colonPos != std::string::npos) {
            result.host = hostPort.substr(0, colonPos);
            std::string portStr = hostPort.substr(colonPos + 1);
            if (portStr.empty()) return result;
            char *endPtr = nullptr;
            long portLong = std::strtol(portStr.c_str(), &endPtr, 10);
            if (endPtr == portStr.c_str() || *endPtr != '\0' || portLong < 1 || portLong > 65535) {
                return result;
            }
            result.port = static_cast<int>(portLong);
        } else {
            result.host = hostPort;
            result.port = result.isSecure() ? 443 : 80;
        }
        if (result.host.empty()) return result;

        // Reject control characters and spaces; they would end up verbatim in
        // the request line and headers.
        for (unsigned char c : result.host) {
            if (c <= 0x20 || c == 0x7F) return result;
        }
        for (unsigned char c : result.target) {
            if (c <= 0x20 || c == 0x7F) return result;
        }
        result.valid = true;
        return result;
    }

    /// application/x-www-form-urlencoded component encoding.
    inline std::string urlEncode(const std::string &value) {
        static const char *const hex = "0123456789ABCDEF";
        std::string out;
        out.reserve(value.size() * 3);
        for (unsigned char c : value) {
            if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
                out += static_cast<char>(c);
            } else {
                out += '%';
                out += hex[c >> 4];
                out += hex[c & 0x0F];
            }
        }
        return out;
    }

    using QueryParams = std::vector<std::pair<std::string, std::string>>;

    /// "<base><path>?k=v&..." with every key and value encoded.
    inline std::string buildUrl(const std::string &base, const std::string &path, const QueryParams &params) {
        std::string url = base + path;
        for (size_t i = 0; i < params.size(); ++i) {
            url += (i == 0) ? '?' : '&';
            url += urlEncode(params[i].first);
            url += '=';
            url += urlEncode(params[i].second);
        }
        return url;
    }

    /// Trim whitespace and trailing slashes; empty input yields @p fallback.
    inline std::string normalizeBaseUrl(const std::string &baseUrl,
                                        const std::string &fallback = "http://127.0.0.1:3100") {
        std::string trimmed = detail::trim(baseUrl);
        while (!trimmed.empty() && trimmed.back() == '/') trimmed.pop_back();
        return trimmed.empty() ? fallback : trimmed;
    }

    /// http:// -> ws://, https:// -> wss://; anything else is returned as-is.
    inline std::string toWsUrl(const std::string &httpUrl) {
        if (detail::startsWith(httpUrl, "https://")) return "wss://" + httpUrl.substr(8);
        if (detail::startsWith(httpUrl, "http://")) return "ws://" + httpUrl.substr(7);
        return httpUrl;
    }

} // namespace hacklog

#endif // HACKLOG_URL_HPP
