#ifndef HACKLOG_HTTP_CLIENT_HPP
#define HACKLOG_HTTP_CLIENT_HPP

#include "socket.hpp"
#include "url.hpp"
#include "../core/log_common.hpp"
#include "../process/subprocess.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace hacklog {

    /// Request settings.
    ///
    /// @code
    ///   HttpRequestOptions opts;
    ///   opts.setMethod("POST").setTimeoutMs(2000);
    /// @endcode
    struct HttpRequestOptions {
        std::string method;
        std::string body;
        std::map<std::string, std::string> headers;
        int timeoutMs;

        HttpRequestOptions()
            : method("GET")
            , timeoutMs(10000) {}

        HttpRequestOptions &setMethod(const std::string &m) {
            method = m;
            return *this;
        }
        HttpRequestOptions &setBody(const std::string &b) {
            body = b;
            return *this;
        }
        HttpRequestOptions &setHeader(const std::string &key, const std::string &val) {
            headers[key] = val;
            return *this;
        }
        HttpRequestOptions &setTimeoutMs(int ms) {
            timeoutMs = ms;
            return *this;
        }
    };

    struct HttpResponse {
        int status;
        /// Header names lower-cased.
        std::map<std::string, std::string> headers;
        std::string body;

        HttpResponse() : status(0) {}

        bool ok() const { return status >= 200 && status < 300; }
    };

namespace detail {

    inline std::string toLower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

    inline bool isHeaderSafe(const std::string &s) {
        for (unsigned char c : s) {
            if (c < 0x20 || c == 0x7F) return false;
        }
        return true;
    }

    /// Parse "HTTP/1.1 200 OK\r\nK: V\r\n..." (without the blank line).
    inline bool parseResponseHead(const std::string &head, HttpResponse &out) {
        size_t lineEnd = head.find("\r\n");
        std::string statusLine = head.substr(0, lineEnd);
        if (!startsWith(statusLine, "HTTP/")) return false;
        size_t sp = statusLine.find(' ');
        if (sp == std::string::npos) return false;
        char *endPtr = nullptr;
        long code = std::strtol(statusLine.c_str() + sp + 1, &endPtr, 10);
        if (endPtr == statusLine.c_str() + sp + 1 || code < 100 || code > 999) return false;
        out.status = static_cast<int>(code);

        size_t pos = (lineEnd == std::string::npos) ? head.size() : lineEnd + 2;
        while (pos < head.size()) {
            size_t end = head.find("\r\n", pos);
            if (end == std::string::npos) end = head.size();
            std::string line = head.substr(pos, end - pos);
            size_t colon = line.find(':');
            if (colon != std::string::npos) {
                out.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
            }
            pos = end + 2;
        }
        return true;
    }

    /// Decode a complete chunked body.  Returns false while more input is needed.
    inline bool decodeChunked(const std::string &raw, std::string &out) {
        std::string decoded;
        size_t pos = 0;
        while (true) {
            size_t lineEnd = raw.find("\r\n", pos);
            if (lineEnd == std::string::npos) return false;
            std::string sizeLine = raw.substr(pos, lineEnd - pos);
            size_t semi = sizeLine.find(';');
            if (semi != std::string::npos) sizeLine.erase(semi);
            unsigned long size = std::strtoul(trim(sizeLine).c_str(), nullptr, 16);
            pos = lineEnd + 2;
            if (size == 0) {
                out = decoded;
                return true;
            }
            if (raw.size() < pos + size + 2) return false;
            decoded.append(raw, pos, size);
            pos += size + 2;
        }
    }

} // namespace detail

    /// Minimal HTTP/1.1 client.
    ///
    /// Transport strategy:
    /// - http:// : raw TCP socket, `Connection: close`
    /// - https:// : curl subprocess fallback
    ///
    /// Network failures are returned, not thrown: request() yields false and
    /// fills @p error.  An invalid URL is a caller bug and throws
    /// std::invalid_argument.
    class HttpClient {
    public:
        static bool request(const std::string &url, const HttpRequestOptions &opts,
                            HttpResponse &out, std::string &error) {
            ParsedUrl parsed = parseUrl(url);
            if (!parsed.valid || (parsed.scheme != "http" && parsed.scheme != "https")) {
                throw std::invalid_argument("HttpClient: invalid URL: " + url);
            }
            if (parsed.scheme == "https") return requestCurl(url, opts, out, error);
            return requestPlain(parsed, opts, out, error);
        }

        static bool get(const std::string &url, int timeoutMs, HttpResponse &out, std::string &error) {
            HttpRequestOptions opts;
            opts.setTimeoutMs(timeoutMs);
            return request(url, opts, out, error);
        }

    private:
        static bool requestPlain(const ParsedUrl &url, const HttpRequestOptions &opts,
                                 HttpResponse &out, std::string &error) {
            Deadline deadline(opts.timeoutMs);
            TcpSocket sock = TcpSocket::connect(url.host, url.port, deadline, error);
            if (!sock.valid()) return false;

            std::string req = opts.method + " " + url.target + " HTTP/1.1\r\n";
            req += "Host: " + url.hostHeader() + "\r\n";
            req += "User-Agent: hacklog/1.0\r\n";
            req += "Accept: application/json\r\n";
            req += "Connection: close\r\n";
            if (!opts.body.empty() || opts.method == "POST" || opts.method == "PUT") {
                req += "Content-Length: " + std::to_string(opts.body.size()) + "\r\n";
            }
            for (const auto &h : opts.headers) {
                if (!detail::isHeaderSafe(h.first) || !detail::isHeaderSafe(h.second)) continue;
                req += h.first + ": " + h.second + "\r\n";
            }
            req += "\r\n";
            req += opts.body;

            if (sock.sendAll(req, deadline) != IoStatus::OK) {
                error = "failed to send request";
                return false;
            }

            std::string raw;
            size_t headEnd = std::string::npos;
            bool headParsed = false;
            while (true) {
                if (!headParsed) {
                    headEnd = raw.find("\r\n\r\n");
                    if (headEnd != std::string::npos) {
                        if (!detail::parseResponseHead(raw.substr(0, headEnd), out)) {
                            error = "malformed HTTP response";
                            return false;
                        }
                        headParsed = true;
                    }
                }
                if (headParsed && bodyComplete(out, raw.substr(headEnd + 4))) break;

                if (deadline.expired()) {
                    error = "request timed out";
                    return false;
                }
                IoStatus st = sock.recvSome(raw, deadline.pollMs());
                if (st == IoStatus::CLOSED) break;
                if (st == IoStatus::TIMEOUT) {
                    error = "request timed out";
                    return false;
                }
                if (st == IoStatus::FAILED) {
                    error = "connection reset";
                    return false;
                }
            }

            if (!headParsed) {
                error = raw.empty() ? "empty reply from server" : "malformed HTTP response";
                return false;
            }
            std::string body = raw.substr(headEnd + 4);
            auto te = out.headers.find("transfer-encoding");
            if (te != out.headers.end() && detail::toLower(te->second).find("chunked") != std::string::npos) {
                if (!detail::decodeChunked(body, out.body)) {
                    error = "truncated chunked body";
                    return false;
                }
            } else {
                out.body = body;
            }
            return true;
        }

        static bool bodyComplete(const HttpResponse &head, const std::string &body) {
            if (head.status == 204 || head.status == 304 || (head.status >= 100 && head.status < 200)) return true;
            auto te = head.headers.find("transfer-encoding");
            if (te != head.headers.end() && detail::toLower(te->second).find("chunked") != std::string::npos) {
                std::string ignored;
                return detail::decodeChunked(body, ignored);
            }
            auto cl = head.headers.find("content-length");
            if (cl != head.headers.end()) {
                unsigned long len = std::strtoul(cl->second.c_str(), nullptr, 10);
                return body.size() >= len;
            }
            return false;
        }

        // argv goes to execvp, so nothing here is shell-interpreted.  The
        // status code is appended after a marker line by `-w`.
        static bool requestCurl(const std::string &url, const HttpRequestOptions &opts,
                                HttpResponse &out, std::string &error) {
            static const std::string marker = "\n__hacklog_status__:";
            std::vector<std::string> args;
            args.push_back("curl");
            args.push_back("--silent");
            args.push_back("--show-error");
            args.push_back("-X");
            args.push_back(opts.method);
            args.push_back("--max-time");
            int maxTimeSec = (opts.timeoutMs + 999) / 1000;
            args.push_back(std::to_string(maxTimeSec > 0 ? maxTimeSec : 1));
            for (const auto &h : opts.headers) {
                if (!detail::isHeaderSafe(h.first) || !detail::isHeaderSafe(h.second)) continue;
                args.push_back("-H");
                args.push_back(h.first + ": " + h.second);
            }
            if (!opts.body.empty()) {
                args.push_back("--data-binary");
                args.push_back(opts.body);
            }
            args.push_back("-w");
            args.push_back(marker + "%{http_code}");
            args.push_back(url);

            CapturedOutput res = runAndCapture(args, opts.timeoutMs + 1000);
            if (res.exitCode == 127) {
                error = "curl not found in PATH";
                return false;
            }
            if (res.timedOut) {
                error = "request timed out";
                return false;
            }
            size_t at = res.out.rfind(marker);
            if (res.exitCode != 0 || at == std::string::npos) {
                error = detail::trim(res.err).empty() ? "curl failed (exit " + std::to_string(res.exitCode) + ")" : detail::trim(res.err);
                return false;
            }
            out.status = std::atoi(res.out.c_str() + at + marker.size());
            out.body = res.out.substr(0, at);
            if (out.status == 0) {
                error = "no HTTP response";
                return false;
            }
            return true;
        }
    };

} // namespace hacklog

#endif // HACKLOG_HTTP_CLIENT_HPP
