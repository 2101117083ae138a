#ifndef HACKLOG_WEBSOCKET_CLIENT_HPP
#define HACKLOG_WEBSOCKET_CLIENT_HPP

#include "http_client.hpp"
#include "socket.hpp"
#include "url.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace hacklog {

    enum class WsOpcode : uint8_t {
        CONTINUATION = 0x0,
        TEXT = 0x1,
        BINARY = 0x2,
        CLOSE = 0x8,
        PING = 0x9,
        PONG = 0xA
    };

    struct WsFrame {
        bool fin;
        WsOpcode opcode;
        std::string payload;

        WsFrame() : fin(true), opcode(WsOpcode::TEXT) {}
    };

    /// Largest frame or reassembled message a client accepts by default.
    constexpr size_t WS_MAX_MESSAGE_BYTES = 16 * 1024 * 1024;

namespace detail {

    inline std::string base64Encode(const unsigned char *data, size_t len) {
        std::string out(4 * ((len + 2) / 3) + 1, '\0');
        int n = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(&out[0]), data, static_cast<int>(len));
        out.resize(n > 0 ? static_cast<size_t>(n) : 0);
        return out;
    }

    /// Sec-WebSocket-Accept for a given Sec-WebSocket-Key (RFC 6455 §4.2.2).
    inline std::string websocketAcceptKey(const std::string &key) {
        static const std::string guid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
        std::string input = key + guid;
        unsigned char digest[EVP_MAX_MD_SIZE];
        unsigned int digestLen = 0;
        if (EVP_Digest(input.data(), input.size(), digest, &digestLen, EVP_sha1(), nullptr) != 1) {
            throw std::runtime_error("EVP_Digest(EVP_sha1) failed");
        }
        return base64Encode(digest, digestLen);
    }

    inline void randomBytes(unsigned char *out, size_t len) {
        if (RAND_bytes(out, static_cast<int>(len)) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
    }

    /// Serialize one frame.  Client frames must be masked; @p maskKey is
    /// only read when @p masked is set.
    inline std::string encodeWsFrame(WsOpcode opcode, const std::string &payload,
                                     bool masked, const unsigned char maskKey[4]) {
        std::string frame;
        frame += static_cast<char>(0x80 | static_cast<uint8_t>(opcode));
        uint8_t maskBit = masked ? 0x80 : 0x00;
        uint64_t len = payload.size();
        if (len < 126) {
            frame += static_cast<char>(maskBit | static_cast<uint8_t>(len));
        } else if (len <= 0xFFFF) {
            frame += static_cast<char>(maskBit | 126);
            frame += static_cast<char>((len >> 8) & 0xFF);
            frame += static_cast<char>(len & 0xFF);
        } else {
            frame += static_cast<char>(maskBit | 127);
            for (int shift = 56; shift >= 0; shift -= 8) {
                frame += static_cast<char>((len >> shift) & 0xFF);
            }
        }
        if (!masked) return frame + payload;

        frame.append(reinterpret_cast<const char *>(maskKey), 4);
        for (size_t i = 0; i < payload.size(); ++i) {
            frame += static_cast<char>(payload[i] ^ maskKey[i % 4]);
        }
        return frame;
    }

    /// Payload length announced by the frame header at the front of
    /// @p buffer.  Returns false until the length bytes have arrived.
    inline bool peekWsPayloadLength(const std::string &buffer, uint64_t &len) {
        if (buffer.size() < 2) return false;
        const unsigned char *p = reinterpret_cast<const unsigned char *>(buffer.data());
        len = p[1] & 0x7F;
        if (len == 126) {
            if (buffer.size() < 4) return false;
            len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
        } else if (len == 127) {
            if (buffer.size() < 10) return false;
            len = 0;
            for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
        }
        return true;
    }

    /// Pop one complete frame off the front of @p buffer.  Returns false when
    /// the buffer does not yet hold a full frame.
    inline bool decodeWsFrame(std::string &buffer, WsFrame &frame) {
        if (buffer.size() < 2) return false;
        const unsigned char *p = reinterpret_cast<const unsigned char *>(buffer.data());
        frame.fin = (p[0] & 0x80) != 0;
        frame.opcode = static_cast<WsOpcode>(p[0] & 0x0F);
        bool masked = (p[1] & 0x80) != 0;
        uint64_t len = p[1] & 0x7F;
        size_t pos = 2;
        if (len == 126) {
            if (buffer.size() < 4) return false;
            len = (static_cast<uint64_t>(p[2]) << 8) | p[3];
            pos = 4;
        } else if (len == 127) {
            if (buffer.size() < 10) return false;
            len = 0;
            for (int i = 0; i < 8; ++i) len = (len << 8) | p[2 + i];
            pos = 10;
        }
        unsigned char mask[4] = {0, 0, 0, 0};
        if (masked) {
            if (buffer.size() < pos + 4) return false;
            for (int i = 0; i < 4; ++i) mask[i] = p[pos + i];
            pos += 4;
        }
        if (buffer.size() - pos < len) return false;

        frame.payload = buffer.substr(pos, static_cast<size_t>(len));
        if (masked) {
            for (size_t i = 0; i < frame.payload.size(); ++i) {
                frame.payload[i] = static_cast<char>(frame.payload[i] ^ mask[i % 4]);
            }
        }
        buffer.erase(0, pos + static_cast<size_t>(len));
        return true;
    }

} // namespace detail

    /// Client side of a ws:// connection (wss:// is not supported).
    ///
    /// Single-threaded: the owner polls fd() and calls pump() when it is
    /// readable.  Pings are answered inside pump(); fragmented messages are
    /// reassembled before being returned.
    class WebSocketClient {
    public:
        enum class State {
            IDLE,
            OPEN,
            CLOSED,
            FAILED
        };

        WebSocketClient()
            : m_state(State::IDLE)
            , m_closeCode(0)
            , m_closing(false)
            , m_maxMessageBytes(WS_MAX_MESSAGE_BYTES) {}

        ~WebSocketClient() { m_socket.close(); }

        WebSocketClient(const WebSocketClient &) = delete;
        WebSocketClient &operator=(const WebSocketClient &) = delete;

        /// Open the connection and complete the upgrade handshake.
        bool connect(const std::string &url, int timeoutMs, std::string &error) {
            ParsedUrl parsed = parseUrl(url);
            if (!parsed.valid || (parsed.scheme != "ws" && parsed.scheme != "wss")) {
                throw std::invalid_argument("WebSocketClient: invalid URL: " + url);
            }
            if (parsed.scheme == "wss") {
                error = "wss:// is not supported";
                m_state = State::FAILED;
                return false;
            }

            Deadline deadline(timeoutMs);
            m_socket = TcpSocket::connect(parsed.host, parsed.port, deadline, error);
            if (!m_socket.valid()) {
                m_state = State::FAILED;
                return false;
            }

            unsigned char nonce[16];
            detail::randomBytes(nonce, sizeof(nonce));
            std::string key = detail::base64Encode(nonce, sizeof(nonce));

            std::string req = "GET " + parsed.target + " HTTP/1.1\r\n";
            req += "Host: " + parsed.hostHeader() + "\r\n";
            req += "Upgrade: websocket\r\n";
            req += "Connection: Upgrade\r\n";
            req += "Sec-WebSocket-Key: " + key + "\r\n";
            req += "Sec-WebSocket-Version: 13\r\n";
            req += "User-Agent: hacklog/1.0\r\n\r\n";
            if (m_socket.sendAll(req, deadline) != IoStatus::OK) {
                return fail("failed to send upgrade request", error);
            }

            size_t headEnd;
            while ((headEnd = m_buffer.find("\r\n\r\n")) == std::string::npos) {
                if (m_buffer.size() > 65536) return fail("oversized upgrade response", error);
                if (deadline.expired()) return fail("upgrade timed out", error);
                IoStatus st = m_socket.recvSome(m_buffer, deadline.pollMs());
                if (st == IoStatus::TIMEOUT) return fail("upgrade timed out", error);
                if (st != IoStatus::OK) return fail("connection closed during upgrade", error);
            }

            HttpResponse head;
            if (!detail::parseResponseHead(m_buffer.substr(0, headEnd), head)) {
                return fail("malformed upgrade response", error);
            }
            m_buffer.erase(0, headEnd + 4);
            if (head.status != 101) {
                return fail("unexpected HTTP " + std::to_string(head.status) + " on upgrade", error);
            }
            auto accept = head.headers.find("sec-websocket-accept");
            if (accept == head.headers.end() || accept->second != detail::websocketAcceptKey(key)) {
                return fail("bad Sec-WebSocket-Accept", error);
            }
            m_state = State::OPEN;
            return true;
        }

        /// Frames or reassembled messages beyond @p bytes fail the connection.
        WebSocketClient &setMaxMessageBytes(size_t bytes) {
            m_maxMessageBytes = bytes;
            return *this;
        }

        int fd() const { return m_socket.fd(); }
        State state() const { return m_state; }
        /// Status code from the peer's close frame, 0 when none was received.
        uint16_t closeCode() const { return m_closeCode; }
        /// Why pump() moved to FAILED on a protocol violation.
        const std::string &lastError() const { return m_lastError; }

        /// Read whatever is available (waiting up to @p timeoutMs) and append
        /// complete text/binary messages to @p messages.  Returns the state
        /// after processing: CLOSED after a close handshake, FAILED when the
        /// connection dropped without one.
        State pump(std::vector<std::string> &messages, int timeoutMs) {
            if (m_state != State::OPEN) return m_state;

            if (!processFrames(messages)) return m_state;

            IoStatus st = m_socket.recvSome(m_buffer, timeoutMs);
            if (st == IoStatus::TIMEOUT) return m_state;
            if (st == IoStatus::CLOSED || st == IoStatus::FAILED) {
                processFrames(messages);
                if (m_state == State::OPEN) m_state = m_closing ? State::CLOSED : State::FAILED;
                m_socket.close();
                return m_state;
            }
            processFrames(messages);
            return m_state;
        }

        bool sendText(const std::string &text) {
            return sendFrame(WsOpcode::TEXT, text);
        }

        /// Start the close handshake.  The connection counts as closed once
        /// the peer echoes the close frame (or drops the socket).
        void close(uint16_t code = 1000) {
            if (m_state != State::OPEN) return;
            std::string payload;
            payload += static_cast<char>((code >> 8) & 0xFF);
            payload += static_cast<char>(code & 0xFF);
            if (!sendFrame(WsOpcode::CLOSE, payload)) {
                m_state = State::CLOSED;
                m_socket.close();
                return;
            }
            m_closing = true;
        }

        bool closing() const { return m_closing; }

        /// Drop the connection without waiting for the peer.
        void abort() {
            if (m_state == State::OPEN) m_state = State::CLOSED;
            m_socket.close();
        }

    private:
        bool fail(const std::string &why, std::string &error) {
            error = why;
            m_state = State::FAILED;
            m_socket.close();
            return false;
        }

        bool sendFrame(WsOpcode opcode, const std::string &payload) {
            if (!m_socket.valid()) return false;
            unsigned char mask[4];
            detail::randomBytes(mask, sizeof(mask));
            Deadline deadline(5000);
            return m_socket.sendAll(detail::encodeWsFrame(opcode, payload, true, mask), deadline) == IoStatus::OK;
        }

        /// Returns false once the connection has ended.
        bool processFrames(std::vector<std::string> &messages) {
            WsFrame frame;
            while (m_state == State::OPEN) {
                if (!checkIncomingSize()) return false;
                if (!detail::decodeWsFrame(m_buffer, frame)) break;
                switch (frame.opcode) {
                    case WsOpcode::TEXT:
                    case WsOpcode::BINARY:
                        if (frame.fin) {
                            messages.push_back(frame.payload);
                        } else {
                            m_fragment = frame.payload;
                        }
                        break;
                    case WsOpcode::CONTINUATION:
                        m_fragment += frame.payload;
                        if (frame.fin) {
                            messages.push_back(m_fragment);
                            m_fragment.clear();
                        }
                        break;
                    case WsOpcode::PING:
                        sendFrame(WsOpcode::PONG, frame.payload);
                        break;
                    case WsOpcode::PONG:
                        break;
                    case WsOpcode::CLOSE:
                        if (frame.payload.size() >= 2) {
                            m_closeCode = static_cast<uint16_t>(
                                (static_cast<unsigned char>(frame.payload[0]) << 8)
                                | static_cast<unsigned char>(frame.payload[1]));
                        }
                        if (!m_closing) {
                            std::string echo = frame.payload.substr(0, 2);
                            sendFrame(WsOpcode::CLOSE, echo);
                        }
                        m_state = State::CLOSED;
                        m_socket.close();
                        return false;
                    default:
                        return fail("unknown opcode", m_lastError);
                }
            }
            return m_state == State::OPEN;
        }

        /// Fails the connection when the next frame, together with a message
        /// being reassembled, would exceed the size limit.
        bool checkIncomingSize() {
            uint64_t len = 0;
            if (!detail::peekWsPayloadLength(m_buffer, len)) return true;
            uint64_t pending = 0;
            WsOpcode opcode = static_cast<WsOpcode>(static_cast<unsigned char>(m_buffer[0]) & 0x0F);
            if (opcode == WsOpcode::CONTINUATION) pending = m_fragment.size();
            if (len > m_maxMessageBytes || pending + len > m_maxMessageBytes) {
                return fail("frame too large", m_lastError);
            }
            return true;
        }

        TcpSocket m_socket;
        State m_state;
        std::string m_buffer;
        std::string m_fragment;
        uint16_t m_closeCode;
        bool m_closing;
        std::string m_lastError;
        size_t m_maxMessageBytes;
    };

} // namespace hacklog

#endif // HACKLOG_WEBSOCKET_CLIENT_HPP
