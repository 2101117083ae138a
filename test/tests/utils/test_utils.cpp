#include "test_utils.hpp"
#include "hacklog/net/websocket_client.hpp"
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <filesystem>
namespace fs = std::filesystem;

std::string TestUtils::makeTempDir() {
    char tmpl[] = "/tmp/hacklog-test-XXXXXX";
    char *dir = ::mkdtemp(tmpl);
    if (dir == nullptr) {
        throw std::runtime_error(std::string("mkdtemp failed: ") + std::strerror(errno));
    }
    return dir;
}

void TestUtils::writeFile(const std::string &path, const std::string &content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    file << content;
}

std::string TestUtils::readFile(const std::string &path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

void TestUtils::removeTree(const std::string &path) {
    std::error_code ec;
    fs::remove_all(path, ec);
}

// The port could be taken between release and use; acceptable for tests.
int TestUtils::unusedPort() {
    int sock = ::socket(AF_INET, SOCK_STREAM, 0);
    if (sock < 0) return 1;
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    int port = 1;
    if (::bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) == 0) {
        socklen_t len = sizeof(addr);
        if (::getsockname(sock, reinterpret_cast<struct sockaddr *>(&addr), &len) == 0) {
            port = ntohs(addr.sin_port);
        }
    }
    ::close(sock);
    return port;
}

LoopbackServer::LoopbackServer(Handler handler, int connections)
    : m_handler(std::move(handler))
    , m_listenFd(-1)
    , m_port(0) {
    m_listenFd = ::socket(AF_INET, SOCK_STREAM, 0);
    if (m_listenFd < 0) throw std::runtime_error("socket failed");
    int opt = 1;
    ::setsockopt(m_listenFd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(m_listenFd, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) != 0
        || ::listen(m_listenFd, 4) != 0) {
        ::close(m_listenFd);
        throw std::runtime_error("bind/listen failed");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(m_listenFd, reinterpret_cast<struct sockaddr *>(&addr), &len);
    m_port = ntohs(addr.sin_port);

    m_thread = std::thread([this, connections] { serve(connections); });
}

LoopbackServer::~LoopbackServer() {
    join();
    if (m_listenFd >= 0) ::close(m_listenFd);
}

std::string LoopbackServer::baseUrl() const {
    return "http://127.0.0.1:" + std::to_string(m_port);
}

std::vector<std::string> LoopbackServer::requests() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_requests;
}

void LoopbackServer::join() {
    if (m_thread.joinable()) m_thread.join();
}

void LoopbackServer::serve(int connections) {
    for (int served = 0; served < connections; ++served) {
        struct pollfd pfd;
        pfd.fd = m_listenFd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, 5000) <= 0) return;

        int client = ::accept(m_listenFd, nullptr, nullptr);
        if (client < 0) return;

        std::string head;
        char buf[4096];
        size_t end;
        while ((end = head.find("\r\n\r\n")) == std::string::npos) {
            struct pollfd cp;
            cp.fd = client;
            cp.events = POLLIN;
            cp.revents = 0;
            if (::poll(&cp, 1, 5000) <= 0) break;
            ssize_t n = ::recv(client, buf, sizeof(buf), 0);
            if (n <= 0) break;
            head.append(buf, static_cast<size_t>(n));
        }
        if (end != std::string::npos) head.erase(end);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_requests.push_back(head);
        }
        m_handler(client, head);
        ::close(client);
    }
}

void LoopbackServer::sendAll(int fd, const std::string &data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return;
        sent += static_cast<size_t>(n);
    }
}

std::string LoopbackServer::httpResponse(int status, const std::string &reason, const std::string &body,
                                         const std::string &extraHeaders) {
    std::string res = "HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n";
    res += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    res += extraHeaders;
    res += "Connection: close\r\n\r\n";
    res += body;
    return res;
}

bool LoopbackServer::acceptWebSocket(int fd, const std::string &requestHead) {
    static const std::string header = "Sec-WebSocket-Key: ";
    size_t at = requestHead.find(header);
    if (at == std::string::npos) return false;
    size_t start = at + header.size();
    size_t end = requestHead.find("\r\n", start);
    std::string key = requestHead.substr(start, end == std::string::npos ? std::string::npos : end - start);

    std::string res = "HTTP/1.1 101 Switching Protocols\r\n";
    res += "Upgrade: websocket\r\n";
    res += "Connection: Upgrade\r\n";
    res += "Sec-WebSocket-Accept: " + hacklog::detail::websocketAcceptKey(key) + "\r\n\r\n";
    sendAll(fd, res);
    return true;
}

std::string LoopbackServer::wsFrame(uint8_t opcode, const std::string &payload) {
    const unsigned char noMask[4] = {0, 0, 0, 0};
    return hacklog::detail::encodeWsFrame(static_cast<hacklog::WsOpcode>(opcode), payload, false, noMask);
}

bool LoopbackServer::awaitWsClose(int fd, int timeoutMs) {
    std::string buffer;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeoutMs);
    while (std::chrono::steady_clock::now() < deadline) {
        hacklog::WsFrame frame;
        while (hacklog::detail::decodeWsFrame(buffer, frame)) {
            if (frame.opcode == hacklog::WsOpcode::CLOSE) {
                sendAll(fd, wsFrame(0x8, frame.payload));
                return true;
            }
        }
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLIN;
        pfd.revents = 0;
        if (::poll(&pfd, 1, 100) <= 0) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return false;
        buffer.append(buf, static_cast<size_t>(n));
    }
    return false;
}

std::string LoopbackServer::queryParam(const std::string &requestHead, const std::string &name) {
    size_t lineEnd = requestHead.find("\r\n");
    std::string line = requestHead.substr(0, lineEnd);
    size_t q = line.find('?');
    size_t sp = line.rfind(' ');
    if (q == std::string::npos || sp == std::string::npos || sp < q) return std::string();
    std::string query = line.substr(q + 1, sp - q - 1);

    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        std::string pair = query.substr(pos, amp - pos);
        size_t eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == name) {
            std::string raw = pair.substr(eq + 1);
            std::string out;
            for (size_t i = 0; i < raw.size(); ++i) {
                if (raw[i] == '%' && i + 2 < raw.size()) {
                    out += static_cast<char>(std::strtol(raw.substr(i + 1, 2).c_str(), nullptr, 16));
                    i += 2;
                } else if (raw[i] == '+') {
                    out += ' ';
                } else {
                    out += raw[i];
                }
            }
            return out;
        }
        pos = amp + 1;
    }
    return std::string();
}
