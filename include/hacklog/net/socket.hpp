#ifndef HACKLOG_SOCKET_HPP
#define HACKLOG_SOCKET_HPP

#include <cerrno>
#include <climits>
#include <cstring>
#include <string>
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <time.h>
#include <unistd.h>

#ifdef MSG_NOSIGNAL
#define HACKLOG_MSG_NOSIGNAL MSG_NOSIGNAL
#else
#define HACKLOG_MSG_NOSIGNAL 0
#endif

namespace hacklog {

    /// Absolute CLOCK_MONOTONIC deadline shared by every syscall of one
    /// operation, so a slow peer cannot stretch the total past the budget.
    class Deadline {
    public:
        explicit Deadline(long timeoutMs) {
            clock_gettime(CLOCK_MONOTONIC, &m_at);
            m_at.tv_sec += static_cast<time_t>(timeoutMs / 1000);
            m_at.tv_nsec += static_cast<long>((timeoutMs % 1000) * 1000000L);
            if (m_at.tv_nsec >= 1000000000L) {
                m_at.tv_sec += 1;
                m_at.tv_nsec -= 1000000000L;
            }
        }

        long remainingMs() const {
            struct timespec now;
            clock_gettime(CLOCK_MONOTONIC, &now);
            long ms = (m_at.tv_sec - now.tv_sec) * 1000L
                    + (m_at.tv_nsec - now.tv_nsec) / 1000000L;
            return ms > 0 ? ms : 0;
        }

        /// remainingMs() clamped for poll(2).
        int pollMs() const {
            long rm = remainingMs();
            return static_cast<int>(rm > static_cast<long>(INT_MAX) ? INT_MAX : rm);
        }

        bool expired() const { return remainingMs() <= 0; }

    private:
        struct timespec m_at;
    };

    enum class IoStatus {
        OK,
        CLOSED,
        TIMEOUT,
        FAILED
    };

    /// Owning TCP socket.  Move-only; closes on destruction.
    class TcpSocket {
    public:
        TcpSocket() : m_fd(-1) {}
        explicit TcpSocket(int fd) : m_fd(fd) {}
        ~TcpSocket() { close(); }

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        TcpSocket(TcpSocket &&other) : m_fd(other.m_fd) { other.m_fd = -1; }
        TcpSocket &operator=(TcpSocket &&other) {
            if (this != &other) {
                close();
                m_fd = other.m_fd;
                other.m_fd = -1;
            }
            return *this;
        }

        bool valid() const { return m_fd >= 0; }
        int fd() const { return m_fd; }

        void close() {
            if (m_fd >= 0) {
                ::close(m_fd);
                m_fd = -1;
            }
        }

        void shutdownWrite() {
            if (m_fd >= 0) ::shutdown(m_fd, SHUT_WR);
        }

        /// Connect to @p host:@p port within @p deadline.  On failure the
        /// returned socket is invalid and @p error describes why.
        ///
        /// @note getaddrinfo() is not bounded by the deadline.
        static TcpSocket connect(const std::string &host, int port, const Deadline &deadline, std::string &error) {
            struct addrinfo hints, *res = nullptr;
            std::memset(&hints, 0, sizeof(hints));
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_STREAM;
            std::string portStr = std::to_string(port);

            int gai = ::getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
            if (gai != 0 || !res) {
                error = std::string("cannot resolve ") + host + ": " + ::gai_strerror(gai);
                return TcpSocket();
            }
            struct AddrInfoGuard {
                struct addrinfo *p;
                explicit AddrInfoGuard(struct addrinfo *a) : p(a) {}
                ~AddrInfoGuard() { if (p) ::freeaddrinfo(p); }
                AddrInfoGuard(const AddrInfoGuard &) = delete;
                AddrInfoGuard &operator=(const AddrInfoGuard &) = delete;
            } guard(res);

            error = "connection refused";
            for (struct addrinfo *rp = res; rp; rp = rp->ai_next) {
                if (deadline.expired()) {
                    error = "connect timed out";
                    break;
                }
                int fd = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
                if (fd < 0) continue;
                TcpSocket sock(fd);
                ::fcntl(fd, F_SETFD, FD_CLOEXEC);

                int flags = ::fcntl(fd, F_GETFL, 0);
                if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) continue;

                if (::connect(fd, rp->ai_addr, rp->ai_addrlen) < 0) {
                    if (errno != EINPROGRESS) {
                        error = std::strerror(errno);
                        continue;
                    }
                    struct pollfd pfd;
                    pfd.fd = fd;
                    pfd.events = POLLOUT;
                    pfd.revents = 0;
                    int sel;
                    do {
                        if (deadline.expired()) { sel = 0; break; }
                        sel = ::poll(&pfd, 1, deadline.pollMs());
                    } while (sel < 0 && errno == EINTR);
                    if (sel <= 0) {
                        error = "connect timed out";
                        continue;
                    }
                    int soError = 0;
                    socklen_t len = sizeof(soError);
                    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &soError, &len) != 0 || soError != 0) {
                        error = std::strerror(soError != 0 ? soError : errno);
                        continue;
                    }
                }
#ifdef SO_NOSIGPIPE
                int one = 1;
                ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
                int nodelay = 1;
                ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
                error.clear();
                return sock;
            }
            return TcpSocket();
        }

        /// Write everything or fail; the socket stays non-blocking.
        IoStatus sendAll(const std::string &data, const Deadline &deadline) {
            size_t sent = 0;
            while (sent < data.size()) {
                ssize_t n = ::send(m_fd, data.data() + sent, data.size() - sent, HACKLOG_MSG_NOSIGNAL);
                if (n > 0) {
                    sent += static_cast<size_t>(n);
                    continue;
                }
                if (n < 0 && errno == EINTR) continue;
                if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                    IoStatus ready = waitFor(POLLOUT, deadline.pollMs());
                    if (ready != IoStatus::OK) return ready;
                    continue;
                }
                return IoStatus::FAILED;
            }
            return IoStatus::OK;
        }

        /// Read what is available, waiting at most @p timeoutMs (-1 forever).
        IoStatus recvSome(std::string &out, int timeoutMs) {
            IoStatus ready = waitFor(POLLIN, timeoutMs);
            if (ready != IoStatus::OK) return ready;
            char buf[8192];
            ssize_t n;
            do { n = ::recv(m_fd, buf, sizeof(buf), 0); } while (n < 0 && errno == EINTR);
            if (n > 0) {
                out.append(buf, static_cast<size_t>(n));
                return IoStatus::OK;
            }
            if (n == 0) return IoStatus::CLOSED;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return IoStatus::OK;
            return IoStatus::FAILED;
        }

    private:
        IoStatus waitFor(short events, int timeoutMs) {
            struct pollfd pfd;
            pfd.fd = m_fd;
            pfd.events = events;
            pfd.revents = 0;
            int pr;
            do { pr = ::poll(&pfd, 1, timeoutMs); } while (pr < 0 && errno == EINTR);
            if (pr == 0) return IoStatus::TIMEOUT;
            if (pr < 0) return IoStatus::FAILED;
            if (pfd.revents & POLLNVAL) return IoStatus::FAILED;
            return IoStatus::OK;
        }

        int m_fd;
    };

} // namespace hacklog

#endif // HACKLOG_SOCKET_HPP
