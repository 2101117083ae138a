#ifndef HACKLOG_STOP_CONTROLLER_HPP
#define HACKLOG_STOP_CONTROLLER_HPP

#include "time_util.hpp"
#include <atomic>
#include <cerrno>
#include <csignal>
#include <climits>
#include <cstdint>
#include <mutex>
#include <string>
#include <system_error>
#include <fcntl.h>
#include <unistd.h>

namespace hacklog {
namespace detail {

    inline volatile sig_atomic_t &sigintFlag() {
        static volatile sig_atomic_t s_flag = 0;
        return s_flag;
    }

    inline std::atomic<int> &sigintWakeFd() {
        static std::atomic<int> s_fd(-1);
        return s_fd;
    }

    inline void hacklogSigintHandler(int) {
        sigintFlag() = 1;
        int fd = sigintWakeFd().load(std::memory_order_relaxed);
        if (fd >= 0) {
            char byte = 'i';
            ssize_t ignored = ::write(fd, &byte, 1);
            (void)ignored;
        }
    }

} // namespace detail

    /// Shared cancellation state for one log session.
    ///
    /// The first requestStop() wins: its reason is kept and later requests
    /// are ignored, so e.g. `max_events` is never overwritten by a `timeout`
    /// that fires a moment later.  Sources add waitFd() to their poll set and
    /// wake as soon as a stop is requested from any thread, from a deadline,
    /// or from SIGINT.
    class StopController {
    public:
        StopController()
            : m_stopped(false)
            , m_deadlineMs(0)
            , m_hasDeadline(false) {
            if (::pipe(m_pipe) != 0) {
                throw std::system_error(errno, std::generic_category(), "pipe");
            }
            for (int i = 0; i < 2; ++i) {
                ::fcntl(m_pipe[i], F_SETFD, FD_CLOEXEC);
                int flags = ::fcntl(m_pipe[i], F_GETFL, 0);
                if (flags >= 0) ::fcntl(m_pipe[i], F_SETFL, flags | O_NONBLOCK);
            }
        }

        ~StopController() {
            int expected = m_pipe[1];
            detail::sigintWakeFd().compare_exchange_strong(expected, -1);
            ::close(m_pipe[0]);
            ::close(m_pipe[1]);
        }

        StopController(const StopController &) = delete;
        StopController &operator=(const StopController &) = delete;

        /// Returns true when this call was the one that stopped the session.
        bool requestStop(const std::string &reason) {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_stopped.load(std::memory_order_relaxed)) return false;
                m_reason = reason;
                m_stopped.store(true, std::memory_order_release);
            }
            wake();
            return true;
        }

        bool stopRequested() const {
            return m_stopped.load(std::memory_order_acquire);
        }

        /// Empty until a stop has been requested.
        std::string reason() const {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_reason;
        }

        /// Stop with @p reason once @p ms have elapsed from now.
        void setDeadlineAfter(int64_t ms, const std::string &reason) {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_deadlineMs = nowMs() + ms;
            m_deadlineReason = reason;
            m_hasDeadline = true;
        }

        /// Fire the deadline if it has passed and pick up a pending SIGINT.
        void check() {
            if (detail::sigintFlag() != 0 && detail::sigintWakeFd().load() == m_pipe[1]) {
                detail::sigintFlag() = 0;
                requestStop("closed");
            }
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (!m_hasDeadline || nowMs() < m_deadlineMs) return;
                m_hasDeadline = false;
                reason = m_deadlineReason;
            }
            requestStop(reason);
        }

        /// Poll timeout to use while waiting: the time left until the
        /// deadline, capped by @p capMs (-1 means no cap).
        int waitTimeoutMs(int capMs = -1) const {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_hasDeadline) return capMs;
            int64_t left = m_deadlineMs - nowMs();
            if (left < 0) left = 0;
            if (left > INT_MAX) left = INT_MAX;
            int leftMs = static_cast<int>(left);
            if (capMs >= 0 && capMs < leftMs) return capMs;
            return leftMs;
        }

        /// Read end of the wake-up pipe; readable once a stop is pending.
        int waitFd() const { return m_pipe[0]; }

        /// Consume pending wake-up bytes, then apply check().
        void drain() {
            char buf[64];
            while (::read(m_pipe[0], buf, sizeof(buf)) > 0) {}
            check();
        }

        /// Route SIGINT to this controller (stop reason "closed").
        void installSigintHandler() {
            detail::sigintWakeFd().store(m_pipe[1]);
            struct sigaction sa;
            sa.sa_handler = detail::hacklogSigintHandler;
            sigemptyset(&sa.sa_mask);
            sa.sa_flags = 0;
            ::sigaction(SIGINT, &sa, nullptr);
        }

    private:
        void wake() {
            char byte = 's';
            ssize_t n;
            do { n = ::write(m_pipe[1], &byte, 1); } while (n < 0 && errno == EINTR);
        }

        int m_pipe[2];
        mutable std::mutex m_mutex;
        std::atomic<bool> m_stopped;
        std::string m_reason;
        int64_t m_deadlineMs;
        bool m_hasDeadline;
        std::string m_deadlineReason;
    };

} // namespace hacklog

#endif // HACKLOG_STOP_CONTROLLER_HPP
