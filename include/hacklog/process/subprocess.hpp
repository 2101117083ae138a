#ifndef HACKLOG_SUBPROCESS_HPP
#define HACKLOG_SUBPROCESS_HPP

#include "../core/time_util.hpp"
#include <cerrno>
#include <climits>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <system_error>
#include <vector>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

namespace hacklog {

    /// Child process with piped stdout/stderr and stdin on /dev/null.
    ///
    /// argv goes straight to execvp, no shell is involved.  A child that
    /// cannot exec exits with 127.  The destructor kills and reaps a child
    /// that is still running.
    class Subprocess {
    public:
        Subprocess() : m_pid(-1), m_stdout(-1), m_stderr(-1), m_exited(false), m_exitCode(0) {}

        ~Subprocess() {
            closeStdout();
            closeStderr();
            if (m_pid > 0 && !m_exited) {
                ::kill(m_pid, SIGKILL);
                int status = 0;
                while (::waitpid(m_pid, &status, 0) < 0 && errno == EINTR) {}
            }
        }

        Subprocess(const Subprocess &) = delete;
        Subprocess &operator=(const Subprocess &) = delete;

        /// Throws std::system_error when the pipes or the fork fail.
        void spawn(const std::vector<std::string> &args, const std::string &cwd = std::string()) {
            if (args.empty()) throw std::invalid_argument("Subprocess: empty argv");

            std::vector<char *> argv;
            argv.reserve(args.size() + 1);
            for (const auto &a : args) argv.push_back(const_cast<char *>(a.c_str()));
            argv.push_back(nullptr);

            int outPipe[2];
            int errPipe[2];
            if (::pipe(outPipe) != 0) throw std::system_error(errno, std::generic_category(), "pipe");
            if (::pipe(errPipe) != 0) {
                int e = errno;
                ::close(outPipe[0]);
                ::close(outPipe[1]);
                throw std::system_error(e, std::generic_category(), "pipe");
            }
            ::fcntl(outPipe[0], F_SETFD, FD_CLOEXEC);
            ::fcntl(errPipe[0], F_SETFD, FD_CLOEXEC);

            pid_t pid = ::fork();
            if (pid < 0) {
                int e = errno;
                ::close(outPipe[0]);
                ::close(outPipe[1]);
                ::close(errPipe[0]);
                ::close(errPipe[1]);
                throw std::system_error(e, std::generic_category(), "fork");
            }

            if (pid == 0) {
                int devnull = ::open("/dev/null", O_RDONLY);
                if (devnull >= 0) {
                    ::dup2(devnull, STDIN_FILENO);
                    ::close(devnull);
                }
                ::dup2(outPipe[1], STDOUT_FILENO);
                ::dup2(errPipe[1], STDERR_FILENO);
                ::close(outPipe[0]);
                ::close(outPipe[1]);
                ::close(errPipe[0]);
                ::close(errPipe[1]);
                if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) _exit(127);
                ::signal(SIGINT, SIG_DFL);
                ::signal(SIGPIPE, SIG_DFL);
                ::execvp(argv[0], argv.data());
                _exit(127);
            }

            ::close(outPipe[1]);
            ::close(errPipe[1]);
            m_pid = pid;
            m_stdout = outPipe[0];
            m_stderr = errPipe[0];
            m_exited = false;
        }

        pid_t pid() const { return m_pid; }
        int stdoutFd() const { return m_stdout; }
        int stderrFd() const { return m_stderr; }

        void closeStdout() { closeFd(m_stdout); }
        void closeStderr() { closeFd(m_stderr); }

        bool running() const { return m_pid > 0 && !m_exited; }

        void signal(int sig) {
            if (running()) ::kill(m_pid, sig);
        }

        /// Non-blocking reap.  Returns true once the child has exited.
        bool tryWait() {
            if (m_pid <= 0) return true;
            if (m_exited) return true;
            int status = 0;
            pid_t w;
            do { w = ::waitpid(m_pid, &status, WNOHANG); } while (w < 0 && errno == EINTR);
            if (w == 0) return false;
            m_exited = true;
            m_exitCode = (w > 0) ? decodeStatus(status) : 1;
            return true;
        }

        /// Block until the child exits; returns its exit code, or 128+N when
        /// it was killed by signal N.
        int wait() {
            if (m_pid <= 0) return m_exitCode;
            if (m_exited) return m_exitCode;
            int status = 0;
            pid_t w;
            do { w = ::waitpid(m_pid, &status, 0); } while (w < 0 && errno == EINTR);
            m_exited = true;
            m_exitCode = (w > 0) ? decodeStatus(status) : 1;
            return m_exitCode;
        }

        /// SIGTERM, then SIGKILL if the child is still alive after @p graceMs.
        int terminate(int graceMs = 2000) {
            if (!running()) return wait();
            ::kill(m_pid, SIGTERM);
            int64_t deadline = nowMs() + graceMs;
            while (!tryWait()) {
                if (nowMs() >= deadline) {
                    ::kill(m_pid, SIGKILL);
                    return wait();
                }
                struct timespec ts = {0, 10000000L};
                nanosleep(&ts, nullptr);
            }
            return m_exitCode;
        }

        int exitCode() const { return m_exitCode; }

    private:
        static int decodeStatus(int status) {
            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return 1;
        }

        static void closeFd(int &fd) {
            if (fd >= 0) {
                ::close(fd);
                fd = -1;
            }
        }

        pid_t m_pid;
        int m_stdout;
        int m_stderr;
        bool m_exited;
        int m_exitCode;
    };

    struct CapturedOutput {
        int exitCode;
        std::string out;
        std::string err;
        bool timedOut;

        CapturedOutput() : exitCode(0), timedOut(false) {}
    };

    /// Run @p args to completion collecting both streams.  The child is
    /// terminated when @p timeoutMs elapses.
    inline CapturedOutput runAndCapture(const std::vector<std::string> &args, int timeoutMs) {
        CapturedOutput result;
        Subprocess proc;
        proc.spawn(args);
        int64_t deadline = nowMs() + timeoutMs;

        while (proc.stdoutFd() >= 0 || proc.stderrFd() >= 0) {
            int64_t left = deadline - nowMs();
            if (left <= 0) {
                result.timedOut = true;
                break;
            }
            struct pollfd fds[2];
            nfds_t n = 0;
            if (proc.stdoutFd() >= 0) fds[n++] = {proc.stdoutFd(), POLLIN, 0};
            if (proc.stderrFd() >= 0) fds[n++] = {proc.stderrFd(), POLLIN, 0};
            int pr = ::poll(fds, n, static_cast<int>(left > INT_MAX ? INT_MAX : left));
            if (pr < 0) {
                if (errno == EINTR) continue;
                break;
            }
            for (nfds_t i = 0; i < n; ++i) {
                if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                bool isOut = fds[i].fd == proc.stdoutFd();
                char buf[4096];
                ssize_t r = ::read(fds[i].fd, buf, sizeof(buf));
                if (r > 0) {
                    (isOut ? result.out : result.err).append(buf, static_cast<size_t>(r));
                } else if (r == 0 || errno != EINTR) {
                    if (isOut) proc.closeStdout(); else proc.closeStderr();
                }
            }
        }

        result.exitCode = result.timedOut ? proc.terminate(200) : proc.wait();
        return result;
    }

} // namespace hacklog

#endif // HACKLOG_SUBPROCESS_HPP
