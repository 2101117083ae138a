#ifndef HACKLOG_COMPOSE_LOG_SOURCE_HPP
#define HACKLOG_COMPOSE_LOG_SOURCE_HPP

#include "log_source.hpp"
#include "../core/diagnostics.hpp"
#include "../core/log_common.hpp"
#include "../parse/compose_line.hpp"
#include "../parse/line_reader.hpp"
#include "../parse/structured_grouper.hpp"
#include "../process/subprocess.hpp"
#include <cerrno>
#include <string>
#include <system_error>
#include <vector>
#include <poll.h>
#include <unistd.h>

namespace hacklog {

    /// Settings for ComposeLogSource.
    ///
    /// @code
    ///   ComposeSourceOptions opts;
    ///   opts.setComposeFile("/src/shop/.hack/docker-compose.yml")
    ///       .setProjectName("shop")
    ///       .setFollow(true)
    ///       .setTail(50);
    /// @endcode
    struct ComposeSourceOptions {
        /// Program and leading arguments; `logs` and its flags are appended.
        std::vector<std::string> command;
        std::string composeFile;
        std::string cwd;
        /// Name stripped from container prefixes and stamped on entries.
        std::string projectName;
        /// Passed as `-p`; empty to let the tool derive it.
        std::string composeProject;
        std::vector<std::string> profiles;
        std::string service;
        bool follow;
        int tail;
        int killGraceMs;

        ComposeSourceOptions()
            : command({"docker", "compose"})
            , follow(true)
            , tail(200)
            , killGraceMs(2000) {}

        ComposeSourceOptions &setCommand(const std::vector<std::string> &argv) {
            command = argv;
            return *this;
        }
        ComposeSourceOptions &setComposeFile(const std::string &path) {
            composeFile = path;
            return *this;
        }
        ComposeSourceOptions &setCwd(const std::string &dir) {
            cwd = dir;
            return *this;
        }
        ComposeSourceOptions &setProjectName(const std::string &name) {
            projectName = name;
            return *this;
        }
        ComposeSourceOptions &setComposeProject(const std::string &name) {
            composeProject = name;
            return *this;
        }
        ComposeSourceOptions &setProfiles(const std::vector<std::string> &p) {
            profiles = p;
            return *this;
        }
        ComposeSourceOptions &setService(const std::string &s) {
            service = s;
            return *this;
        }
        ComposeSourceOptions &setFollow(bool f) {
            follow = f;
            return *this;
        }
        ComposeSourceOptions &setTail(int n) {
            tail = n;
            return *this;
        }
        ComposeSourceOptions &setKillGraceMs(int ms) {
            killGraceMs = ms;
            return *this;
        }

        /// docker compose [-p P] [-f F] [--profile X]... logs [-f] --tail N
        ///   --timestamps --no-color [service]
        std::vector<std::string> buildArgv() const {
            std::vector<std::string> argv = command;
            if (!composeProject.empty()) {
                argv.push_back("-p");
                argv.push_back(composeProject);
            }
            if (!composeFile.empty()) {
                argv.push_back("-f");
                argv.push_back(composeFile);
            }
            for (const auto &p : profiles) {
                argv.push_back("--profile");
                argv.push_back(p);
            }
            argv.push_back("logs");
            if (follow) argv.push_back("-f");
            argv.push_back("--tail");
            argv.push_back(std::to_string(tail));
            argv.push_back("--timestamps");
            argv.push_back("--no-color");
            if (!service.empty()) argv.push_back(service);
            return argv;
        }
    };

    /// Streams `docker compose logs` output.
    ///
    /// stdout and stderr are drained independently, each through its own
    /// line reader and structured grouper, so there is no ordering between
    /// the two.  A stop kills the subprocess (SIGTERM, then SIGKILL after
    /// killGraceMs); JSON groups already buffered are still delivered.
    class ComposeLogSource : public ILogSource {
    public:
        explicit ComposeLogSource(ComposeSourceOptions opts)
            : m_opts(std::move(opts)) {}

        Backend backend() const override { return Backend::COMPOSE; }

        const ComposeSourceOptions &options() const { return m_opts; }

        SourceResult run(ISourceListener &listener, StopController &stop) override {
            Subprocess proc;
            std::vector<std::string> argv = m_opts.buildArgv();
            Diagnostics::global().debug("spawning: " + detail::join(argv, " "));
            try {
                proc.spawn(argv, m_opts.cwd);
            } catch (const std::system_error &e) {
                listener.onError(std::string("Failed to start ") + argv[0] + ": " + e.what());
                return SourceResult(1, "error");
            }

            listener.onStart();

            StreamState out(StreamKind::STDOUT, m_opts.projectName, listener);
            StreamState err(StreamKind::STDERR, m_opts.projectName, listener);

            bool stopped = false;
            while (proc.stdoutFd() >= 0 || proc.stderrFd() >= 0) {
                struct pollfd fds[3];
                nfds_t n = 0;
                fds[n++] = {stop.waitFd(), POLLIN, 0};
                if (proc.stdoutFd() >= 0) fds[n++] = {proc.stdoutFd(), POLLIN, 0};
                if (proc.stderrFd() >= 0) fds[n++] = {proc.stderrFd(), POLLIN, 0};

                int pr = ::poll(fds, n, stop.waitTimeoutMs());
                if (pr < 0 && errno != EINTR) break;

                stop.drain();
                if (stop.stopRequested()) {
                    stopped = true;
                    break;
                }
                if (pr <= 0) continue;

                for (nfds_t i = 1; i < n; ++i) {
                    if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                    if (fds[i].fd == proc.stdoutFd()) {
                        if (!readChunk(proc.stdoutFd(), out)) proc.closeStdout();
                    } else if (fds[i].fd == proc.stderrFd()) {
                        if (!readChunk(proc.stderrFd(), err)) proc.closeStderr();
                    }
                }
            }

            int code;
            if (stopped) {
                proc.closeStdout();
                proc.closeStderr();
                code = proc.terminate(m_opts.killGraceMs);
                Diagnostics::global().debug("compose logs stopped (exit " + std::to_string(code) + ")");
            } else {
                code = proc.wait();
            }

            out.finish();
            err.finish();

            if (stopped) return SourceResult(0, stop.reason());
            if (code == 127) {
                Diagnostics::global().error("Failed to run " + argv[0] + " (exit 127)");
            }
            return SourceResult(code, code == 0 ? "eof" : "exit:" + std::to_string(code));
        }

    private:
        /// Reader and grouper for one output stream.
        class StreamState {
        public:
            StreamState(StreamKind stream, const std::string &projectName, ISourceListener &listener)
                : m_stream(stream)
                , m_projectName(projectName)
                , m_listener(listener)
                , m_grouper([this](const std::vector<std::string> &lines) { deliver(lines); }) {}

            StreamState(const StreamState &) = delete;
            StreamState &operator=(const StreamState &) = delete;

            void feed(const char *data, size_t size) {
                m_reader.feed(data, size, [this](const std::string &line) { m_grouper.handleLine(line); });
            }

            void finish() {
                m_reader.finish([this](const std::string &line) { m_grouper.handleLine(line); });
                m_grouper.flush();
            }

        private:
            void deliver(const std::vector<std::string> &lines) {
                bool blank = true;
                for (const auto &l : lines) {
                    if (!detail::trim(l).empty()) {
                        blank = false;
                        break;
                    }
                }
                if (blank) return;
                m_listener.onEntry(parseComposeLogGroup(lines, m_stream, m_projectName));
            }

            StreamKind m_stream;
            std::string m_projectName;
            ISourceListener &m_listener;
            LineReader m_reader;
            StructuredLogGrouper m_grouper;
        };

        /// False at EOF or on a read error.
        static bool readChunk(int fd, StreamState &state) {
            char buf[8192];
            ssize_t r;
            do { r = ::read(fd, buf, sizeof(buf)); } while (r < 0 && errno == EINTR);
            if (r <= 0) return false;
            state.feed(buf, static_cast<size_t>(r));
            return true;
        }

        ComposeSourceOptions m_opts;
    };

} // namespace hacklog

#endif // HACKLOG_COMPOSE_LOG_SOURCE_HPP
