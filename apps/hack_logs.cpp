#include "hacklog.hpp"

#include <CLI/CLI.hpp>
#include <cerrno>
#include <climits>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

using namespace hacklog;

namespace {

    struct LogsCommand {
        LogsArgs args;
        std::string project;
        std::string path;
        std::string config;
        std::string composeFile;
        bool verbose = false;
        bool rawEntries = false;
        bool collect = false;
        size_t maxEvents = 200;
        int64_t maxMs = 5000;
        bool clear = false;
        bool prune = false;
        std::string retention;
    };

    std::string absolutePath(const std::string &path) {
        std::string p = path.empty() ? "." : path;
        char buf[PATH_MAX];
        if (::realpath(p.c_str(), buf) != nullptr) return buf;
        if (!p.empty() && p[0] == '/') return p;
        if (::getcwd(buf, sizeof(buf)) == nullptr) return p;
        return std::string(buf) + "/" + p;
    }

    std::string parentDirectory(const std::string &file) {
        size_t slash = file.rfind('/');
        if (slash == std::string::npos) return ".";
        if (slash == 0) return "/";
        return file.substr(0, slash);
    }

    int runMaintenance(const LogsCommand &cmd, const EnvironmentConfig &env,
                       const ProjectConfig &cfg, const std::string &projectName) {
        LokiClient client(env.lokiUrl);
        std::string selector = buildLogSelector(projectName, std::vector<std::string>());
        MaintenanceResult result;
        if (cmd.clear) {
            result = clearProjectLogs(client, selector, nowMs(), env.readyTimeoutMs);
        } else {
            std::string retention = detail::trim(cmd.retention);
            if (retention.empty()) retention = cfg.logs.retentionPeriod;
            if (retention.empty()) {
                throw UsageError("--prune needs --retention or logs.retention_period in " + cfg.path);
            }
            result = pruneProjectLogs(client, selector, retention, cfg.path, nowMs(), env.readyTimeoutMs);
        }
        if (result.status == MaintenanceResult::Status::DONE) std::cout << result.message << std::endl;
        return result.ok() ? 0 : 1;
    }

    int runLogs(const LogsCommand &cmd) {
        LogsPlan plan = planLogs(cmd.args, nowMs());
        if (cmd.rawEntries && !cmd.args.json) throw UsageError("--raw-entries requires --json.");
        if (cmd.collect && !cmd.args.json) throw UsageError("--max-events/--max-ms require --json.");
        if (cmd.collect && cmd.rawEntries) throw UsageError("Cannot combine --raw-entries with --max-events/--max-ms.");
        if (cmd.clear && cmd.prune) throw UsageError("Cannot combine --clear with --prune.");

        Diagnostics &diag = Diagnostics::global();
        if (cmd.verbose && !diag.isEnabled(LogLevel::DEBUG)) diag.setMinLevel(LogLevel::INFO);

        EnvironmentConfig env = EnvironmentConfig::fromEnvironment();
        std::string root = absolutePath(cmd.path);
        std::string projectDir = root + "/.hack";
        std::string configPath = cmd.config.empty() ? projectConfigPath(projectDir) : cmd.config;

        ProjectConfig cfg = loadProjectConfig(configPath);
        if (!cfg.parseError.empty()) {
            diag.warn("Failed to parse " + configPath + ": " + cfg.parseError);
        }
        std::string projectName = resolveProjectName(cmd.project, cfg, root, plan.branch);

        if (cmd.clear || cmd.prune) return runMaintenance(cmd, env, cfg, projectName);

        BackendRequest req;
        req.forceCompose = plan.forceCompose;
        req.wantsLokiExplicit = plan.wantsLokiExplicit;
        req.follow = plan.follow;
        req.followBackend = cfg.logs.followBackend;
        req.snapshotBackend = cfg.logs.snapshotBackend;
        BackendChoice choice = selectBackend(req, [&env]() {
            return LokiClient(env.lokiUrl).isReady(env.readyTimeoutMs);
        });
        if (choice.probed && !choice.reachable) {
            diag.info("Loki is not reachable at " + env.lokiUrl + "; using docker compose logs");
        }
        diag.debug(std::string("backend: ") + getBackendName(choice.backend));

        StopController stop;
        stop.installSigintHandler();

        StreamManager manager;
        CollectorSink *collector = nullptr;
        if (cmd.collect) {
            CollectorOptions copts;
            copts.setMaxEvents(cmd.maxEvents).setMaxMs(cmd.maxMs);
            std::unique_ptr<CollectorSink> sink = detail::make_unique<CollectorSink>(stop, copts);
            collector = sink.get();
            manager.addSink(std::move(sink));
        } else if (cmd.args.json) {
            manager.addSink(detail::make_unique<ConsoleSink>(cmd.rawEntries));
        } else {
            manager.addSink(detail::make_unique<PrettyConsoleSink>());
        }

        std::unique_ptr<ILogSource> source;
        if (choice.backend == Backend::LOKI) {
            LokiSourceOptions opts;
            opts.setBaseUrl(env.lokiUrl)
                .setQuery(resolveLokiQuery(cmd.args, plan, projectName))
                .setFollow(plan.follow)
                .setTail(plan.tail);
            if (plan.hasStart) opts.setStartMs(plan.startMs);
            if (plan.hasEnd) opts.setEndMs(plan.endMs);
            source = detail::make_unique<LokiLogSource>(opts);
        } else {
            std::string composeFile = cmd.composeFile.empty() ? projectDir + "/docker-compose.yml" : absolutePath(cmd.composeFile);
            ComposeSourceOptions opts;
            opts.setComposeFile(composeFile)
                .setCwd(parentDirectory(composeFile))
                .setProjectName(projectName)
                .setProfiles(plan.profiles)
                .setService(plan.service)
                .setFollow(plan.follow)
                .setTail(plan.tail);
            if (!plan.branch.empty()) opts.setComposeProject(projectName);
            source = detail::make_unique<ComposeLogSource>(opts);
        }

        LogSession session(makeLogsContext(cmd.args, plan, choice.backend, projectName), manager);
        int code = session.run(*source, stop);

        if (choice.backend == Backend::LOKI && session.errored()) {
            std::cerr << "Tip: run `hack global install` (or `hack global up`) and ensure Loki is reachable." << std::endl;
        }
        if (collector != nullptr) {
            std::cout << detail::dumpLine(collector->summary(code)) << std::endl;
        }
        return code;
    }

    int runLogPipe(const std::string &formatRaw, const std::string &streamRaw) {
        std::string format = detail::trim(formatRaw);
        if (format != "auto" && format != "docker-compose" && format != "plain") {
            throw UsageError("Invalid --format: " + format);
        }
        std::string streamName = detail::trim(streamRaw);
        if (streamName != "stdout" && streamName != "stderr") {
            throw UsageError("Invalid --stream: " + streamName);
        }
        if (isStdinTty()) {
            std::cerr << "No stdin detected. Pipe logs into this command." << std::endl;
            return 1;
        }

        StreamKind stream = streamName == "stderr" ? StreamKind::STDERR : StreamKind::STDOUT;
        bool splitPrefix = format != "plain";
        PrettyConsoleSink sink;
        LogStreamContext ctx;
        LineReader reader;
        LineReader::LineCallback onLine = [&](const std::string &line) {
            sink.write(makeLogEvent(ctx, parseComposeLogLine(line, stream, std::string(), splitPrefix)));
        };

        char buf[8192];
        for (;;) {
            ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
            if (n < 0 && errno == EINTR) continue;
            if (n < 0) throw std::system_error(errno, std::generic_category(), "read stdin");
            if (n == 0) break;
            reader.feed(buf, static_cast<size_t>(n), onLine);
        }
        reader.finish(onLine);
        return 0;
    }

} // namespace

int main(int argc, char **argv) {
    CLI::App app{"hack-logs: stream project logs from docker compose or Loki"};
    app.require_subcommand(1);

    LogsCommand logs;
    auto logsCmd = app.add_subcommand("logs", "Show logs for the project's services");
    logsCmd->add_option("service", logs.args.service, "Only this service");
    logsCmd->add_flag("--json", logs.args.json, "Emit NDJSON stream events");
    logsCmd->add_flag("--pretty", logs.args.pretty, "Human-readable output (default)");
    logsCmd->add_flag("--loki", logs.args.loki, "Force the Loki backend");
    logsCmd->add_flag("--compose", logs.args.compose, "Force docker compose logs");
    logsCmd->add_flag("--no-follow", logs.args.noFollow, "Print a snapshot and exit");
    logsCmd->add_option("--tail", logs.args.tail, "Lines of history (default: 200)");
    auto sinceOpt = logsCmd->add_option("--since", logs.args.since, "Start: RFC3339 or duration like 15m (Loki)");
    auto untilOpt = logsCmd->add_option("--until", logs.args.until, "End: RFC3339 or duration (Loki, snapshot only)");
    auto servicesOpt = logsCmd->add_option("--services", logs.args.services, "Comma-separated services (Loki)");
    auto queryOpt = logsCmd->add_option("--query", logs.args.query, "Raw LogQL selector (Loki)");
    logsCmd->add_option("--profile", logs.args.profiles, "Compose profile(s), comma-separated or repeated");
    logsCmd->add_option("--branch", logs.args.branch, "Branch instance name");
    logsCmd->add_option("--project", logs.project, "Project name override");
    logsCmd->add_option("--path", logs.path, "Project root (default: current directory)");
    logsCmd->add_option("--config", logs.config, "Path to hack.config.json");
    logsCmd->add_option("--compose-file", logs.composeFile, "Compose file (default: .hack/docker-compose.yml)");
    logsCmd->add_flag("-v,--verbose", logs.verbose, "Print diagnostic notes to stderr");
    logsCmd->add_flag("--raw-entries", logs.rawEntries, "With --json, print bare entries without the event envelope");
    auto maxEventsOpt = logsCmd->add_option("--max-events", logs.maxEvents, "With --json, collect up to N events and print a summary");
    auto maxMsOpt = logsCmd->add_option("--max-ms", logs.maxMs, "With --json, collect for at most M milliseconds");
    logsCmd->add_flag("--clear", logs.clear, "Delete this project's logs from Loki");
    logsCmd->add_flag("--prune", logs.prune, "Delete this project's Loki logs older than the retention period");
    logsCmd->add_option("--retention", logs.retention, "Retention for --prune (default: logs.retention_period)");

    std::string pipeFormat = "auto";
    std::string pipeStream = "stdout";
    auto pipeCmd = app.add_subcommand("log-pipe", "Read log lines from stdin and pretty-print them");
    pipeCmd->add_option("--format", pipeFormat, "auto, docker-compose or plain (default: auto)");
    pipeCmd->add_option("--stream", pipeStream, "stdout or stderr; stderr forces ERROR and writes to stderr");

    CLI11_PARSE(app, argc, argv);

    logs.args.hasSince = sinceOpt->count() > 0;
    logs.args.hasUntil = untilOpt->count() > 0;
    logs.args.hasServices = servicesOpt->count() > 0;
    logs.args.hasQuery = queryOpt->count() > 0;
    logs.collect = maxEventsOpt->count() > 0 || maxMsOpt->count() > 0;

    try {
        if (logsCmd->parsed()) return runLogs(logs);
        if (pipeCmd->parsed()) return runLogPipe(pipeFormat, pipeStream);
    } catch (const std::exception &e) {
        std::cerr << "error: " << e.what() << std::endl;
        return 1;
    }
    std::cout << app.help() << std::endl;
    return 0;
}
