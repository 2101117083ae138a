#ifndef HACKLOG_CONFIG_HPP
#define HACKLOG_CONFIG_HPP

#include "errors.hpp"
#include "log_common.hpp"
#include "log_entry.hpp"
#include "../net/url.hpp"
#include <nlohmann/json.hpp>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>
#include <sys/stat.h>

namespace hacklog {

    /// `logs` section of hack.config.json.
    struct LogsConfig {
        bool present;
        Backend followBackend;
        Backend snapshotBackend;
        bool clearOnDown;
        std::string retentionPeriod;

        LogsConfig()
            : present(false)
            , followBackend(Backend::COMPOSE)
            , snapshotBackend(Backend::LOKI)
            , clearOnDown(false) {}
    };

    struct ProjectConfig {
        std::string path;
        std::string name;
        LogsConfig logs;
        /// Set when the file exists but could not be decoded; defaults apply.
        std::string parseError;
    };

    /// Process environment relevant to log sessions.
    struct EnvironmentConfig {
        std::string lokiUrl;
        int readyTimeoutMs;

        EnvironmentConfig()
            : lokiUrl("http://127.0.0.1:3100")
            , readyTimeoutMs(800) {}

        EnvironmentConfig &setLokiUrl(const std::string &url) {
            lokiUrl = normalizeBaseUrl(url);
            return *this;
        }
        EnvironmentConfig &setReadyTimeoutMs(int ms) {
            readyTimeoutMs = ms;
            return *this;
        }

        static EnvironmentConfig fromEnvironment();
    };

    inline bool parseBackendName(const std::string &raw, Backend &out) {
        std::string v = detail::trim(raw);
        if (v == "compose") {
            out = Backend::COMPOSE;
            return true;
        }
        if (v == "loki") {
            out = Backend::LOKI;
            return true;
        }
        return false;
    }

    /// Leading positive integer of @p raw, else @p fallback.
    inline int parseTimeoutMs(const char *raw, int fallback) {
        if (!raw) return fallback;
        errno = 0;
        char *end = nullptr;
        long v = std::strtol(raw, &end, 10);
        if (end == raw || errno == ERANGE || v <= 0 || v > INT_MAX) return fallback;
        return static_cast<int>(v);
    }

    inline EnvironmentConfig EnvironmentConfig::fromEnvironment() {
        EnvironmentConfig env;
        const char *url = std::getenv("HACK_LOKI_URL");
        env.setLokiUrl(url ? url : "");
        env.setReadyTimeoutMs(parseTimeoutMs(std::getenv("HACK_LOKI_READY_TIMEOUT_MS"), 800));
        return env;
    }

    /// Decode hack.config.json text.  Never throws: malformed JSON or a
    /// non-object root leaves defaults in place and records parseError.
    /// Unknown backend names count as not set.
    inline ProjectConfig parseProjectConfig(const std::string &text, const std::string &path) {
        ProjectConfig cfg;
        cfg.path = path;

        nlohmann::json root = nlohmann::json::parse(text, nullptr, false);
        if (root.is_discarded()) {
            cfg.parseError = "invalid JSON";
            return cfg;
        }
        if (!root.is_object()) {
            cfg.parseError = "expected a JSON object";
            return cfg;
        }

        auto name = root.find("name");
        if (name != root.end() && name->is_string()) {
            cfg.name = detail::trim(name->get<std::string>());
        }

        auto logs = root.find("logs");
        if (logs == root.end() || !logs->is_object()) return cfg;
        cfg.logs.present = true;

        auto follow = logs->find("follow_backend");
        if (follow != logs->end() && follow->is_string()) {
            parseBackendName(follow->get<std::string>(), cfg.logs.followBackend);
        }
        auto snapshot = logs->find("snapshot_backend");
        if (snapshot != logs->end() && snapshot->is_string()) {
            parseBackendName(snapshot->get<std::string>(), cfg.logs.snapshotBackend);
        }
        auto clear = logs->find("clear_on_down");
        if (clear != logs->end() && clear->is_boolean()) {
            cfg.logs.clearOnDown = clear->get<bool>();
        }
        auto retention = logs->find("retention_period");
        if (retention != logs->end() && retention->is_string()) {
            cfg.logs.retentionPeriod = detail::trim(retention->get<std::string>());
        }
        return cfg;
    }

    /// Load @p path.  A missing file yields defaults; a file that exists but
    /// cannot be read throws ConfigError.
    inline ProjectConfig loadProjectConfig(const std::string &path) {
        struct stat st;
        if (::stat(path.c_str(), &st) != 0) {
            ProjectConfig cfg;
            cfg.path = path;
            return cfg;
        }
        if (S_ISDIR(st.st_mode)) throw ConfigError(path, "is a directory");

        std::ifstream in(path.c_str(), std::ios::in | std::ios::binary);
        if (!in) throw ConfigError(path, std::strerror(errno));
        std::ostringstream ss;
        ss << in.rdbuf();
        return parseProjectConfig(ss.str(), path);
    }

    inline std::string projectConfigPath(const std::string &projectDir) {
        std::string dir = projectDir.empty() ? "." : projectDir;
        if (dir.back() != '/') dir += '/';
        return dir + "hack.config.json";
    }

    /// Last path component of @p dir, ignoring trailing slashes.
    inline std::string directoryBaseName(const std::string &dir) {
        std::string d = dir;
        while (d.size() > 1 && d.back() == '/') d.pop_back();
        size_t slash = d.rfind('/');
        return slash == std::string::npos ? d : d.substr(slash + 1);
    }

    /// "<name>" or "<name>--<branch>".  An explicit override beats the
    /// configured name, which beats the directory name.
    inline std::string resolveProjectName(const std::string &nameOverride,
                                          const ProjectConfig &cfg,
                                          const std::string &projectDir,
                                          const std::string &branch) {
        std::string base = detail::trim(nameOverride);
        if (base.empty()) base = cfg.name;
        if (base.empty()) base = directoryBaseName(projectDir);
        if (branch.empty() || base.empty()) return base;
        return base + "--" + branch;
    }

} // namespace hacklog

#endif // HACKLOG_CONFIG_HPP
