#include <gtest/gtest.h>
#include "hacklog.hpp"
#include "utils/test_utils.hpp"

#include <string>
#include <vector>

using hacklog::ComposeLogSource;
using hacklog::ComposeSourceOptions;

class ComposeLogSourceTest : public ::testing::Test {
protected:
    // The compose arguments appended after the script land in "$@".
    static ComposeSourceOptions scripted(const std::string &script) {
        ComposeSourceOptions opts;
        opts.setCommand({"/bin/sh", "-c", script, "sh"}).setProjectName("shop").setKillGraceMs(500);
        return opts;
    }
};

TEST_F(ComposeLogSourceTest, BuildsComposeArguments) {
    ComposeSourceOptions opts;
    opts.setComposeFile("/src/shop/.hack/docker-compose.yml")
        .setComposeProject("shop--feat")
        .setProfiles({"db", "jobs"})
        .setFollow(true)
        .setTail(50)
        .setService("api");
    std::vector<std::string> expected = {
        "docker", "compose", "-p", "shop--feat", "-f", "/src/shop/.hack/docker-compose.yml",
        "--profile", "db", "--profile", "jobs", "logs", "-f", "--tail", "50",
        "--timestamps", "--no-color", "api"
    };
    EXPECT_EQ(opts.buildArgv(), expected);
}

TEST_F(ComposeLogSourceTest, SnapshotArgumentsOmitFollow) {
    ComposeSourceOptions opts;
    opts.setFollow(false).setTail(0);
    std::vector<std::string> expected = {
        "docker", "compose", "logs", "--tail", "0", "--timestamps", "--no-color"
    };
    EXPECT_EQ(opts.buildArgv(), expected);
}

TEST_F(ComposeLogSourceTest, StreamsBothOutputs) {
    ComposeLogSource source(scripted(
        "printf 'shop-api-1  | 2025-12-30T03:30:48.866000000Z {\"level\":\"warn\",\"msg\":\"slow\"}\\n'; "
        "printf 'shop-worker-2  | boom\\n' >&2; "
        "exit 0"));
    hacklog::StopController stop;
    RecordingListener listener;

    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.reason, "eof");
    EXPECT_EQ(listener.started, 1);
    EXPECT_TRUE(listener.errors.empty());
    ASSERT_EQ(listener.entries.size(), 2u);

    const hacklog::LogEntry *api = nullptr;
    const hacklog::LogEntry *worker = nullptr;
    for (const auto &e : listener.entries) {
        if (e.service == "api") api = &e;
        if (e.service == "worker") worker = &e;
    }
    ASSERT_NE(api, nullptr);
    ASSERT_NE(worker, nullptr);

    EXPECT_EQ(api->source, hacklog::Backend::COMPOSE);
    EXPECT_EQ(api->project, "shop");
    EXPECT_EQ(api->instance, "1");
    EXPECT_EQ(api->stream, hacklog::StreamKind::STDOUT);
    EXPECT_EQ(api->timestamp, "2025-12-30T03:30:48.866000000Z");
    EXPECT_EQ(api->message, "slow");
    EXPECT_EQ(api->level, hacklog::LogLevel::WARN);

    EXPECT_EQ(worker->instance, "2");
    EXPECT_EQ(worker->stream, hacklog::StreamKind::STDERR);
    EXPECT_EQ(worker->level, hacklog::LogLevel::ERROR);
    EXPECT_EQ(worker->message, "boom");
}

TEST_F(ComposeLogSourceTest, ReassemblesPrettyJson) {
    ComposeLogSource source(scripted(
        "printf 'shop-api-1  | {\\n'; "
        "printf 'shop-api-1  |   \"level\": \"error\",\\n'; "
        "printf 'shop-api-1  |   \"msg\": \"bad\"\\n'; "
        "printf 'shop-api-1  | }\\n'"));
    hacklog::StopController stop;
    RecordingListener listener;

    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_EQ(result.reason, "eof");
    ASSERT_EQ(listener.entries.size(), 1u);
    EXPECT_EQ(listener.entries[0].message, "bad");
    EXPECT_EQ(listener.entries[0].level, hacklog::LogLevel::ERROR);
}

TEST_F(ComposeLogSourceTest, TrailingLineWithoutNewline) {
    ComposeLogSource source(scripted("printf 'shop-api-1  | last'"));
    hacklog::StopController stop;
    RecordingListener listener;
    source.run(listener, stop);
    ASSERT_EQ(listener.entries.size(), 1u);
    EXPECT_EQ(listener.entries[0].message, "last");
}

TEST_F(ComposeLogSourceTest, BlankLinesAreSkipped) {
    ComposeLogSource source(scripted("printf '\\n   \\nshop-api-1  | x\\n'"));
    hacklog::StopController stop;
    RecordingListener listener;
    source.run(listener, stop);
    ASSERT_EQ(listener.entries.size(), 1u);
    EXPECT_EQ(listener.entries[0].message, "x");
}

TEST_F(ComposeLogSourceTest, NonZeroExitReported) {
    ComposeLogSource source(scripted("echo 'no such service' >&2; exit 3"));
    hacklog::StopController stop;
    RecordingListener listener;
    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_EQ(result.exitCode, 3);
    EXPECT_EQ(result.reason, "exit:3");
    ASSERT_EQ(listener.entries.size(), 1u);
    EXPECT_EQ(listener.entries[0].stream, hacklog::StreamKind::STDERR);
}

TEST_F(ComposeLogSourceTest, MissingProgramExits127) {
    ComposeSourceOptions opts;
    opts.setCommand({"/nonexistent/hacklog-compose"});
    ComposeLogSource source(opts);
    hacklog::StopController stop;
    RecordingListener listener;
    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_EQ(result.exitCode, 127);
    EXPECT_EQ(result.reason, "exit:127");
}

TEST_F(ComposeLogSourceTest, StopKillsFollower) {
    ComposeLogSource source(scripted("printf 'shop-api-1  | one\\n'; exec sleep 30"));
    hacklog::StopController stop;
    RecordingListener listener(&stop, 1);

    int64_t started = hacklog::nowMs();
    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_LT(hacklog::nowMs() - started, 10000);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.reason, "max_events");
    ASSERT_EQ(listener.entries.size(), 1u);
    EXPECT_EQ(listener.entries[0].message, "one");
}

TEST_F(ComposeLogSourceTest, DeadlineStopsFollower) {
    ComposeLogSource source(scripted("exec sleep 30"));
    hacklog::StopController stop;
    stop.setDeadlineAfter(100, "timeout");
    RecordingListener listener;
    hacklog::SourceResult result = source.run(listener, stop);
    EXPECT_EQ(result.exitCode, 0);
    EXPECT_EQ(result.reason, "timeout");
    EXPECT_EQ(listener.started, 1);
    EXPECT_TRUE(listener.entries.empty());
}
