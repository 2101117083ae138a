#include <gtest/gtest.h>
#include "hacklog.hpp"

#include <string>

using hacklog::LogsArgs;
using hacklog::LogsPlan;
using hacklog::UsageError;

class LogsOptionsTest : public ::testing::Test {
protected:
    static constexpr int64_t kNow = 1735787045000LL;

    static std::string usageMessage(const LogsArgs &args) {
        try {
            hacklog::planLogs(args, kNow);
        } catch (const UsageError &e) {
            return e.what();
        }
        return std::string();
    }
};

TEST_F(LogsOptionsTest, Defaults) {
    LogsArgs args;
    LogsPlan plan = hacklog::planLogs(args, kNow);
    EXPECT_TRUE(plan.follow);
    EXPECT_EQ(plan.tail, 200);
    EXPECT_FALSE(plan.forceCompose);
    EXPECT_FALSE(plan.wantsLokiExplicit);
    EXPECT_FALSE(plan.hasStart);
    EXPECT_FALSE(plan.hasEnd);
    EXPECT_TRUE(plan.lokiServices.empty());
}

TEST_F(LogsOptionsTest, LokiOnlyFlagsImplyExplicitLoki) {
    LogsArgs args;
    args.hasQuery = true;
    EXPECT_TRUE(hacklog::planLogs(args, kNow).wantsLokiExplicit);

    args = LogsArgs();
    args.hasServices = true;
    EXPECT_TRUE(hacklog::planLogs(args, kNow).wantsLokiExplicit);

    args = LogsArgs();
    args.hasSince = true;
    args.since = "15m";
    LogsPlan plan = hacklog::planLogs(args, kNow);
    EXPECT_TRUE(plan.wantsLokiExplicit);
    ASSERT_TRUE(plan.hasStart);
    EXPECT_EQ(plan.startMs, kNow - 900000);
}

TEST_F(LogsOptionsTest, ComposeConflictsWithLokiFlags) {
    LogsArgs args;
    args.compose = true;
    args.loki = true;
    EXPECT_EQ(usageMessage(args), "Cannot combine --compose with --loki/--services/--query/--since/--until.");

    args.loki = false;
    args.hasUntil = true;
    EXPECT_EQ(usageMessage(args), "Cannot combine --compose with --loki/--services/--query/--since/--until.");

    args.hasUntil = false;
    EXPECT_EQ(usageMessage(args), "");
}

TEST_F(LogsOptionsTest, JsonConflictsWithPretty) {
    LogsArgs args;
    args.json = true;
    args.pretty = true;
    EXPECT_EQ(usageMessage(args), "Cannot combine --json with --pretty.");
}

TEST_F(LogsOptionsTest, NegativeTail) {
    LogsArgs args;
    args.tail = -1;
    EXPECT_EQ(usageMessage(args), "Invalid --tail: -1");
}

TEST_F(LogsOptionsTest, InvalidTimeValue) {
    LogsArgs args;
    args.hasSince = true;
    args.since = "yesterday";
    EXPECT_EQ(usageMessage(args), "Invalid --since: \"yesterday\" (expected RFC3339 or duration like 15m)");

    args = LogsArgs();
    args.noFollow = true;
    args.hasUntil = true;
    args.until = "soon";
    EXPECT_EQ(usageMessage(args), "Invalid --until: \"soon\" (expected RFC3339 or duration like 15m)");
}

TEST_F(LogsOptionsTest, BlankTimeValueIsIgnored) {
    LogsArgs args;
    args.hasSince = true;
    args.since = "  ";
    LogsPlan plan = hacklog::planLogs(args, kNow);
    EXPECT_FALSE(plan.hasStart);
    EXPECT_TRUE(plan.wantsLokiExplicit);
}

TEST_F(LogsOptionsTest, SinceAfterUntil) {
    LogsArgs args;
    args.noFollow = true;
    args.hasSince = true;
    args.since = "5m";
    args.hasUntil = true;
    args.until = "10m";
    EXPECT_EQ(usageMessage(args), "--since must be before --until.");

    args.since = "10m";
    args.until = "5m";
    LogsPlan plan = hacklog::planLogs(args, kNow);
    EXPECT_EQ(plan.endMs - plan.startMs, 300000);
}

TEST_F(LogsOptionsTest, UntilRequiresSnapshot) {
    LogsArgs args;
    args.hasUntil = true;
    args.until = "now";
    EXPECT_EQ(usageMessage(args), "Cannot combine --until with --follow.");
    args.noFollow = true;
    EXPECT_EQ(usageMessage(args), "");
}

TEST_F(LogsOptionsTest, ServicesMergeWithPositional) {
    LogsArgs args;
    args.service = "api";
    args.hasServices = true;
    args.services = "web, api ,web,,worker";
    LogsPlan plan = hacklog::planLogs(args, kNow);
    std::vector<std::string> expected = {"web", "api", "worker"};
    EXPECT_EQ(plan.lokiServices, expected);

    args.services = "web";
    plan = hacklog::planLogs(args, kNow);
    expected = {"web", "api"};
    EXPECT_EQ(plan.lokiServices, expected);
}

TEST_F(LogsOptionsTest, ProfilesAreSplit) {
    LogsArgs args;
    args.profiles = {"db,jobs", "jobs", "metrics"};
    LogsPlan plan = hacklog::planLogs(args, kNow);
    std::vector<std::string> expected = {"db", "jobs", "jobs", "metrics"};
    EXPECT_EQ(plan.profiles, expected);
}

TEST_F(LogsOptionsTest, QueryResolution) {
    LogsArgs args;
    args.service = "api";
    LogsPlan plan = hacklog::planLogs(args, kNow);
    EXPECT_EQ(hacklog::resolveLokiQuery(args, plan, "shop"), "{project=\"shop\",service=\"api\"}");

    args.hasQuery = true;
    args.query = "  {job=\"x\"} |= \"err\" ";
    EXPECT_EQ(hacklog::resolveLokiQuery(args, plan, "shop"), "{job=\"x\"} |= \"err\"");

    args.query = "   ";
    EXPECT_EQ(hacklog::resolveLokiQuery(args, plan, "shop"), "{project=\"shop\",service=\"api\"}");
}

TEST_F(LogsOptionsTest, ContextPerBackend) {
    LogsArgs args;
    args.service = "api";
    args.hasServices = true;
    args.services = "web";
    args.branch = "feat";
    args.noFollow = true;
    args.hasSince = true;
    args.since = "1h";
    LogsPlan plan = hacklog::planLogs(args, kNow);

    hacklog::LogStreamContext loki = hacklog::makeLogsContext(args, plan, hacklog::Backend::LOKI, "shop--feat");
    EXPECT_EQ(loki.backend, hacklog::Backend::LOKI);
    EXPECT_EQ(loki.project, "shop--feat");
    EXPECT_EQ(loki.branch, "feat");
    EXPECT_FALSE(loki.follow);
    EXPECT_EQ(loki.since, "1h");
    EXPECT_EQ(loki.services, (std::vector<std::string>{"web", "api"}));

    hacklog::LogStreamContext compose = hacklog::makeLogsContext(args, plan, hacklog::Backend::COMPOSE, "shop--feat");
    EXPECT_EQ(compose.services, (std::vector<std::string>{"api"}));
}
