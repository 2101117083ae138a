#include <gtest/gtest.h>
#include "hacklog.hpp"
#include <nlohmann/json.hpp>
#include <regex>
#include <string>

class JsonFormatterTest : public ::testing::Test {
protected:
    hacklog::LogStreamContext context() {
        hacklog::LogStreamContext ctx;
        ctx.backend = hacklog::Backend::COMPOSE;
        ctx.project = "shop";
        ctx.services.push_back("api");
        ctx.follow = true;
        return ctx;
    }

    hacklog::LogEntry entry() {
        hacklog::LogEntry e;
        e.source = hacklog::Backend::COMPOSE;
        e.message = "hello";
        e.raw = "shop-api-1  | hello";
        e.stream = hacklog::StreamKind::STDOUT;
        e.project = "shop";
        e.service = "api";
        e.instance = "1";
        e.timestamp = "2025-12-30T03:30:48.866Z";
        return e;
    }
};

TEST_F(JsonFormatterTest, StartEventCarriesSessionContext) {
    hacklog::JsonFormatter fmt;
    std::string line = fmt.format(hacklog::makeStartEvent(context()));
    EXPECT_EQ(line.find('\n'), std::string::npos);

    nlohmann::json j = nlohmann::json::parse(line);
    EXPECT_EQ(j["type"], "start");
    EXPECT_EQ(j["backend"], "compose");
    EXPECT_EQ(j["project"], "shop");
    EXPECT_EQ(j["services"], nlohmann::json::array({"api"}));
    EXPECT_EQ(j["follow"], true);
    EXPECT_FALSE(j.contains("branch"));
    EXPECT_FALSE(j.contains("since"));

    std::regex tsRegex(R"([0-9]{4}-[0-9]{2}-[0-9]{2}T[0-9]{2}:[0-9]{2}:[0-9]{2}\.[0-9]{3}Z)");
    EXPECT_TRUE(std::regex_match(j["ts"].get<std::string>(), tsRegex));
}

TEST_F(JsonFormatterTest, TypeIsFirstMember) {
    hacklog::JsonFormatter fmt;
    std::string line = fmt.format(hacklog::makeEndEvent(context(), "eof"));
    EXPECT_EQ(line.rfind("{\"type\":\"end\"", 0), 0u);
}

TEST_F(JsonFormatterTest, LogEventUsesEntryTimestamp) {
    hacklog::JsonFormatter fmt;
    nlohmann::json j = nlohmann::json::parse(fmt.format(hacklog::makeLogEvent(context(), entry())));
    EXPECT_EQ(j["type"], "log");
    EXPECT_EQ(j["ts"], "2025-12-30T03:30:48.866Z");
    EXPECT_FALSE(j.contains("services"));
    EXPECT_FALSE(j.contains("follow"));

    const nlohmann::json &e = j["entry"];
    EXPECT_EQ(e["source"], "compose");
    EXPECT_EQ(e["message"], "hello");
    EXPECT_EQ(e["raw"], "shop-api-1  | hello");
    EXPECT_EQ(e["stream"], "stdout");
    EXPECT_EQ(e["service"], "api");
    EXPECT_EQ(e["instance"], "1");
    EXPECT_FALSE(e.contains("level"));
    EXPECT_FALSE(e.contains("fields"));
    EXPECT_FALSE(e.contains("labels"));
}

TEST_F(JsonFormatterTest, LevelFieldsAndLabels) {
    hacklog::LogEntry e = entry();
    e.source = hacklog::Backend::LOKI;
    e.stream = hacklog::StreamKind::NONE;
    e.hasLevel = true;
    e.level = hacklog::LogLevel::WARN;
    e.fields["user"] = "42";
    e.labels["service"] = "api";
    e.timestampNs = "1767065448866000000";

    nlohmann::json j = hacklog::entryToJson(e);
    EXPECT_EQ(j["source"], "loki");
    EXPECT_EQ(j["level"], "warn");
    EXPECT_EQ(j["fields"]["user"], "42");
    EXPECT_EQ(j["labels"]["service"], "api");
    EXPECT_EQ(j["timestamp_ns"], "1767065448866000000");
    EXPECT_FALSE(j.contains("stream"));
}

TEST_F(JsonFormatterTest, ErrorAndEndPayloads) {
    hacklog::JsonFormatter fmt;
    nlohmann::json err = nlohmann::json::parse(fmt.format(hacklog::makeErrorEvent(context(), "boom")));
    EXPECT_EQ(err["type"], "error");
    EXPECT_EQ(err["message"], "boom");

    nlohmann::json end = nlohmann::json::parse(fmt.format(hacklog::makeEndEvent(context(), "")));
    EXPECT_EQ(end["type"], "end");
    EXPECT_FALSE(end.contains("reason"));

    nlohmann::json closed = nlohmann::json::parse(fmt.format(hacklog::makeEndEvent(context(), "closed")));
    EXPECT_EQ(closed["reason"], "closed");
}

TEST_F(JsonFormatterTest, BranchAppearsOnEveryEvent) {
    hacklog::LogStreamContext ctx = context();
    ctx.branch = "feature";
    hacklog::JsonFormatter fmt;
    nlohmann::json j = nlohmann::json::parse(fmt.format(hacklog::makeErrorEvent(ctx, "x")));
    EXPECT_EQ(j["branch"], "feature");
}

TEST_F(JsonFormatterTest, EscapesControlCharacters) {
    hacklog::LogEntry e = entry();
    e.message = "He said \"hi\"\n\ttab";
    hacklog::JsonFormatter fmt;
    std::string line = fmt.format(hacklog::makeLogEvent(context(), e));
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_NE(line.find("He said \\\"hi\\\"\\n\\ttab"), std::string::npos);
}

TEST_F(JsonFormatterTest, InvalidUtf8IsReplaced) {
    hacklog::LogEntry e = entry();
    e.message = std::string("bad \xff byte");
    hacklog::JsonFormatter fmt;
    std::string line;
    EXPECT_NO_THROW(line = fmt.format(hacklog::makeLogEvent(context(), e)));
    EXPECT_TRUE(nlohmann::json::accept(line));
}

TEST_F(JsonFormatterTest, RawEntryFormatterSkipsLifecycle) {
    hacklog::RawEntryJsonFormatter fmt;
    EXPECT_EQ(fmt.format(hacklog::makeStartEvent(context())), "");
    EXPECT_EQ(fmt.format(hacklog::makeEndEvent(context(), "eof")), "");
    nlohmann::json j = nlohmann::json::parse(fmt.format(hacklog::makeLogEvent(context(), entry())));
    EXPECT_EQ(j["message"], "hello");
    EXPECT_FALSE(j.contains("type"));
}
