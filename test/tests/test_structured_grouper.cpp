#include <gtest/gtest.h>
#include "hacklog.hpp"
#include <nlohmann/json.hpp>

using Group = std::vector<std::string>;

class StructuredGrouperTest : public ::testing::Test {
protected:
    StructuredGrouperTest()
        : grouper([this](const Group &lines) { groups.push_back(lines); }) {}

    std::vector<Group> groups;
    hacklog::StructuredLogGrouper grouper;
};

TEST_F(StructuredGrouperTest, PlainLinesPassThrough) {
    grouper.handleLine("api | hello");
    grouper.handleLine("api | world");
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], Group{"api | hello"});
    EXPECT_EQ(groups[1], Group{"api | world"});
    EXPECT_EQ(grouper.openBuffers(), 0u);
}

TEST_F(StructuredGrouperTest, LinesWithoutPrefixAreEmittedImmediately) {
    grouper.handleLine("{");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], Group{"{"});
}

TEST_F(StructuredGrouperTest, CompleteSingleLineJsonIsNotBuffered) {
    grouper.handleLine(R"(api | {"msg":"x"})");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(grouper.openBuffers(), 0u);
}

TEST_F(StructuredGrouperTest, PrettyPrintedObjectIsReassembled) {
    Group lines = {
        "api-1 | 2025-12-30T03:30:48.866Z {",
        "api-1 | 2025-12-30T03:30:48.866Z   \"level\": \"info\",",
        "api-1 | 2025-12-30T03:30:48.866Z   \"msg\": \"hi\"",
        "api-1 | 2025-12-30T03:30:48.866Z }"
    };
    for (const auto &l : lines) grouper.handleLine(l);
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], lines);
    EXPECT_EQ(grouper.openBuffers(), 0u);
}

TEST_F(StructuredGrouperTest, ReassembledPayloadParsesLikeTheOriginalDocument) {
    nlohmann::json doc = {{"level", "warn"}, {"msg", "nested"}, {"ctx", {{"a", 1}, {"b", {"p", "q"}}}}};
    std::string pretty = doc.dump(2);
    size_t start = 0;
    while (start <= pretty.size()) {
        size_t nl = pretty.find('\n', start);
        if (nl == std::string::npos) nl = pretty.size();
        grouper.handleLine("worker | " + pretty.substr(start, nl - start));
        start = nl + 1;
    }
    ASSERT_EQ(groups.size(), 1u);
    hacklog::LogEntry e = hacklog::parseComposeLogGroup(groups[0], hacklog::StreamKind::STDOUT);
    EXPECT_EQ(e.message, "nested");
    EXPECT_EQ(e.level, hacklog::LogLevel::WARN);
}

TEST_F(StructuredGrouperTest, NonContinuationFlushesThenStartsFresh) {
    grouper.handleLine("api | {");
    grouper.handleLine("api |   \"a\": 1,");
    grouper.handleLine("api | plain line");
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0], (Group{"api | {", "api |   \"a\": 1,"}));
    EXPECT_EQ(groups[1], Group{"api | plain line"});
}

TEST_F(StructuredGrouperTest, NonContinuationThatOpensJsonStartsNewBuffer) {
    grouper.handleLine("api | [");
    grouper.handleLine("api | \"x\",");
    grouper.handleLine("api | 12");
    EXPECT_EQ(groups.size(), 2u);
    EXPECT_EQ(grouper.openBuffers(), 0u);

    grouper.handleLine("api | {");
    grouper.handleLine("api | oops");
    grouper.handleLine("api | {");
    EXPECT_EQ(grouper.openBuffers(), 1u);
    EXPECT_EQ(grouper.pendingLines("api"), 1u);
}

TEST_F(StructuredGrouperTest, KeysAreIndependent) {
    grouper.handleLine("api | {");
    grouper.handleLine("web | {");
    grouper.handleLine("api | }");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0], (Group{"api | {", "api | }"}));
    EXPECT_EQ(grouper.openBuffers(), 1u);
    EXPECT_EQ(grouper.pendingLines("web"), 1u);
}

TEST_F(StructuredGrouperTest, FlushEmitsOpenBuffersAtEnd) {
    grouper.handleLine("api | {");
    grouper.handleLine("api |   \"a\": 1");
    EXPECT_TRUE(groups.empty());
    grouper.flush();
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), 2u);
    EXPECT_EQ(grouper.openBuffers(), 0u);
}

TEST_F(StructuredGrouperTest, LineCapForcesFlush) {
    grouper.handleLine("api | {");
    for (size_t i = 1; i < hacklog::StructuredLogGrouper::MAX_LINES - 1; ++i) {
        grouper.handleLine("api | \"k\": 1,");
    }
    EXPECT_TRUE(groups.empty());
    EXPECT_EQ(grouper.pendingLines("api"), hacklog::StructuredLogGrouper::MAX_LINES - 1);

    grouper.handleLine("api | \"k\": 1,");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), hacklog::StructuredLogGrouper::MAX_LINES);
    EXPECT_EQ(grouper.openBuffers(), 0u);
}

TEST_F(StructuredGrouperTest, NeverClosingInputStaysBounded) {
    for (int i = 0; i < 1000; ++i) {
        if (i % 300 == 0) grouper.handleLine("api | {");
        grouper.handleLine("api | \"k\": \"v\",");
        EXPECT_LT(grouper.pendingLines("api"), hacklog::StructuredLogGrouper::MAX_LINES);
    }
    for (const auto &g : groups) {
        EXPECT_LE(g.size(), hacklog::StructuredLogGrouper::MAX_LINES);
    }
}

TEST_F(StructuredGrouperTest, CharCapForcesFlush) {
    std::string big(30000, 'x');
    grouper.handleLine("api | {");
    grouper.handleLine("api | \"a\": \"" + big + "\",");
    grouper.handleLine("api | \"b\": \"" + big + "\",");
    EXPECT_TRUE(groups.empty());
    grouper.handleLine("api | \"c\": \"" + big + "\",");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), 4u);
    EXPECT_EQ(grouper.pendingChars("api"), 0u);
}

TEST_F(StructuredGrouperTest, BlankPayloadCountsAsContinuation) {
    grouper.handleLine("api | {");
    grouper.handleLine("api | ");
    grouper.handleLine("api | }");
    ASSERT_EQ(groups.size(), 1u);
    EXPECT_EQ(groups[0].size(), 3u);
}

TEST_F(StructuredGrouperTest, EveryLineIsEmittedExactlyOnce) {
    Group input = {
        "api | start", "api | {", "web | hi", "api |   \"a\": [", "api |     1", "api | done", "web | {", "web | }"
    };
    for (const auto &l : input) grouper.handleLine(l);
    grouper.flush();
    size_t total = 0;
    for (const auto &g : groups) total += g.size();
    EXPECT_EQ(total, input.size());
}

TEST(JsonHeuristicsTest, StartAndContinuationShapes) {
    EXPECT_TRUE(hacklog::looksLikeJsonStart("{"));
    EXPECT_TRUE(hacklog::looksLikeJsonStart("[1,"));
    EXPECT_FALSE(hacklog::looksLikeJsonStart("}"));
    EXPECT_FALSE(hacklog::looksLikeJsonStart(""));

    EXPECT_TRUE(hacklog::looksLikeJsonContinuation(""));
    EXPECT_TRUE(hacklog::looksLikeJsonContinuation("\"key\": 1"));
    EXPECT_TRUE(hacklog::looksLikeJsonContinuation("},"));
    EXPECT_TRUE(hacklog::looksLikeJsonContinuation(", 3"));
    EXPECT_FALSE(hacklog::looksLikeJsonContinuation("text"));
}

TEST(JsonHeuristicsTest, CompletenessIsStrict) {
    EXPECT_TRUE(hacklog::isJsonComplete(std::vector<std::string>{"{", "\"a\": 1", "}"}));
    EXPECT_FALSE(hacklog::isJsonComplete(std::vector<std::string>{"{", "\"a\": 1"}));
    EXPECT_FALSE(hacklog::isJsonComplete(std::string("42")));
    EXPECT_FALSE(hacklog::isJsonComplete(std::string("")));
    EXPECT_TRUE(hacklog::isJsonComplete(std::string("[1, 2]")));
}
