#include <gtest/gtest.h>
#include "hacklog.hpp"

#include <chrono>
#include <poll.h>
#include <thread>

class CollectorSinkTest : public ::testing::Test {
protected:
    hacklog::LogStreamContext ctx;

    hacklog::LogStreamEvent logEvent(const std::string &msg) {
        hacklog::LogEntry e;
        e.message = msg;
        e.raw = msg;
        return hacklog::makeLogEvent(ctx, e);
    }
};

TEST_F(CollectorSinkTest, MaxEventsStopsCollection) {
    hacklog::StopController stop;
    hacklog::CollectorSink sink(stop, hacklog::CollectorOptions().setMaxEvents(3).setMaxMs(0));

    sink.write(hacklog::makeStartEvent(ctx));
    sink.write(logEvent("a"));
    EXPECT_FALSE(stop.stopRequested());
    sink.write(logEvent("b"));
    EXPECT_TRUE(stop.stopRequested());
    EXPECT_EQ(stop.reason(), "max_events");

    sink.write(logEvent("c"));
    sink.write(hacklog::makeEndEvent(ctx, "max_events"));
    EXPECT_EQ(sink.count(), 3u);
}

TEST_F(CollectorSinkTest, SummaryShape) {
    hacklog::StopController stop;
    hacklog::CollectorSink sink(stop, hacklog::CollectorOptions().setMaxEvents(10).setMaxMs(0));
    sink.write(logEvent("a"));

    nlohmann::ordered_json s = sink.summary(0);
    ASSERT_TRUE(s["events"].is_array());
    EXPECT_EQ(s["events"].size(), 1u);
    EXPECT_EQ(s["events"][0]["entry"]["message"], "a");
    EXPECT_EQ(s["count"], 1);
    EXPECT_EQ(s["stop_reason"], "eof");
    EXPECT_GE(s["duration_ms"].get<int64_t>(), 0);
    EXPECT_EQ(s["exit_code"], 0);

    std::string line = hacklog::detail::dumpLine(s);
    EXPECT_EQ(line.rfind("{\"events\":", 0), 0u);
}

TEST_F(CollectorSinkTest, DeadlineRequestsTimeout) {
    hacklog::StopController stop;
    hacklog::CollectorSink sink(stop, hacklog::CollectorOptions().setMaxEvents(100).setMaxMs(20));
    EXPECT_LE(stop.waitTimeoutMs(), 20);

    std::this_thread::sleep_for(std::chrono::milliseconds(40));
    stop.check();
    EXPECT_TRUE(stop.stopRequested());
    EXPECT_EQ(sink.stopReason(), "timeout");
}

TEST(StopControllerTest, FirstStopWins) {
    hacklog::StopController stop;
    EXPECT_TRUE(stop.requestStop("max_events"));
    EXPECT_FALSE(stop.requestStop("timeout"));
    EXPECT_EQ(stop.reason(), "max_events");
}

TEST(StopControllerTest, WaitFdBecomesReadable) {
    hacklog::StopController stop;
    struct pollfd pfd;
    pfd.fd = stop.waitFd();
    pfd.events = POLLIN;
    pfd.revents = 0;
    EXPECT_EQ(::poll(&pfd, 1, 0), 0);

    std::thread t([&stop]() { stop.requestStop("closed"); });
    t.join();
    EXPECT_EQ(::poll(&pfd, 1, 1000), 1);
    stop.drain();
    EXPECT_EQ(stop.reason(), "closed");
}

TEST(StopControllerTest, WaitTimeoutRespectsCap) {
    hacklog::StopController stop;
    EXPECT_EQ(stop.waitTimeoutMs(), -1);
    EXPECT_EQ(stop.waitTimeoutMs(250), 250);
    stop.setDeadlineAfter(60000, "timeout");
    EXPECT_EQ(stop.waitTimeoutMs(250), 250);
    EXPECT_GT(stop.waitTimeoutMs(), 250);
}
