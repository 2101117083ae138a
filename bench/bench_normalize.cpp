#include <benchmark/benchmark.h>
#include <map>
#include <string>
#include "hacklog.hpp"

// ---------------------------------------------------------------------------
// BM_ComposePlainLine
// Prefix split, timestamp strip and the plain-text payload path.
// ---------------------------------------------------------------------------
static void BM_ComposePlainLine(benchmark::State& state) {
    const std::string line = "shop-api-1  | 2025-12-30T03:30:48.866000000Z GET /api/users 200 12ms";
    for (auto _ : state) {
        hacklog::LogEntry e = hacklog::parseComposeLogLine(line, hacklog::StreamKind::STDOUT, "shop");
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComposePlainLine);

// ---------------------------------------------------------------------------
// BM_ComposeJsonLine
// Same line shape with a structured payload: JSON decode, level and
// message extraction, field rendering.
// ---------------------------------------------------------------------------
static void BM_ComposeJsonLine(benchmark::State& state) {
    const std::string line =
        "shop-api-1  | 2025-12-30T03:30:48.866000000Z "
        "{\"level\":30,\"time\":1767065448866,\"msg\":\"request done\",\"method\":\"GET\","
        "\"path\":\"/api/users\",\"status\":200,\"ms\":12.4}";
    for (auto _ : state) {
        hacklog::LogEntry e = hacklog::parseComposeLogLine(line, hacklog::StreamKind::STDOUT, "shop");
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ComposeJsonLine);

// ---------------------------------------------------------------------------
// BM_LokiLine
// Label promotion plus nanosecond timestamp conversion.
// ---------------------------------------------------------------------------
static void BM_LokiLine(benchmark::State& state) {
    std::map<std::string, std::string> labels;
    labels["project"] = "shop";
    labels["service"] = "api";
    labels["container"] = "shop-api-1";
    const std::string line = "{\"level\":\"warn\",\"message\":\"slow query\",\"ms\":812}";
    for (auto _ : state) {
        hacklog::LogEntry e = hacklog::parseLokiLogLine(labels, "1767065448866123456", line);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_LokiLine);
