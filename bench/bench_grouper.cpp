#include <benchmark/benchmark.h>
#include <string>
#include <vector>
#include "hacklog.hpp"

// ---------------------------------------------------------------------------
// BM_GrouperPassThrough
// Plain lines that never open a buffer.
// ---------------------------------------------------------------------------
static void BM_GrouperPassThrough(benchmark::State& state) {
    size_t groups = 0;
    hacklog::StructuredLogGrouper grouper([&groups](const std::vector<std::string>&) { ++groups; });
    const std::string line = "api-1  | listening on :8080";
    for (auto _ : state) {
        grouper.handleLine(line);
    }
    benchmark::DoNotOptimize(groups);
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GrouperPassThrough);

// ---------------------------------------------------------------------------
// BM_GrouperPrettyObject
// A pretty-printed object of state.range(0) members reassembled and
// normalized as one entry.
// ---------------------------------------------------------------------------
static void BM_GrouperPrettyObject(benchmark::State& state) {
    std::vector<std::string> lines;
    lines.push_back("api-1  | {");
    for (int i = 0; i < state.range(0); ++i) {
        lines.push_back("api-1  |   \"k" + std::to_string(i) + "\": " + std::to_string(i) + ",");
    }
    lines.push_back("api-1  |   \"msg\": \"done\"");
    lines.push_back("api-1  | }");

    size_t entries = 0;
    hacklog::StructuredLogGrouper grouper([&entries](const std::vector<std::string>& group) {
        hacklog::LogEntry e = hacklog::parseComposeLogGroup(group, hacklog::StreamKind::STDOUT);
        benchmark::DoNotOptimize(e);
        ++entries;
    });
    for (auto _ : state) {
        for (const auto& l : lines) grouper.handleLine(l);
    }
    grouper.flush();
    state.SetItemsProcessed(static_cast<int64_t>(entries));
}
BENCHMARK(BM_GrouperPrettyObject)->Arg(4)->Arg(32)->Arg(256);
