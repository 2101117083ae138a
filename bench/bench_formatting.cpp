#include <benchmark/benchmark.h>
#include <string>
#include "hacklog.hpp"
#include "null_transport.hpp"

namespace {

    hacklog::LogEntry sampleEntry() {
        hacklog::LogEntry e;
        e.source = hacklog::Backend::COMPOSE;
        e.message = "request done";
        e.raw = "shop-api-1  | {\"msg\":\"request done\"}";
        e.stream = hacklog::StreamKind::STDOUT;
        e.project = "shop";
        e.service = "api";
        e.instance = "1";
        e.timestamp = "2025-12-30T03:30:48.866Z";
        e.hasLevel = true;
        e.level = hacklog::LogLevel::INFO;
        e.fields["method"] = "GET";
        e.fields["status"] = "200";
        return e;
    }

} // namespace

// ---------------------------------------------------------------------------
// BM_JsonEvent
// One NDJSON `log` envelope.
// ---------------------------------------------------------------------------
static void BM_JsonEvent(benchmark::State& state) {
    hacklog::LogStreamContext ctx;
    ctx.project = "shop";
    hacklog::LogStreamEvent event = hacklog::makeLogEvent(ctx, sampleEntry());
    hacklog::JsonFormatter fmt;
    for (auto _ : state) {
        std::string line = fmt.format(event);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_JsonEvent);

// ---------------------------------------------------------------------------
// BM_PrettyEntry
// Human rendering with and without ANSI color.
// ---------------------------------------------------------------------------
static void BM_PrettyEntry(benchmark::State& state) {
    hacklog::PrettyFormatter fmt(state.range(0) != 0);
    hacklog::LogEntry entry = sampleEntry();
    for (auto _ : state) {
        std::string line = fmt.formatEntry(entry);
        benchmark::DoNotOptimize(line);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_PrettyEntry)->Arg(0)->Arg(1);

// ---------------------------------------------------------------------------
// BM_SessionDispatch
// Event construction plus fan-out through a sink with a discarding
// transport; isolates the pipeline cost from stdout.
// ---------------------------------------------------------------------------
static void BM_SessionDispatch(benchmark::State& state) {
    hacklog::StreamManager manager;
    std::unique_ptr<hacklog::ISink> sink = hacklog::detail::make_unique<hacklog::ConsoleSink>();
    sink->setTransport(hacklog::detail::make_unique<hacklog::NullTransport>());
    manager.addSink(std::move(sink));

    hacklog::LogStreamContext ctx;
    hacklog::LogEntry entry = sampleEntry();
    for (auto _ : state) {
        manager.dispatch(hacklog::makeLogEvent(ctx, entry));
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_SessionDispatch);
