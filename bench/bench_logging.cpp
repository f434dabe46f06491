#include <benchmark/benchmark.h>
#include "veil.hpp"
#include "null_sink.hpp"

static std::shared_ptr<veil::MaskingEngine> makeEngine() {
    return veil::MaskingConfiguration()
        .withBuiltinFormatters()
        .sensitiveField("cpf", veil::DataCategory::CPF)
        .sensitiveField("senha")
        .build();
}

// ---------------------------------------------------------------------------
// BM_Log_Unmasked
// Baseline: template rendering and one sink write, no masking.
// ---------------------------------------------------------------------------
static void BM_Log_Unmasked(benchmark::State& state) {
    veil::Logger logger(veil::LogLevel::TRACE);
    logger.addSink(veil::detail::make_unique<veil::NullSink>());

    for (auto _ : state) {
        logger.info("Customer {cpf} created order {id}", "12345678909", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_Unmasked);

// ---------------------------------------------------------------------------
// BM_Log_MaskingSink
// Message, each argument and the context sanitized separately.
// ---------------------------------------------------------------------------
static void BM_Log_MaskingSink(benchmark::State& state) {
    veil::Logger logger(veil::LogLevel::TRACE);
    logger.addMaskedSink(makeEngine(), veil::detail::make_unique<veil::NullSink>());
    logger.setContext("requestId", "r-123");

    for (auto _ : state) {
        logger.info("Customer {cpf} created order {id}", "12345678909", 42);
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_MaskingSink);

// ---------------------------------------------------------------------------
// BM_Layout_Masking
// Whole rendered line sanitized once by MaskingLayout.
// ---------------------------------------------------------------------------
static void BM_Layout_Masking(benchmark::State& state) {
    veil::MaskingLayout layout(veil::detail::make_unique<veil::JsonLayout>(), makeEngine());
    veil::LogEntry entry;
    entry.level = veil::LogLevel::INFO;
    entry.timestamp = std::chrono::system_clock::now();
    entry.message = "Customer 12345678909 created order 42";
    entry.arguments.emplace_back("cpf", "12345678909");
    entry.arguments.emplace_back("id", "42");

    for (auto _ : state) {
        benchmark::DoNotOptimize(layout.format(entry));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Layout_Masking);

// ---------------------------------------------------------------------------
// BM_Log_TraceDisabled
// Level gate rejects the call before any rendering or masking.
// ---------------------------------------------------------------------------
static void BM_Log_TraceDisabled(benchmark::State& state) {
    veil::Logger logger(veil::LogLevel::INFO);
    logger.addMaskedSink(makeEngine(), veil::detail::make_unique<veil::NullSink>());

    for (auto _ : state) {
        logger.trace("cpf {cpf}", "12345678909");
        benchmark::ClobberMemory();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Log_TraceDisabled);
