#include <benchmark/benchmark.h>
#include <string>
#include "veil.hpp"

static veil::EngineConfig benchConfig(bool autoDetect) {
    veil::EngineConfig config;
    config.autoDetect = autoDetect;
    config.addField(veil::SensitiveFieldConfig("cpf", veil::DataCategory::CPF));
    config.addField(veil::SensitiveFieldConfig("email", veil::DataCategory::EMAIL));
    config.addField(veil::SensitiveFieldConfig("telefone").visible(2, 3));
    config.addField(veil::SensitiveFieldConfig("senha"));
    return config;
}

// ---------------------------------------------------------------------------
// BM_Sanitize_Clean
// Text with nothing to mask.  Every field pattern and every category
// pattern still runs once over the whole line.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Clean(benchmark::State& state) {
    veil::MaskingEngine engine;
    engine.configure(benchConfig(true));
    const std::string line = "GET /api/v1/orders status=200 elapsed=12ms";

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.sanitize(line));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Clean);

// ---------------------------------------------------------------------------
// BM_Sanitize_Json
// A JSON payload with three configured keys.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Json(benchmark::State& state) {
    veil::MaskingEngine engine;
    engine.configure(benchConfig(false));
    const std::string line =
        R"({"cpf": "12345678909", "email": "joao@empresa.com", "telefone": "11987654321", "status": "ok"})";

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.sanitize(line));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Json);

// ---------------------------------------------------------------------------
// BM_Sanitize_AutoDetect
// Bare values found only by the category pass.
// ---------------------------------------------------------------------------
static void BM_Sanitize_AutoDetect(benchmark::State& state) {
    veil::MaskingEngine engine;
    engine.configure(benchConfig(true));
    const std::string line = "client 10.0.0.12 customer 12345678909 mail joao@empresa.com";

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine.sanitize(line));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_AutoDetect);

// ---------------------------------------------------------------------------
// BM_Sanitize_Formatters
// Same payload as BM_Sanitize_Json with the bundled formatters registered.
// ---------------------------------------------------------------------------
static void BM_Sanitize_Formatters(benchmark::State& state) {
    auto engine = veil::MaskingConfiguration()
        .withBuiltinFormatters()
        .useConfig(benchConfig(false))
        .build();
    const std::string line =
        R"({"cpf": "12345678909", "email": "joao@empresa.com", "telefone": "11987654321", "status": "ok"})";

    for (auto _ : state) {
        benchmark::DoNotOptimize(engine->sanitize(line));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_Formatters);

// ---------------------------------------------------------------------------
// BM_Configure
// Cost of compiling and publishing a configuration.
// ---------------------------------------------------------------------------
static void BM_Configure(benchmark::State& state) {
    veil::MaskingEngine engine;
    const veil::EngineConfig config = benchConfig(true);

    for (auto _ : state) {
        engine.configure(config);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Configure);

// ---------------------------------------------------------------------------
// BM_Sanitize_MultiThread
// Readers share one engine; no lock is taken while matching.
// ---------------------------------------------------------------------------
static veil::MaskingEngine g_sharedEngine;

static void BM_Sanitize_MultiThread(benchmark::State& state) {
    if (state.thread_index() == 0) {
        g_sharedEngine.configure(benchConfig(true));
    }
    const std::string line = "login cpf=12345678909 senha=hunter2";

    for (auto _ : state) {
        benchmark::DoNotOptimize(g_sharedEngine.sanitize(line));
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sanitize_MultiThread)->Threads(1)->Threads(4);
