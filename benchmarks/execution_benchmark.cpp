/**
 * @file execution_benchmark.cpp
 * @brief Parallel vs sequential block execution on SmallBank
 */

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include <tessera/tessera.hpp>

#include "execution/script_backend.hpp"
#include "workload/smallbank.hpp"

namespace {

constexpr size_t kBlockSize = 2000;

void SkipWithStatus(benchmark::State &state, const tessera::Status &status) {
    const std::string message = status.to_string();
    state.SkipWithError(message.c_str());
}

tessera::SmallBankOptions bank_options(int64_t skew_percent, bool with_hints) {
    tessera::SmallBankOptions options;
    options.account_count = 10000;
    options.skew = static_cast<double>(skew_percent) / 100.0;
    options.with_hints = with_hints;
    return options;
}

void report(benchmark::State &state, const tessera::BlockOutput &output) {
    state.counters["executions"] = static_cast<double>(output.metrics.executions);
    state.counters["validation_aborts"] =
        static_cast<double>(output.metrics.validation_aborts);
    state.counters["dependency_waits"] = static_cast<double>(output.metrics.dependency_waits);
    state.counters["depth"] = static_cast<double>(output.parallelism.depth);
}

// Args: workers, skew percent, early detection, rescheduling
static void BM_Tessera_Parallel(benchmark::State &state) {
    tessera::SmallBankWorkload workload(bank_options(state.range(1), state.range(3) != 0));
    auto prior = workload.initial_state();
    const tessera::Block block = workload.next_block(kBlockSize);

    tessera::EngineOptions options;
    options.worker_count = static_cast<size_t>(state.range(0));
    options.early_detection = state.range(2) != 0;
    options.enable_rescheduling = state.range(3) != 0;
    options.log_level = "warn";

    tessera::ScriptBackend backend;
    tessera::Engine engine(backend, *prior, options);
    tessera::BlockOutput output;

    for (auto _ : state) {
        auto status = engine.execute_block(block, &output);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(output.state_delta);
    }

    report(state, output);
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kBlockSize));
}

BENCHMARK(BM_Tessera_Parallel)
    ->ArgNames({"workers", "skew", "early", "resched"})
    ->ArgsProduct({{1, 4, 8}, {0, 90}, {0, 1}, {0, 1}})
    ->UseRealTime()
    ->Unit(benchmark::kMillisecond);

// Args: skew percent
static void BM_Tessera_Sequential(benchmark::State &state) {
    tessera::SmallBankWorkload workload(bank_options(state.range(0), false));
    auto prior = workload.initial_state();
    const tessera::Block block = workload.next_block(kBlockSize);

    tessera::EngineOptions options;
    options.log_level = "warn";

    tessera::ScriptBackend backend;
    tessera::Engine engine(backend, *prior, options);
    tessera::BlockOutput output;

    for (auto _ : state) {
        auto status = engine.execute_sequential(block, &output);
        if (!status.ok()) {
            SkipWithStatus(state, status);
            return;
        }
        benchmark::DoNotOptimize(output.state_delta);
    }

    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(kBlockSize));
}

BENCHMARK(BM_Tessera_Sequential)->Arg(0)->Arg(90)->Unit(benchmark::kMillisecond);

}  // namespace
