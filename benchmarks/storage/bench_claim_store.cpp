/**
 * @file bench_claim_store.cpp
 * @brief Benchmarks for rename-based claiming
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_delivery/storage/claim_store.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::file_delivery::benchmark {

static void BM_ClaimStore_ClaimUnclaim(::benchmark::State& state) {
    temp_file_manager temp_files("claim");
    auto inbox = temp_files.base_dir() / "inbox";
    auto source = temp_files.create_random_file("inbox/cycle.bin", sizes::KB, 3);

    claim_store store(claim_store_config{inbox, temp_files.base_dir() / "processed"});

    for (auto _ : state) {
        auto claimed = store.claim(source);
        if (!claimed) {
            state.SkipWithError("Claim lost");
            return;
        }
        auto back = store.unclaim(*claimed);
        if (!back) {
            state.SkipWithError("Unclaim failed");
            return;
        }
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ClaimStore_ClaimUnclaim);

static void BM_ClaimStore_ListCandidates(::benchmark::State& state) {
    const auto count = static_cast<int>(state.range(0));

    temp_file_manager temp_files("list");
    for (int i = 0; i < count; ++i) {
        temp_files.create_random_file("inbox/file_" + std::to_string(i) + ".bin", 16,
                                      static_cast<uint32_t>(i + 1));
    }

    claim_store store(claim_store_config{temp_files.base_dir() / "inbox",
                                         temp_files.base_dir() / "processed"});

    for (auto _ : state) {
        auto candidates = store.list_candidates();
        if (!candidates) {
            state.SkipWithError("Listing failed");
            return;
        }
        ::benchmark::DoNotOptimize(candidates.value().data());
    }

    state.SetItemsProcessed(static_cast<int64_t>(count) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ClaimStore_ListCandidates)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ClaimStore_UniqueDestination(::benchmark::State& state) {
    const auto taken = static_cast<int>(state.range(0));

    temp_file_manager temp_files("unique");
    temp_files.create_file("report.pdf", {});
    for (int i = 1; i <= taken; ++i) {
        temp_files.create_file("report (" + std::to_string(i) + ").pdf", {});
    }

    for (auto _ : state) {
        auto destination = claim_store::unique_destination(temp_files.base_dir(), "report.pdf");
        ::benchmark::DoNotOptimize(destination);
    }
}

BENCHMARK(BM_ClaimStore_UniqueDestination)->Arg(0)->Arg(10)->Arg(100);

}  // namespace kcenon::file_delivery::benchmark
