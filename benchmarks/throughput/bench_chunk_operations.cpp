/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk reading and SHA-256 hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_delivery/core/checksum.h>
#include <kcenon/file_delivery/core/chunk_splitter.h>

#include "utils/benchmark_helpers.h"

#include <span>

namespace kcenon::file_delivery::benchmark {

static void BM_ChunkSplitter_Split(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files("split");
    auto test_file = temp_files.create_random_file("split_test.bin", file_size, 42);

    chunk_splitter splitter(chunk_config{chunk_size});

    for (auto _ : state) {
        auto iterator = splitter.split(test_file);
        if (!iterator) {
            state.SkipWithError("Failed to open chunk iterator");
            return;
        }

        while (iterator.value().has_next()) {
            auto piece = iterator.value().next();
            if (!piece) {
                state.SkipWithError("Failed to read chunk");
                return;
            }
            ::benchmark::DoNotOptimize(piece.value().data.data());
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((file_size + chunk_size - 1) / chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkSplitter_Split)
    ->Args({sizes::small_file, sizes::min_chunk})
    ->Args({sizes::medium_file, sizes::min_chunk})
    ->Args({sizes::large_file, sizes::default_chunk})
    ->Unit(::benchmark::kMillisecond);

static void BM_Checksum_Memory(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = generate_random_data(size, 7);
    auto bytes = std::as_bytes(std::span<const uint8_t>(data));

    for (auto _ : state) {
        auto digest = checksum::sha256(bytes);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_Memory)
    ->Arg(sizes::KB)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file);

static void BM_Checksum_File(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));

    temp_file_manager temp_files("sha");
    auto test_file = temp_files.create_random_file("hash_test.bin", size, 11);

    for (auto _ : state) {
        auto digest = checksum::sha256_file(test_file);
        if (!digest) {
            state.SkipWithError("Failed to hash file");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_File)
    ->Arg(sizes::small_file)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::large_file)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::file_delivery::benchmark
