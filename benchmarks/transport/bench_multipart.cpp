/**
 * @file bench_multipart.cpp
 * @brief Benchmarks for multipart body encoding
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_delivery/transport/multipart.h>

#include "utils/benchmark_helpers.h"

namespace kcenon::file_delivery::benchmark {

static void BM_Multipart_ChunkBody(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto payload = generate_random_data(size, 5);

    for (auto _ : state) {
        multipart_builder form;
        form.add_file("chunk", "archive.bin", payload);
        form.add_field("chunkIndex", "3");
        form.add_field("totalChunks", "8");
        auto body = form.build();
        ::benchmark::DoNotOptimize(body.data());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Multipart_ChunkBody)
    ->Arg(sizes::min_chunk)
    ->Arg(sizes::medium_file)
    ->Arg(sizes::default_chunk)
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::file_delivery::benchmark
