/**
 * @file bench_chunk_stream.cpp
 * @brief Benchmarks for chunk stream splitting and chunk digests
 */

#include <benchmark/benchmark.h>

#include <chunk_relay/core/byte_source.h>
#include <chunk_relay/core/checksum.h>
#include <chunk_relay/core/chunk_stream.h>

#include "utils/benchmark_helpers.h"

#include <memory>

namespace chunk_relay::benchmark {

namespace {

/**
 * @brief Drain a stream, returning false if it failed
 */
auto drain(chunk_stream& stream) -> bool {
    while (true) {
        auto item = stream.next();
        if (!item) {
            return false;
        }
        if (!item.value()) {
            return true;
        }
        ::benchmark::DoNotOptimize(item.value()->data.data());
    }
}

}  // namespace

/**
 * @brief Split an in-memory object into chunks
 */
static void BM_ChunkStream_Memory(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    const auto data = generate_random_data(object_size, 42);

    for (auto _ : state) {
        state.PauseTiming();
        auto source = std::make_unique<memory_source>(data);
        auto stream = chunk_stream::create(std::move(source), chunk_config(chunk_size));
        state.ResumeTiming();

        if (!stream || !drain(*stream.value())) {
            state.SkipWithError("Chunk stream failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
    state.SetItemsProcessed(static_cast<int64_t>((object_size + chunk_size - 1) / chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkStream_Memory)
    ->Args({sizes::small_object, sizes::small_chunk})
    ->Args({sizes::medium_object, sizes::small_chunk})
    ->Args({sizes::medium_object, sizes::default_chunk})
    ->Args({sizes::large_object, sizes::large_chunk})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Split a file on disk into chunks
 */
static void BM_ChunkStream_File(::benchmark::State& state) {
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto path = temp_files.create_random_file("stream_source.bin", object_size, 42);

    for (auto _ : state) {
        auto source = stream_source::open_file(path);
        if (!source) {
            state.SkipWithError("Failed to open source file");
            return;
        }
        auto stream = chunk_stream::create(std::move(source.value()), chunk_config(chunk_size));
        if (!stream || !drain(*stream.value())) {
            state.SkipWithError("Chunk stream failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkStream_File)
    ->Args({sizes::medium_object, sizes::default_chunk})
    ->Args({sizes::large_object, sizes::large_chunk})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Split with per-chunk digests enabled
 */
static void BM_ChunkStream_Integrity(::benchmark::State& state) {
    const auto algorithm = static_cast<checksum_algorithm>(state.range(0));
    const auto data = generate_random_data(sizes::medium_object, 42);

    chunk_config config(sizes::default_chunk);
    config.verify_integrity = true;
    config.algorithm = algorithm;

    for (auto _ : state) {
        state.PauseTiming();
        auto stream = chunk_stream::create(std::make_unique<memory_source>(data), config);
        state.ResumeTiming();

        if (!stream || !drain(*stream.value())) {
            state.SkipWithError("Chunk stream failed");
            return;
        }
    }

    state.SetLabel(std::string(to_string(algorithm)));
    state.SetBytesProcessed(static_cast<int64_t>(sizes::medium_object) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_ChunkStream_Integrity)
    ->Arg(static_cast<int64_t>(checksum_algorithm::crc32))
    ->Arg(static_cast<int64_t>(checksum_algorithm::sha256))
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Raw digest throughput on one chunk
 */
static void BM_Checksum_Compute(::benchmark::State& state) {
    const auto algorithm = static_cast<checksum_algorithm>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    const auto data = generate_random_data(chunk_size, 7);

    for (auto _ : state) {
        auto digest = checksum::compute(algorithm, data);
        ::benchmark::DoNotOptimize(digest);
    }

    state.SetLabel(std::string(to_string(algorithm)));
    state.SetBytesProcessed(static_cast<int64_t>(chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_Checksum_Compute)
    ->Args({static_cast<int64_t>(checksum_algorithm::crc32), sizes::small_chunk})
    ->Args({static_cast<int64_t>(checksum_algorithm::crc32), sizes::default_chunk})
    ->Args({static_cast<int64_t>(checksum_algorithm::sha256), sizes::small_chunk})
    ->Args({static_cast<int64_t>(checksum_algorithm::sha256), sizes::default_chunk});

}  // namespace chunk_relay::benchmark
