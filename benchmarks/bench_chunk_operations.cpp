/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunk checksums, persistence, assembly and full uploads
 */

#include <benchmark/benchmark.h>

#include <kcenon/chunked_upload/chunked_upload.h>
#include <kcenon/chunked_upload/core/logging.h>
#include <kcenon/chunked_upload/server/assembler.h>
#include <kcenon/chunked_upload/server/chunk_receiver.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <string>

namespace kcenon::chunked_upload::benchmark {

namespace {

auto random_data(std::size_t size, uint32_t seed) -> byte_buffer {
    byte_buffer data(size);
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

/**
 * @brief Scratch directory removed when the benchmark finishes
 */
class scratch_directory {
public:
    scratch_directory() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("chunked_upload_bench_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~scratch_directory() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    scratch_directory(const scratch_directory&) = delete;
    auto operator=(const scratch_directory&) -> scratch_directory& = delete;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
};

void quiet_logger() {
    get_logger().set_level(log_level::error);
}

}  // namespace

/**
 * @brief Planner lookup across the size tiers
 */
static void BM_PlanTransfer(::benchmark::State& state) {
    const auto size = static_cast<uint64_t>(state.range(0)) * MiB;
    for (auto _ : state) {
        auto plan = plan_transfer(size);
        ::benchmark::DoNotOptimize(plan);
    }
}

/**
 * @brief CRC32 of one chunk, computed by the client for every send
 */
static void BM_Crc32(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = random_data(size, 42);

    for (auto _ : state) {
        auto crc = checksum::crc32(data);
        ::benchmark::DoNotOptimize(crc);
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief SHA-256 of an assembled object
 */
static void BM_Sha256(::benchmark::State& state) {
    const auto size = static_cast<std::size_t>(state.range(0));
    auto data = random_data(size, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(data);
        if (!digest) {
            state.SkipWithError("SHA-256 failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(size) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Persisting chunks into a session temp area
 */
static void BM_ChunkReceiver_Put(::benchmark::State& state) {
    quiet_logger();
    const auto chunk_size = static_cast<std::size_t>(state.range(0));

    scratch_directory scratch;
    auto temp = std::make_shared<filesystem_temp_store>(scratch.path());
    auto registry = std::make_shared<session_registry>(temp);
    chunk_receiver receiver(registry, temp);

    auto session = registry->create("bench.bin", chunk_size * 64, "");
    if (!session) {
        state.SkipWithError("Failed to create session");
        return;
    }
    auto data = random_data(chunk_size, 7);
    auto crc = checksum::crc32(data);

    uint32_t index = 0;
    for (auto _ : state) {
        auto stored = receiver.put(session.value().session_id, index++ % 64, data, crc);
        if (!stored) {
            state.SkipWithError("Failed to store chunk");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(chunk_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Assembling stored chunks into the output object
 */
static void BM_Assembler_Finalize(::benchmark::State& state) {
    quiet_logger();
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));
    const auto chunks = static_cast<uint32_t>((object_size + chunk_size - 1) / chunk_size);

    scratch_directory scratch;
    auto temp = std::make_shared<filesystem_temp_store>(scratch.path() / "tmp");
    auto output = std::make_shared<filesystem_output_store>(scratch.path() / "out");
    auto registry = std::make_shared<session_registry>(temp);
    chunk_receiver receiver(registry, temp);
    assembler object_assembler(registry, temp, output);
    auto object = random_data(object_size, 11);

    for (auto _ : state) {
        state.PauseTiming();
        auto session = registry->create("bench.bin", object_size, "");
        if (!session) {
            state.SkipWithError("Failed to create session");
            return;
        }
        for (uint32_t i = 0; i < chunks; ++i) {
            auto offset = static_cast<std::size_t>(i) * chunk_size;
            auto length = std::min(chunk_size, object_size - offset);
            if (!receiver.put(session.value().session_id, i,
                              std::span<const std::byte>(object.data() + offset, length))) {
                state.SkipWithError("Failed to store chunk");
                return;
            }
        }
        state.ResumeTiming();

        auto done = object_assembler.finalize(session.value().session_id, chunks, "bench.bin");
        if (!done) {
            state.SkipWithError("Assembly failed");
            return;
        }
        ::benchmark::DoNotOptimize(done.value());
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Whole upload through client, scheduler and an in-process server
 */
static void BM_LocalUpload(::benchmark::State& state) {
    quiet_logger();
    const auto object_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<uint32_t>(state.range(1));

    scratch_directory scratch;
    auto server = upload_server::builder()
        .with_upload_directory(scratch.path() / "uploads")
        .with_recommended_chunk_size(chunk_size)
        .build();
    if (!server) {
        state.SkipWithError("Failed to create server");
        return;
    }
    auto client = upload_client::builder()
        .with_transport(std::make_shared<local_transport>(server.value()))
        .build();
    if (!client) {
        state.SkipWithError("Failed to create client");
        return;
    }
    auto source = std::make_shared<memory_chunk_source>(random_data(object_size, 13));

    for (auto _ : state) {
        auto done = client.value().upload(source, "bench.bin");
        if (!done) {
            state.SkipWithError(done.error().message.c_str());
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(object_size) *
                            static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_PlanTransfer)->Arg(10)->Arg(120)->Arg(1024)->Arg(20 * 1024);

BENCHMARK(BM_Crc32)
    ->Arg(64 * 1024)
    ->Arg(5 * 1024 * 1024)
    ->Arg(10 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Sha256)
    ->Arg(1024 * 1024)
    ->Arg(10 * 1024 * 1024)
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkReceiver_Put)
    ->Arg(64 * 1024)
    ->Arg(1024 * 1024)
    ->Arg(5 * 1024 * 1024)
    ->Unit(::benchmark::kMicrosecond);

BENCHMARK(BM_Assembler_Finalize)
    ->Args({10 * 1024 * 1024, 1024 * 1024})
    ->Args({50 * 1024 * 1024, 5 * 1024 * 1024})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_LocalUpload)
    ->Args({10 * 1024 * 1024, 1024 * 1024})
    ->Args({50 * 1024 * 1024, 5 * 1024 * 1024})
    ->Unit(::benchmark::kMillisecond)
    ->UseRealTime();

}  // namespace kcenon::chunked_upload::benchmark
