/**
 * @file bench_transfer_state.cpp
 * @brief Benchmarks for transfer_state membership edits and cursor moves
 */

#include <benchmark/benchmark.h>

#include <kcenon/media_relay/core/transfer_state.h>

#include <string>
#include <vector>

namespace kcenon::media_relay::benchmark {

namespace {

constexpr uint64_t file_size = 64 * 1024 * 1024;
constexpr uint64_t chunk_size = 512 * 1024;

auto make_files(std::size_t count) -> std::vector<media_file> {
    std::vector<media_file> files;
    files.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        media_file file;
        file.name = "clip_" + std::to_string(i) + ".mp4";
        file.size = file_size;
        files.push_back(std::move(file));
    }
    return files;
}

}  // namespace

/**
 * @brief Queue a batch of files onto an empty leg
 */
static void BM_TransferState_AddPending(::benchmark::State& state) {
    transfer_state::mutation m;
    m.add_pending = make_files(static_cast<std::size_t>(state.range(0)));

    for (auto _ : state) {
        transfer_state leg;
        leg.apply(m);
        ::benchmark::DoNotOptimize(leg.total_bytes());
    }

    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Remove one file from a large set
 */
static void BM_TransferState_RemoveOne(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    transfer_state::mutation add;
    add.add_pending = make_files(count);

    transfer_state::mutation remove;
    remove.remove.push_back("clip_" + std::to_string(count / 2) + ".mp4");

    for (auto _ : state) {
        state.PauseTiming();
        transfer_state leg;
        leg.apply(add);
        state.ResumeTiming();

        auto removed = leg.apply(remove);
        ::benchmark::DoNotOptimize(removed);
    }
}

/**
 * @brief Promote waiting upload entries as their downloads land
 */
static void BM_TransferState_PromoteWaiting(::benchmark::State& state) {
    const auto count = static_cast<std::size_t>(state.range(0));
    auto files = make_files(count);

    transfer_state::mutation wait;
    for (const auto& file : files) {
        wait.add_waiting.push_back({file.name, file.size});
    }

    for (auto _ : state) {
        state.PauseTiming();
        transfer_state leg;
        leg.apply(wait);
        state.ResumeTiming();

        for (const auto& file : files) {
            transfer_state::mutation promote;
            promote.move_waiting_to_pending.push_back(file);
            leg.apply(promote);
        }
        ::benchmark::DoNotOptimize(leg.pending().size());
    }

    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Walk the cursor through every chunk of a set and complete each file
 */
static void BM_TransferState_CursorWalk(::benchmark::State& state) {
    transfer_state::mutation m;
    m.add_pending = make_files(static_cast<std::size_t>(state.range(0)));
    const uint64_t chunks_per_file = file_size / chunk_size;

    for (auto _ : state) {
        state.PauseTiming();
        transfer_state leg;
        leg.apply(m);
        state.ResumeTiming();

        while (leg.select_cursor() != nullptr) {
            for (uint64_t i = 0; i < chunks_per_file; ++i) {
                leg.advance_cursor(chunk_size);
            }
            leg.complete_current();
        }
        ::benchmark::DoNotOptimize(leg.transferred_bytes());
    }

    state.SetItemsProcessed(state.range(0) * static_cast<int64_t>(chunks_per_file) *
                            static_cast<int64_t>(state.iterations()));
}

// ============================================================================
// Benchmark Registrations
// ============================================================================

BENCHMARK(BM_TransferState_AddPending)
    ->Arg(10)
    ->Arg(100)
    ->Arg(1000);

BENCHMARK(BM_TransferState_RemoveOne)
    ->Arg(100)
    ->Arg(1000);

BENCHMARK(BM_TransferState_PromoteWaiting)
    ->Arg(10)
    ->Arg(100);

BENCHMARK(BM_TransferState_CursorWalk)
    ->Arg(1)
    ->Arg(16);

}  // namespace kcenon::media_relay::benchmark
