/**
 * @file latency_benchmark.cpp
 * @brief Submit-to-run latency for warm and cold workers
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "workerpool/workerpool.hpp"

using namespace workerpool;

namespace {

using BenchClock = std::chrono::steady_clock;

// Submits one task and reports the time until it starts running.
double time_to_start(Pool& pool) {
    std::atomic<bool> started{false};
    BenchClock::time_point ran_at;

    auto submitted_at = BenchClock::now();
    auto status = pool.submit([&]() {
        ran_at = BenchClock::now();
        started.store(true, std::memory_order_release);
    });
    if (status != Status::Ok) {
        return 0.0;
    }
    while (!started.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }
    return std::chrono::duration<double>(ran_at - submitted_at).count();
}

} // namespace

// A parked worker is always available, so every submit is an idle handoff.
static void BM_IdleHandoffLatency(benchmark::State& state) {
    Pool pool;
    time_to_start(pool);

    for (auto _ : state) {
        state.PauseTiming();
        while (pool.idle() == 0) {
            std::this_thread::yield();
        }
        state.ResumeTiming();

        state.SetIterationTime(time_to_start(pool));
    }

    state.counters["handoffs"] = static_cast<double>(pool.metrics().idle_handoffs);
}
BENCHMARK(BM_IdleHandoffLatency)->UseManualTime();

// Each iteration waits for the reaper to retire the only worker, so every
// submit starts a new thread. Reaping runs at most every 100ms.
static void BM_ColdStartLatency(benchmark::State& state) {
    PoolConfig config;
    config.capacity = 1;
    config.survival_time = std::chrono::milliseconds(1);
    Pool pool(config);

    for (auto _ : state) {
        state.PauseTiming();
        while (pool.len() != 0) {
            std::this_thread::yield();
        }
        state.ResumeTiming();

        state.SetIterationTime(time_to_start(pool));
    }

    state.counters["spawned"] = static_cast<double>(pool.metrics().workers_spawned);
}
BENCHMARK(BM_ColdStartLatency)->UseManualTime()->Iterations(30);

BENCHMARK_MAIN();
