/**
 * @file throughput_benchmark.cpp
 * @brief Throughput benchmarks for the worker pool
 */

#include <benchmark/benchmark.h>
#include <atomic>
#include <thread>
#include <vector>

#include "workerpool/workerpool.hpp"

using namespace workerpool;

namespace {

void spin_until(const std::atomic<std::int64_t>& counter, std::int64_t target) {
    while (counter.load(std::memory_order_acquire) < target) {
        std::this_thread::yield();
    }
}

} // namespace

static void BM_PoolSubmit(benchmark::State& state) {
    PoolConfig config;
    config.capacity = static_cast<int>(state.range(0));
    Pool pool(config);
    std::atomic<std::int64_t> done{0};

    std::int64_t submitted = 0;
    for (auto _ : state) {
        auto status = pool.submit([&done]() { done.fetch_add(1, std::memory_order_release); });
        benchmark::DoNotOptimize(status);
        submitted++;
    }
    spin_until(done, submitted);

    state.SetItemsProcessed(state.iterations());
    state.counters["workers"] = static_cast<double>(pool.metrics().workers_spawned);
}
BENCHMARK(BM_PoolSubmit)->Arg(1)->Arg(4)->Arg(64)->Arg(100000)->UseRealTime();

static void BM_ThreadPerTask(benchmark::State& state) {
    std::atomic<std::int64_t> done{0};

    for (auto _ : state) {
        std::thread t([&done]() { done.fetch_add(1, std::memory_order_release); });
        t.join();
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ThreadPerTask)->UseRealTime();

static void BM_PoolBatch(benchmark::State& state) {
    const auto batch = state.range(0);
    Pool pool;

    for (auto _ : state) {
        std::atomic<std::int64_t> done{0};
        for (std::int64_t i = 0; i < batch; i++) {
            auto status = pool.submit([&done]() { done.fetch_add(1, std::memory_order_release); });
            benchmark::DoNotOptimize(status);
        }
        spin_until(done, batch);
    }

    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_PoolBatch)->Arg(100)->Arg(1000)->UseRealTime();

static void BM_ThreadBatch(benchmark::State& state) {
    const auto batch = state.range(0);

    for (auto _ : state) {
        std::atomic<std::int64_t> done{0};
        std::vector<std::thread> threads;
        threads.reserve(static_cast<std::size_t>(batch));
        for (std::int64_t i = 0; i < batch; i++) {
            threads.emplace_back([&done]() { done.fetch_add(1, std::memory_order_release); });
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_ThreadBatch)->Arg(100)->Arg(1000)->UseRealTime();

BENCHMARK_MAIN();
