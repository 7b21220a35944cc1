/**
 * @file pool_test.cpp
 * @brief Unit tests for Pool admission, reuse, capacity and shutdown
 */

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "workerpool/workerpool.hpp"
#include "test_util.hpp"

using namespace workerpool;
using workerpool::testing::Gate;
using workerpool::testing::OpenOnExit;
using workerpool::testing::eventually;

class PoolTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}

    static PoolConfig config_with_capacity(int capacity) {
        PoolConfig config;
        config.capacity = capacity;
        config.name = "test";
        return config;
    }
};

TEST_F(PoolTest, DefaultConfig) {
    Pool pool;

    EXPECT_EQ(pool.cap(), DEFAULT_CAPACITY);
    EXPECT_EQ(pool.len(), 0);
    EXPECT_EQ(pool.free(), DEFAULT_CAPACITY);
    EXPECT_EQ(pool.idle(), 0);
    EXPECT_FALSE(pool.is_closed());
}

TEST_F(PoolTest, NegativeCapacityUsesDefault) {
    Pool pool(config_with_capacity(-1));

    EXPECT_EQ(pool.cap(), DEFAULT_CAPACITY);
    EXPECT_EQ(pool.free(), DEFAULT_CAPACITY);
}

TEST_F(PoolTest, UserCapacity) {
    Pool pool(config_with_capacity(10000));

    EXPECT_EQ(pool.cap(), 10000);
    EXPECT_EQ(pool.len(), 0);
    EXPECT_EQ(pool.free(), 10000);
}

TEST_F(PoolTest, ConfigNormalization) {
    PoolConfig config;
    config.survival_time = std::chrono::milliseconds(0);
    config.mini_cleanup_interval = std::chrono::milliseconds(5);

    auto normalized = config.normalized();
    EXPECT_EQ(normalized.survival_time, DEFAULT_SURVIVAL_TIME);
    EXPECT_EQ(normalized.mini_cleanup_interval, MIN_CLEANUP_INTERVAL);

    Pool pool(config);
    EXPECT_EQ(pool.config().mini_cleanup_interval, MIN_CLEANUP_INTERVAL);
}

TEST_F(PoolTest, EmptyTaskRejected) {
    Pool pool;

    EXPECT_EQ(pool.submit(Task{}), Status::InvalidTask);
    EXPECT_EQ(pool.submit_job(nullptr), Status::InvalidTask);
    EXPECT_EQ(pool.submit(std::function<void(int)>{}, 1), Status::InvalidTask);
    EXPECT_EQ(pool.len(), 0);
}

TEST_F(PoolTest, SubmitAfterCloseFails) {
    Pool pool;
    ASSERT_EQ(pool.close_graceful(), Status::Ok);

    EXPECT_TRUE(pool.is_closed());
    EXPECT_EQ(pool.submit([]() {}), Status::Closed);
    EXPECT_EQ(pool.submit(Task{}), Status::InvalidTask);
}

TEST_F(PoolTest, CountersTrackLiveWorkers) {
    Gate gate;
    Pool pool;
    OpenOnExit gate_guard(gate);

    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(pool.submit([&gate]() { gate.wait(); }), Status::Ok);
    }

    EXPECT_EQ(pool.len(), 3);
    EXPECT_EQ(pool.free(), DEFAULT_CAPACITY - 3);
    EXPECT_EQ(pool.idle(), 0);

    gate.open();
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 3; }));
    // Parked workers are still live.
    EXPECT_EQ(pool.len(), 3);
    EXPECT_EQ(pool.free() + pool.len(), pool.cap());
}

TEST_F(PoolTest, IdleWorkerIsReused) {
    Pool pool;
    std::atomic<int> runs{0};

    ASSERT_EQ(pool.submit([&runs]() { runs++; }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 1; }));
    EXPECT_EQ(pool.len(), 1);

    ASSERT_EQ(pool.submit([&runs]() { runs++; }), Status::Ok);
    EXPECT_EQ(pool.len(), 1);
    ASSERT_TRUE(eventually([&]() { return runs.load() == 2 && pool.idle() == 1; }));
    EXPECT_EQ(pool.len(), 1);

    auto m = pool.metrics();
    EXPECT_EQ(m.workers_spawned, 1u);
    EXPECT_EQ(m.idle_handoffs, 1u);
    EXPECT_EQ(m.tasks_submitted, 2u);
    EXPECT_EQ(m.tasks_completed, 2u);
}

TEST_F(PoolTest, OldestIdleWorkerClaimedFirst) {
    Gate first_gate;
    Gate second_gate;
    Pool pool;
    OpenOnExit first_gate_guard(first_gate);
    OpenOnExit second_gate_guard(second_gate);
    std::thread::id first_thread;
    std::thread::id reused_thread;

    ASSERT_EQ(pool.submit([&]() {
        first_thread = std::this_thread::get_id();
        first_gate.wait();
    }), Status::Ok);
    ASSERT_EQ(pool.submit([&]() { second_gate.wait(); }), Status::Ok);

    first_gate.open();
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 1; }));
    second_gate.open();
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 2; }));

    std::atomic<bool> done{false};
    ASSERT_EQ(pool.submit([&]() {
        reused_thread = std::this_thread::get_id();
        done.store(true);
    }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return done.load(); }));

    EXPECT_EQ(reused_thread, first_thread);
    EXPECT_EQ(pool.len(), 2);
}

TEST_F(PoolTest, SubmitWithArgument) {
    Pool pool;
    std::atomic<int> seen{0};

    ASSERT_EQ(pool.submit([&seen](int value) { seen.store(value); }, 42), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return seen.load() == 42; }));
}

TEST_F(PoolTest, SubmitJob) {
    struct CountingJob : Job {
        explicit CountingJob(std::atomic<int>& c) : counter(c) {}
        void run() override { counter++; }
        std::atomic<int>& counter;
    };

    Pool pool;
    std::atomic<int> counter{0};
    auto job = std::make_shared<CountingJob>(counter);

    ASSERT_EQ(pool.submit_job(job), Status::Ok);
    ASSERT_EQ(pool.submit_job(job), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return counter.load() == 2; }));
}

TEST_F(PoolTest, AdjustIgnoresNegativeAndUnchanged) {
    Pool pool(config_with_capacity(10));

    pool.adjust(-1);
    EXPECT_EQ(pool.cap(), 10);

    pool.adjust(10);
    EXPECT_EQ(pool.cap(), 10);

    pool.adjust(20000);
    EXPECT_EQ(pool.cap(), 20000);
    EXPECT_EQ(pool.free(), 20000);
}

TEST_F(PoolTest, AdjustBelowRunningRetiresSurplusWorkers) {
    Gate gate;
    Pool pool(config_with_capacity(4));
    OpenOnExit gate_guard(gate);

    for (int i = 0; i < 4; i++) {
        ASSERT_EQ(pool.submit([&gate]() { gate.wait(); }), Status::Ok);
    }
    ASSERT_EQ(pool.len(), 4);

    pool.adjust(2);
    // Running workers are not interrupted.
    EXPECT_EQ(pool.len(), 4);
    EXPECT_EQ(pool.free(), -2);

    gate.open();
    ASSERT_TRUE(eventually([&]() {
        return pool.len() == 2 && pool.idle() == 2 && pool.metrics().overload_retirements == 2;
    }));
    EXPECT_EQ(pool.free(), 0);
}

TEST_F(PoolTest, BlockedSubmitterWakesWhenCapacityRaised) {
    Gate gate;
    Pool pool(config_with_capacity(1));
    OpenOnExit gate_guard(gate);
    ASSERT_EQ(pool.submit([&gate]() { gate.wait(); }), Status::Ok);

    std::atomic<bool> second_ran{false};
    std::atomic<bool> submitted{false};
    std::thread submitter([&]() {
        EXPECT_EQ(pool.submit([&second_ran]() { second_ran.store(true); }), Status::Ok);
        submitted.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(submitted.load());

    pool.adjust(2);
    ASSERT_TRUE(eventually([&]() { return second_ran.load(); }));
    submitter.join();
    EXPECT_GE(pool.metrics().blocked_submits, 1u);

    gate.open();
}

TEST_F(PoolTest, BlockedSubmitterWakesOnClose) {
    Gate gate;
    Pool pool(config_with_capacity(1));
    OpenOnExit gate_guard(gate);
    ASSERT_EQ(pool.submit([&gate]() { gate.wait(); }), Status::Ok);

    std::atomic<bool> returned{false};
    Status result = Status::Ok;
    std::thread submitter([&]() {
        result = pool.submit([]() {});
        returned.store(true);
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(returned.load());

    ASSERT_EQ(pool.close(), Status::Ok);
    submitter.join();
    EXPECT_EQ(result, Status::Closed);

    gate.open();
    ASSERT_EQ(pool.close_graceful(), Status::Ok);
    EXPECT_EQ(pool.len(), 0);
}

TEST_F(PoolTest, FailureHandlerInvokedOnce) {
    Pool pool;
    std::atomic<int> failures{0};
    pool.set_failure_handler([&failures]() { failures++; });

    ASSERT_EQ(pool.submit([]() { throw std::runtime_error("task failed"); }), Status::Ok);

    ASSERT_TRUE(eventually([&]() { return failures.load() == 1 && pool.len() == 0; }));
    // The failed worker retires instead of parking.
    EXPECT_EQ(pool.idle(), 0);

    std::atomic<bool> ran{false};
    ASSERT_EQ(pool.submit([&ran]() { ran.store(true); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return ran.load(); }));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(failures.load(), 1);
    EXPECT_EQ(pool.metrics().tasks_failed, 1u);
}

TEST_F(PoolTest, NonStandardExceptionIsContained) {
    Pool pool;
    std::atomic<int> failures{0};
    pool.set_failure_handler([&failures]() { failures++; });

    ASSERT_EQ(pool.submit([]() { throw 42; }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return failures.load() == 1 && pool.len() == 0; }));
}

TEST_F(PoolTest, FailureWithoutHandler) {
    Pool pool;

    ASSERT_EQ(pool.submit([]() { throw std::logic_error("no handler"); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return pool.len() == 0; }));
    EXPECT_EQ(pool.metrics().tasks_failed, 1u);
}

TEST_F(PoolTest, ThrowingFailureHandlerIsContained) {
    Pool pool;
    pool.set_failure_handler([]() { throw std::runtime_error("handler failed"); });

    ASSERT_EQ(pool.submit([]() { throw std::runtime_error("task failed"); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return pool.len() == 0; }));

    std::atomic<bool> ran{false};
    ASSERT_EQ(pool.submit([&ran]() { ran.store(true); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return ran.load(); }));
}

TEST_F(PoolTest, CloseIsIdempotent) {
    Pool pool;
    ASSERT_EQ(pool.submit([]() {}), Status::Ok);

    EXPECT_EQ(pool.close_graceful(), Status::Ok);
    EXPECT_EQ(pool.close_graceful(), Status::Ok);
    EXPECT_EQ(pool.close(), Status::Ok);

    EXPECT_EQ(pool.len(), 0);
    EXPECT_EQ(pool.idle(), 0);
    EXPECT_EQ(pool.free(), DEFAULT_CAPACITY);
}

TEST_F(PoolTest, GracefulCloseWaitsForRunningTasks) {
    Pool pool;
    std::atomic<int> finished{0};

    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(pool.submit([&finished]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            finished++;
        }), Status::Ok);
    }

    ASSERT_EQ(pool.close_graceful(), Status::Ok);

    EXPECT_EQ(finished.load(), 3);
    EXPECT_EQ(pool.len(), 0);
    EXPECT_EQ(pool.idle(), 0);
}

TEST_F(PoolTest, CloseReturnsWithoutWaitingForRunningTasks) {
    Gate gate;
    Pool pool;
    OpenOnExit gate_guard(gate);
    std::atomic<bool> finished{false};

    ASSERT_EQ(pool.submit([&]() {
        gate.wait();
        finished.store(true);
    }), Status::Ok);

    ASSERT_EQ(pool.close(), Status::Ok);
    EXPECT_FALSE(finished.load());
    EXPECT_EQ(pool.len(), 1);
    EXPECT_EQ(pool.idle(), 0);
    EXPECT_EQ(pool.submit([]() {}), Status::Closed);

    gate.open();
    ASSERT_TRUE(eventually([&]() { return pool.len() == 0; }));
    EXPECT_TRUE(finished.load());
    // The running worker finished and retired instead of parking.
    EXPECT_EQ(pool.idle(), 0);
}

TEST_F(PoolTest, CloseStopsParkedWorkers) {
    Pool pool;
    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(pool.submit([]() {}), Status::Ok);
    }
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 3; }));

    ASSERT_EQ(pool.close(), Status::Ok);
    EXPECT_EQ(pool.idle(), 0);
    ASSERT_TRUE(eventually([&]() { return pool.len() == 0; }));
    EXPECT_EQ(pool.metrics().workers_reaped, 3u);
}

TEST_F(PoolTest, RetiredShellsAreRecycled) {
    Pool pool;
    pool.set_failure_handler([]() {});

    ASSERT_EQ(pool.submit([]() { throw std::runtime_error("retire"); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return pool.len() == 0; }));

    std::atomic<bool> ran{false};
    ASSERT_EQ(pool.submit([&ran]() { ran.store(true); }), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return ran.load(); }));

    auto m = pool.metrics();
    EXPECT_EQ(m.workers_spawned, 1u);
    EXPECT_EQ(m.workers_recycled, 1u);
}

TEST_F(PoolTest, FailedWorkerThreadIsJoinedWithoutClose) {
    PoolConfig config = config_with_capacity(4);
    config.survival_time = std::chrono::milliseconds(200);
    Pool pool(config);
    pool.set_failure_handler([]() {});

    for (int i = 0; i < 3; i++) {
        ASSERT_EQ(pool.submit([]() { throw std::runtime_error("retire"); }), Status::Ok);
    }
    ASSERT_TRUE(eventually([&]() { return pool.metrics().tasks_failed == 3u && pool.len() == 0; }));

    ASSERT_TRUE(eventually([&]() {
        auto m = pool.metrics();
        return m.threads_joined == m.workers_spawned + m.workers_recycled && m.allocated_workers == 0;
    }));
    EXPECT_FALSE(pool.is_closed());
}

TEST_F(PoolTest, GracefulCloseJoinsEveryWorkerThread) {
    Gate gate;
    Pool pool(config_with_capacity(8));
    OpenOnExit gate_guard(gate);

    for (int i = 0; i < 8; i++) {
        ASSERT_EQ(pool.submit([&gate]() { gate.wait(); }), Status::Ok);
    }
    gate.open();
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 8; }));

    ASSERT_EQ(pool.close_graceful(), Status::Ok);
    auto m = pool.metrics();
    EXPECT_EQ(m.threads_joined, 8u);
    EXPECT_EQ(m.allocated_workers, 0);
    EXPECT_NE(m.format().find("Joined: 8"), std::string::npos);
}

TEST_F(PoolTest, MetricsFormat) {
    Pool pool(config_with_capacity(8));
    ASSERT_EQ(pool.submit([]() {}), Status::Ok);
    ASSERT_TRUE(eventually([&]() { return pool.idle() == 1; }));

    auto m = pool.metrics();
    EXPECT_EQ(m.capacity, 8);
    EXPECT_EQ(m.running, 1);
    EXPECT_EQ(m.idle, 1);
    EXPECT_NE(m.format().find("Running: 1/8"), std::string::npos);
}

TEST_F(PoolTest, StatusToString) {
    EXPECT_STREQ(to_string(Status::Ok), "ok");
    EXPECT_STREQ(to_string(Status::Closed), "pool has closed");
    EXPECT_STREQ(to_string(Status::InvalidTask), "invalid task, must be not empty");
    EXPECT_STREQ(to_string(Status::Overload), "pool overload");
}
