/**
 * @file burst_submit.cpp
 * @brief Example: bursts of tasks through a small pool
 *
 * Submits bursts of short tasks to a pool much smaller than the burst,
 * shrinks and grows the capacity between bursts, and lets idle workers
 * expire while it prints the pool metrics once per second.
 */

#include <iostream>
#include <atomic>
#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>

#include "workerpool/workerpool.hpp"

std::atomic<bool> g_shutdown{false};

void signal_handler(int /*signal*/) {
    g_shutdown.store(true);
}

int main(int argc, char** argv) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (argc > 1 && std::string(argv[1]) == "-v") {
        workerpool::set_log_level(spdlog::level::debug);
    }

    std::cout << "=== workerpool burst example ===" << std::endl;
    std::cout << "Version: " << workerpool::VERSION << std::endl;
    std::cout << std::endl;

    workerpool::PoolConfig config;
    config.capacity = 8;
    config.survival_time = std::chrono::milliseconds(500);
    config.name = "burst";

    workerpool::Pool pool(config);

    std::atomic<int> failures{0};
    pool.set_failure_handler([&failures]() { failures++; });

    std::atomic<long long> checksum{0};
    const int bursts = 5;
    const int burst_size = 200;

    for (int burst = 0; burst < bursts && !g_shutdown.load(); burst++) {
        std::cout << "Burst " << burst + 1 << " (capacity " << pool.cap() << ")" << std::endl;

        for (int i = 0; i < burst_size && !g_shutdown.load(); i++) {
            workerpool::Status status;
            if (i % 50 == 49) {
                status = pool.submit([]() { throw std::runtime_error("simulated failure"); });
            } else {
                status = pool.submit([&checksum](int n) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    checksum += n;
                }, i);
            }
            if (status != workerpool::Status::Ok) {
                std::cout << "submit failed: " << status << std::endl;
                break;
            }
        }

        std::cout << "\r" << pool.metrics().format() << std::endl;

        // Alternate between a narrow and a wide pool.
        pool.adjust(burst % 2 == 0 ? 2 : 8);
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    // Let the idle workers expire.
    auto start_time = std::chrono::steady_clock::now();
    while (!g_shutdown.load() && pool.len() > 0) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
        std::cout << "\r" << pool.metrics().format() << std::flush;

        if (std::chrono::steady_clock::now() - start_time > std::chrono::seconds(10)) {
            std::cout << "\n\nTimeout reached, stopping..." << std::endl;
            break;
        }
    }
    std::cout << std::endl;

    std::cout << "Closing pool..." << std::endl;
    pool.close_graceful();

    auto m = pool.metrics();
    std::cout << "\n=== Final Statistics ===" << std::endl;
    std::cout << "Tasks completed: " << m.tasks_completed << std::endl;
    std::cout << "Tasks failed: " << m.tasks_failed << " (handler saw " << failures.load() << ")" << std::endl;
    std::cout << "Checksum: " << checksum.load() << std::endl;
    std::cout << "Workers spawned: " << m.workers_spawned << std::endl;
    std::cout << "Workers recycled: " << m.workers_recycled << std::endl;
    std::cout << "Peak running: " << m.peak_running << std::endl;
    std::cout << "Uptime: " << m.uptime.count() << " ms" << std::endl;

    return 0;
}
