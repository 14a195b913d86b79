// ============================================================================
// BENCHMARK: LOCK-FREE MPMC LAP RING QUEUE PERFORMANCE
// ============================================================================
// Scenarios:
// 1. Sequential put/get (baseline)
// 2. Balanced producers/consumers (1x1, 2x2, 4x4, 8x8)
// 3. Small ring under contention, fast-fail rates
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <iomanip>
#include <string>

#include <spdlog/spdlog.h>
#include <lapring/core/queues/mpmc_ring_queue.hpp>

using LapRing::MpmcRingQueue;
using LapRing::QueueOptions;

// ============================================================================
// TEST 1: SEQUENTIAL THROUGHPUT (BASELINE)
// ============================================================================
void test_sequential_throughput() {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST 1: SEQUENTIAL THROUGHPUT (Single Thread Baseline)" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    QueueOptions options;
    options.name = "bench.sequential";
    MpmcRingQueue<uint64_t> queue(65536, options);
    const uint64_t NUM_EVENTS = queue.capacity() - 2;
    const int ROUNDS = 20;

    uint64_t put_ns = 0;
    uint64_t get_ns = 0;
    for (int round = 0; round < ROUNDS; ++round) {
        auto put_start = std::chrono::high_resolution_clock::now();
        for (uint64_t i = 0; i < NUM_EVENTS; ++i) {
            queue.put(i);
        }
        auto put_end = std::chrono::high_resolution_clock::now();

        auto get_start = std::chrono::high_resolution_clock::now();
        for (uint64_t i = 0; i < NUM_EVENTS; ++i) {
            if (!queue.get().ok) break;
        }
        auto get_end = std::chrono::high_resolution_clock::now();

        put_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(put_end - put_start).count();
        get_ns += std::chrono::duration_cast<std::chrono::nanoseconds>(get_end - get_start).count();
    }

    const uint64_t total = NUM_EVENTS * ROUNDS;

    std::cout << "\nPut performance:" << std::endl;
    std::cout << "  Total time:  " << put_ns / 1000000.0 << " ms" << std::endl;
    std::cout << "  Throughput:  " << std::fixed << std::setprecision(2)
              << (total * 1e9 / put_ns) / 1e6 << " M ops/sec" << std::endl;
    std::cout << "  Per-op:      " << std::setprecision(1) << (double)put_ns / total << " ns" << std::endl;

    std::cout << "\nGet performance:" << std::endl;
    std::cout << "  Total time:  " << get_ns / 1000000.0 << " ms" << std::endl;
    std::cout << "  Throughput:  " << std::fixed << std::setprecision(2)
              << (total * 1e9 / get_ns) / 1e6 << " M ops/sec" << std::endl;
    std::cout << "  Per-op:      " << std::setprecision(1) << (double)get_ns / total << " ns" << std::endl;
}

// ============================================================================
// TEST 2: BALANCED PRODUCERS / CONSUMERS
// ============================================================================
void test_balanced(size_t num_threads, int64_t capacity, uint64_t events_per_producer) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST 2: " << num_threads << " PRODUCERS x " << num_threads
              << " CONSUMERS (capacity " << capacity << ")" << std::endl;
    std::cout << std::string(70, '=') << std::endl;

    QueueOptions options;
    options.name = "bench." + std::to_string(num_threads) + "x" + std::to_string(num_threads) +
                   ".cap" + std::to_string(capacity);
    MpmcRingQueue<uint64_t> queue(capacity, options);
    const uint64_t TOTAL_EVENTS = events_per_producer * num_threads;

    std::atomic<uint64_t> events_popped{0};
    std::atomic<bool> go{false};

    auto producer = [&](size_t thread_id) {
        while (!go.load(std::memory_order_acquire)) {}
        for (uint64_t i = 0; i < events_per_producer; ++i) {
            while (!queue.put(thread_id * events_per_producer + i).ok) {}
        }
    };

    auto consumer = [&]() {
        while (!go.load(std::memory_order_acquire)) {}
        while (events_popped.load(std::memory_order_relaxed) < TOTAL_EVENTS) {
            if (queue.get().ok) {
                events_popped.fetch_add(1, std::memory_order_relaxed);
            }
        }
    };

    std::vector<std::thread> threads;
    for (size_t i = 0; i < num_threads; ++i) {
        threads.emplace_back(producer, i);
        threads.emplace_back(consumer);
    }

    auto start = std::chrono::high_resolution_clock::now();
    go.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }
    auto end = std::chrono::high_resolution_clock::now();
    double elapsed_sec = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count() / 1e9;

    auto stats = queue.stats();

    std::cout << "\nResults:" << std::endl;
    std::cout << "  Total popped: " << events_popped.load() << " / " << TOTAL_EVENTS << std::endl;
    std::cout << "  Duration:     " << std::fixed << std::setprecision(3) << elapsed_sec << " sec" << std::endl;
    std::cout << "  Throughput:   " << std::setprecision(2)
              << (TOTAL_EVENTS / elapsed_sec) / 1e6 << " M events/sec" << std::endl;
    std::cout << "  Full / empty: " << stats.put_admission_denied << " / "
              << stats.get_admission_denied << std::endl;
    std::cout << "  CAS lost:     " << stats.put_reservation_lost + stats.get_reservation_lost
              << " (" << std::setprecision(1) << stats.contention_rate_percent() << "%)" << std::endl;
}

// ============================================================================
// MAIN
// ============================================================================
int main() {
    spdlog::set_level(spdlog::level::warn);

    std::cout << "\n╔════════════════════════════════════════════════════════════════════╗" << std::endl;
    std::cout << "║  MPMC LOCK-FREE LAP RING QUEUE PERFORMANCE BENCHMARK                ║" << std::endl;
    std::cout << "║  Per-slot write/read generations, CAS cursors                       ║" << std::endl;
    std::cout << "╚════════════════════════════════════════════════════════════════════╝" << std::endl;

    test_sequential_throughput();

    test_balanced(1, 65536, 1000000);
    test_balanced(2, 65536, 500000);
    test_balanced(4, 65536, 250000);
    test_balanced(8, 65536, 125000);

    // Small ring: every slot is reused on nearly every lap
    test_balanced(4, 64, 100000);

    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "All MPMC benchmarks completed!" << std::endl;
    std::cout << std::string(70, '=') << "\n" << std::endl;

    return 0;
}
