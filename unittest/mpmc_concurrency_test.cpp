// ============================================================================
// MPMC LAP RING QUEUE - CONCURRENCY TEST SUITE
// ============================================================================
// - No loss / no duplicates with retry-until-success (8 x 8)
// - Per-producer order with a single consumer
// - Occupancy never exceeds the admission margin
// ============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <lapring/core/queues/mpmc_ring_queue.hpp>

using namespace LapRing;

namespace {

QueueOptions optionsForThisTest() {
    QueueOptions options;
    options.name = std::string("concurrency.") +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
    return options;
}

// Every produced value is drained exactly once.
void runExactlyOnce(MpmcRingQueue<uint64_t>& q, int producers, int consumers, uint64_t per_producer) {
    const uint64_t total = per_producer * producers;
    std::vector<std::atomic<uint8_t>> visited(total);
    for (auto& v : visited) v.store(0, std::memory_order_relaxed);

    std::atomic<bool> go{false};
    std::atomic<uint64_t> consumed{0};
    std::atomic<uint64_t> duplicates{0};
    std::atomic<uint64_t> out_of_range{0};

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            while (!go.load(std::memory_order_acquire)) {}
            const uint64_t base = static_cast<uint64_t>(p) * per_producer;
            for (uint64_t i = 0; i < per_producer; ++i) {
                while (!q.put(base + i).ok) {
                    std::this_thread::yield();
                }
            }
        });
    }
    for (int c = 0; c < consumers; ++c) {
        threads.emplace_back([&] {
            while (!go.load(std::memory_order_acquire)) {}
            while (consumed.load(std::memory_order_acquire) < total) {
                GetResult<uint64_t> g = q.get();
                if (!g.ok) {
                    std::this_thread::yield();
                    continue;
                }
                uint64_t id = *g.value;
                if (id >= total) {
                    out_of_range.fetch_add(1);
                } else if (visited[id].exchange(1) != 0) {
                    duplicates.fetch_add(1);
                }
                consumed.fetch_add(1, std::memory_order_release);
            }
        });
    }

    go.store(true, std::memory_order_release);
    for (auto& t : threads) t.join();

    EXPECT_EQ(consumed.load(), total);
    EXPECT_EQ(duplicates.load(), 0u);
    EXPECT_EQ(out_of_range.load(), 0u);

    uint64_t missing = 0;
    for (uint64_t i = 0; i < total; ++i) {
        if (visited[i].load() != 1) ++missing;
    }
    EXPECT_EQ(missing, 0u);
    EXPECT_FALSE(q.get().ok);
}

}  // namespace

// ============================================================================
// NO LOSS UNDER CORRECT RETRY
// ============================================================================

TEST(MpmcConcurrency, EightProducersEightConsumers) {
    MpmcRingQueue<uint64_t> q(1024, optionsForThisTest());
    runExactlyOnce(q, 8, 8, 10000);
}

TEST(MpmcConcurrency, TinyRingHighContention) {
    // Capacity 8: every slot is reused constantly, stressing the lap encoding
    MpmcRingQueue<uint64_t> q(8, optionsForThisTest());
    runExactlyOnce(q, 4, 4, 5000);
}

TEST(MpmcConcurrency, UnbalancedProducersAndConsumers) {
    MpmcRingQueue<uint64_t> q(64, optionsForThisTest());
    runExactlyOnce(q, 1, 6, 20000);
}

// ============================================================================
// ORDERING
// ============================================================================

TEST(MpmcConcurrency, SingleConsumerSeesEachProducerInOrder) {
    MpmcRingQueue<uint64_t> q(256, optionsForThisTest());
    const int producers = 4;
    const uint64_t per_producer = 20000;

    std::vector<std::thread> threads;
    for (int p = 0; p < producers; ++p) {
        threads.emplace_back([&, p] {
            for (uint64_t i = 0; i < per_producer; ++i) {
                // producer id in the high bits, sequence in the low bits
                uint64_t v = (static_cast<uint64_t>(p) << 32) | i;
                while (!q.put(v).ok) {
                    std::this_thread::yield();
                }
            }
        });
    }

    std::vector<uint64_t> next(producers, 0);
    uint64_t received = 0;
    uint64_t out_of_order = 0;
    while (received < producers * per_producer) {
        GetResult<uint64_t> g = q.get();
        if (!g.ok) {
            std::this_thread::yield();
            continue;
        }
        auto p = static_cast<size_t>(*g.value >> 32);
        uint64_t seq = *g.value & 0xFFFFFFFFull;
        if (p >= next.size()) {
            ADD_FAILURE() << "unknown producer tag " << p;
            break;
        }
        if (seq != next[p]) ++out_of_order;
        next[p] = seq + 1;
        ++received;
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(out_of_order, 0u);
}

// ============================================================================
// BOUNDED OCCUPANCY
// ============================================================================

TEST(MpmcConcurrency, CountStaysInsideCapacity) {
    MpmcRingQueue<uint64_t> q(16, optionsForThisTest());
    std::atomic<bool> stop{false};
    std::atomic<uint64_t> over_margin{0};
    std::atomic<uint64_t> out_of_bounds{0};

    std::vector<std::thread> threads;
    for (int p = 0; p < 3; ++p) {
        threads.emplace_back([&] {
            uint64_t v = 0;
            while (!stop.load(std::memory_order_relaxed)) {
                PutResult r = q.put(v++);
                if (r.ok && r.count > q.capacity() - 2) over_margin.fetch_add(1);
            }
        });
    }
    for (int c = 0; c < 3; ++c) {
        threads.emplace_back([&] {
            while (!stop.load(std::memory_order_relaxed)) {
                q.get();
            }
        });
    }
    threads.emplace_back([&] {
        while (!stop.load(std::memory_order_relaxed)) {
            if (q.count() >= q.capacity()) out_of_bounds.fetch_add(1);
        }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    stop.store(true);
    for (auto& t : threads) t.join();

    EXPECT_EQ(over_margin.load(), 0u);
    EXPECT_EQ(out_of_bounds.load(), 0u);
}
