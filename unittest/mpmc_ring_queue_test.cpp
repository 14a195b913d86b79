// ============================================================================
// MPMC LAP RING QUEUE - SINGLE THREAD TEST SUITE
// ============================================================================
// - Capacity rounding through the constructor
// - Put/Get results and approximate counts
// - FIFO ordering across many laps
// - Admission margin (capacity - 2)
// - Ownership transfer on put
// ============================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <lapring/core/queues/mpmc_ring_queue.hpp>

using namespace LapRing;

namespace {

QueueOptions optionsForThisTest() {
    QueueOptions options;
    options.name = std::string("unit.") +
                   ::testing::UnitTest::GetInstance()->current_test_info()->name();
    return options;
}

}  // namespace

// ============================================================================
// CONSTRUCTION
// ============================================================================

TEST(MpmcRingQueue, CapacityIsRoundedWithMinimum) {
    EXPECT_EQ(MpmcRingQueue<int>(3, optionsForThisTest()).capacity(), 8u);
    EXPECT_EQ(MpmcRingQueue<int>(8, optionsForThisTest()).capacity(), 8u);
    EXPECT_EQ(MpmcRingQueue<int>(9, optionsForThisTest()).capacity(), 16u);
    EXPECT_EQ(MpmcRingQueue<int>(0, optionsForThisTest()).capacity(), 8u);
    EXPECT_EQ(MpmcRingQueue<int>(-7, optionsForThisTest()).capacity(), 8u);
}

TEST(MpmcRingQueue, RejectsUnusableMinimum) {
    QueueOptions options = optionsForThisTest();
    options.min_capacity = 2;
    EXPECT_THROW({ MpmcRingQueue<int> q(64, options); }, std::invalid_argument);
}

TEST(MpmcRingQueue, RejectsValveWithoutSpinLimit) {
    QueueOptions options = optionsForThisTest();
    options.wait.starvation_valve = true;
    options.wait.starvation_spin_limit = 0;
    EXPECT_THROW({ MpmcRingQueue<int> q(64, options); }, std::invalid_argument);
}

TEST(MpmcRingQueue, FreshQueueIsEmpty) {
    MpmcRingQueue<int> q(16, optionsForThisTest());
    EXPECT_EQ(q.count(), 0u);
    EXPECT_EQ(q.name(), std::string("unit.FreshQueueIsEmpty"));
}

// ============================================================================
// CONCRETE SCENARIO
// ============================================================================

TEST(MpmcRingQueue, PutThreeGetThree) {
    MpmcRingQueue<std::string> q(4, optionsForThisTest());
    ASSERT_EQ(q.capacity(), 8u);

    PutResult p = q.put(std::string("a"));
    EXPECT_TRUE(p.ok);
    EXPECT_EQ(p.count, 1u);
    EXPECT_EQ(p.status, QueueStatus::OK);

    p = q.put(std::string("b"));
    EXPECT_TRUE(p.ok);
    EXPECT_EQ(p.count, 2u);

    p = q.put(std::string("c"));
    EXPECT_TRUE(p.ok);
    EXPECT_EQ(p.count, 3u);
    EXPECT_EQ(q.count(), 3u);

    GetResult<std::string> g = q.get();
    ASSERT_TRUE(g.ok);
    EXPECT_EQ(*g.value, "a");
    EXPECT_EQ(g.count, 2u);

    g = q.get();
    ASSERT_TRUE(g.ok);
    EXPECT_EQ(*g.value, "b");
    EXPECT_EQ(g.count, 1u);

    g = q.get();
    ASSERT_TRUE(g.ok);
    EXPECT_EQ(*g.value, "c");
    EXPECT_EQ(g.count, 0u);

    g = q.get();
    EXPECT_FALSE(g.ok);
    EXPECT_FALSE(g.value.has_value());
    EXPECT_EQ(g.count, 0u);
    EXPECT_EQ(g.status, QueueStatus::ADMISSION_DENIED);
}

// ============================================================================
// ORDERING AND LAPS
// ============================================================================

TEST(MpmcRingQueue, FifoOrderForBatches) {
    MpmcRingQueue<int> q(64, optionsForThisTest());
    const int n = static_cast<int>(q.capacity()) - 2;

    for (int round = 0; round < 50; ++round) {
        for (int i = 0; i < n; ++i) {
            ASSERT_TRUE(q.put(round * 1000 + i).ok);
        }
        for (int i = 0; i < n; ++i) {
            GetResult<int> g = q.get();
            ASSERT_TRUE(g.ok);
            ASSERT_EQ(*g.value, round * 1000 + i);
        }
        ASSERT_FALSE(q.get().ok);
    }
}

TEST(MpmcRingQueue, ManyLapsThroughEverySlot) {
    MpmcRingQueue<uint64_t> q(8, optionsForThisTest());
    // Odd window so each lap starts on a different slot
    const uint64_t window = 5;
    uint64_t next_put = 0;
    uint64_t next_get = 0;

    while (next_get < 20000) {
        while (next_put - next_get < window) {
            ASSERT_TRUE(q.put(next_put).ok);
            ++next_put;
        }
        GetResult<uint64_t> g = q.get();
        ASSERT_TRUE(g.ok);
        ASSERT_EQ(*g.value, next_get);
        ++next_get;
    }
}

TEST(MpmcRingQueue, ZeroAndEmptyValuesAreLegalPayloads) {
    MpmcRingQueue<int> ints(8, optionsForThisTest());
    ASSERT_TRUE(ints.put(0).ok);
    GetResult<int> gi = ints.get();
    EXPECT_TRUE(gi.ok);
    EXPECT_EQ(*gi.value, 0);

    MpmcRingQueue<std::string> strings(8, optionsForThisTest());
    ASSERT_TRUE(strings.put(std::string()).ok);
    GetResult<std::string> gs = strings.get();
    EXPECT_TRUE(gs.ok);
    EXPECT_EQ(*gs.value, "");
}

// ============================================================================
// ADMISSION MARGIN
// ============================================================================

TEST(MpmcRingQueue, AdmitsAtMostCapacityMinusTwo) {
    MpmcRingQueue<int> q(8, optionsForThisTest());

    for (int i = 0; i < 6; ++i) {
        PutResult p = q.put(i);
        ASSERT_TRUE(p.ok) << "put " << i;
        EXPECT_EQ(p.count, static_cast<uint32_t>(i + 1));
    }

    PutResult full = q.put(99);
    EXPECT_FALSE(full.ok);
    EXPECT_EQ(full.status, QueueStatus::ADMISSION_DENIED);
    EXPECT_EQ(full.count, 6u);
    EXPECT_EQ(q.count(), 6u);
    EXPECT_LT(q.count(), q.capacity());

    ASSERT_TRUE(q.get().ok);
    EXPECT_TRUE(q.put(6).ok);
    EXPECT_FALSE(q.put(7).ok);

    for (int expected = 1; expected <= 6; ++expected) {
        GetResult<int> g = q.get();
        ASSERT_TRUE(g.ok);
        EXPECT_EQ(*g.value, expected);
    }
}

TEST(MpmcRingQueue, GetOnEmptyKeepsFailingUntilPut) {
    MpmcRingQueue<int> q(8, optionsForThisTest());
    for (int i = 0; i < 100; ++i) {
        GetResult<int> g = q.get();
        ASSERT_FALSE(g.ok);
        ASSERT_EQ(g.status, QueueStatus::ADMISSION_DENIED);
    }

    ASSERT_TRUE(q.put(5).ok);
    EXPECT_TRUE(q.get().ok);

    for (int i = 0; i < 100; ++i) {
        ASSERT_FALSE(q.get().ok);
    }
    EXPECT_EQ(q.count(), 0u);
}

// ============================================================================
// OWNERSHIP
// ============================================================================

TEST(MpmcRingQueue, SuccessfulPutTakesOwnership) {
    MpmcRingQueue<std::string> q(8, optionsForThisTest());
    std::string payload(256, 'x');

    ASSERT_TRUE(q.put(std::move(payload)).ok);

    GetResult<std::string> g = q.get();
    ASSERT_TRUE(g.ok);
    EXPECT_EQ(g.value->size(), 256u);
}

TEST(MpmcRingQueue, FailedPutLeavesValueWithCaller) {
    MpmcRingQueue<std::string> q(8, optionsForThisTest());
    for (int i = 0; i < 6; ++i) {
        ASSERT_TRUE(q.put(std::string("filler")).ok);
    }

    std::string payload(256, 'y');
    PutResult p = q.put(std::move(payload));
    EXPECT_FALSE(p.ok);
    EXPECT_EQ(payload.size(), 256u);  // NOLINT(bugprone-use-after-move)
}

TEST(MpmcRingQueue, WorksThroughInterface) {
    MpmcRingQueue<int> impl(8, optionsForThisTest());
    IBoundedQueue<int>& q = impl;

    EXPECT_EQ(q.capacity(), 8u);
    EXPECT_TRUE(q.put(11).ok);
    EXPECT_EQ(q.count(), 1u);
    GetResult<int> g = q.get();
    ASSERT_TRUE(g.ok);
    EXPECT_EQ(*g.value, 11);
}

TEST(QueueStatus, Names) {
    EXPECT_STREQ(to_string(QueueStatus::OK), "OK");
    EXPECT_STREQ(to_string(QueueStatus::ADMISSION_DENIED), "ADMISSION_DENIED");
    EXPECT_STREQ(to_string(QueueStatus::RESERVATION_LOST), "RESERVATION_LOST");
    EXPECT_STREQ(to_string(QueueStatus::PLACEHOLDER), "PLACEHOLDER");
}
