#pragma once
#include <atomic>
#include <cstdint>

namespace LapRing {

/**
 * @brief Per-queue counters
 *
 * All counters are lock-free atomics updated with relaxed ordering; they
 * never take part in the slot protocol.
 */
struct QueueMetrics {
    std::atomic<uint64_t> puts_ok{0};
    std::atomic<uint64_t> gets_ok{0};

    std::atomic<uint64_t> put_admission_denied{0};   // looked full
    std::atomic<uint64_t> get_admission_denied{0};   // looked empty
    std::atomic<uint64_t> put_reservation_lost{0};   // lost write cursor CAS
    std::atomic<uint64_t> get_reservation_lost{0};   // lost read cursor CAS

    // Starvation valve (lossy)
    std::atomic<uint64_t> starvation_evictions{0};
    std::atomic<uint64_t> starvation_placeholders{0};
    std::atomic<uint64_t> placeholder_drains{0};

    std::atomic<uint64_t> current_depth{0};          // last occupancy seen by a successful op
};

/**
 * Plain copy of QueueMetrics for reporting and tests
 */
struct QueueMetricSnapshot {
    uint64_t puts_ok = 0;
    uint64_t gets_ok = 0;
    uint64_t put_admission_denied = 0;
    uint64_t get_admission_denied = 0;
    uint64_t put_reservation_lost = 0;
    uint64_t get_reservation_lost = 0;
    uint64_t starvation_evictions = 0;
    uint64_t starvation_placeholders = 0;
    uint64_t placeholder_drains = 0;
    uint64_t current_depth = 0;

    // Share of attempts that lost a cursor CAS
    double contention_rate_percent() const {
        uint64_t lost = put_reservation_lost + get_reservation_lost;
        uint64_t attempts = puts_ok + gets_ok + lost;
        return attempts > 0 ? (lost * 100.0) / attempts : 0.0;
    }

    uint64_t loss_total() const {
        return starvation_evictions + starvation_placeholders;
    }
};

QueueMetricSnapshot takeSnapshot(const QueueMetrics& m);

}  // namespace LapRing
