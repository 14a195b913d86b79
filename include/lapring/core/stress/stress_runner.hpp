// ============================================================================
// EXACTLY-ONCE STRESS RUNNER
// ============================================================================
// N producers put unique tagged values (producer * items + i) with
// retry-until-success, M consumers drain until every value is accounted
// for. Each drained value is checked against a visited bitmap.
//
// With the starvation valve enabled, values evicted by the valve count as
// accounted for (they are reported as evicted, not missing).
// ============================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include <lapring/core/config/app_config.hpp>
#include <lapring/core/queues/mpmc_ring_queue.hpp>

namespace LapRing {

struct StressReport {
    uint64_t expected = 0;
    uint64_t produced = 0;
    uint64_t consumed = 0;
    uint64_t duplicates = 0;
    uint64_t out_of_range = 0;
    uint64_t missing = 0;
    uint64_t evicted = 0;             // starvation valve
    uint64_t placeholder_drains = 0;  // starvation valve
    uint64_t timed_out_ops = 0;       // put/get gave up at the per-op deadline
    double elapsed_seconds = 0.0;

    // Every produced value drained exactly once
    bool passed() const {
        return duplicates == 0 && out_of_range == 0 && missing == 0 &&
               timed_out_ops == 0 && produced == expected &&
               consumed + evicted == expected;
    }

    double throughput_ops_per_sec() const {
        return elapsed_seconds > 0 ? (produced + consumed) / elapsed_seconds : 0.0;
    }
};

class StressRunner {
public:
    StressRunner(MpmcRingQueue<uint64_t>& queue, const AppConfig::StressConfig& config);

    StressRunner(const StressRunner&) = delete;
    StressRunner& operator=(const StressRunner&) = delete;

    StressReport run();

private:
    void produce(uint32_t producer_id);
    void consume();
    bool settled() const;
    void record(uint64_t value);

    MpmcRingQueue<uint64_t>& queue_;
    AppConfig::StressConfig config_;
    uint64_t total_;

    std::vector<std::atomic<uint8_t>> visited_;
    std::atomic<bool> go_{false};
    std::atomic<uint32_t> producers_done_{0};
    std::atomic<uint64_t> produced_{0};
    std::atomic<uint64_t> consumed_{0};
    std::atomic<uint64_t> duplicates_{0};
    std::atomic<uint64_t> out_of_range_{0};
    std::atomic<uint64_t> timed_out_{0};

    uint64_t evictions_before_ = 0;
    uint64_t placeholders_before_ = 0;
};

}  // namespace LapRing
