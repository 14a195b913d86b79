// ============================================================================
// HIGH-PRECISION MONOTONIC CLOCK
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace LapRing {

class Clock {
public:
    // Current time in nanoseconds (monotonic, steady)
    static inline uint64_t now_ns() {
        auto now = std::chrono::steady_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(
            now.time_since_epoch()
        ).count();
    }

    static inline double elapsed_seconds(uint64_t start_ns, uint64_t end_ns) {
        return static_cast<double>(end_ns - start_ns) / 1e9;
    }
};

} // namespace LapRing
