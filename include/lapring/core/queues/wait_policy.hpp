// ============================================================================
// WAIT / BACKOFF POLICY
// ============================================================================
// Governs every place the queue gives up its time slice:
// - after a fast-fail admission check
// - after losing the cursor CAS
// - between spins on a reserved slot
//
// These are scheduler hints, never blocking waits.
// ============================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace LapRing {

enum class BackoffMode : uint8_t {
    SPIN = 0,    // cpu relax only
    YIELD = 1,   // std::this_thread::yield
    SLEEP = 2    // sleep_for(sleep_duration)
};

const char* to_string(BackoffMode mode);

// Throws std::invalid_argument on an unknown name.
BackoffMode parseBackoffMode(const std::string& name);

struct WaitPolicy {
    BackoffMode backoff = BackoffMode::YIELD;

    // cpu-relax iterations before the backoff mode kicks in
    uint32_t spins_before_backoff = 0;

    std::chrono::microseconds sleep_duration{50};

    // yield after ADMISSION_DENIED / RESERVATION_LOST
    bool yield_on_fast_fail = true;

    // LOSSY: after starvation_spin_limit failed spins on a reserved slot a
    // stuck put evicts one element, a stuck get injects one placeholder.
    bool starvation_valve = false;
    uint32_t starvation_spin_limit = 100;
};

// Throws std::invalid_argument if the policy cannot be used.
void validate(const WaitPolicy& policy);

/**
 * @class Backoff
 * @brief Stateful applier of a WaitPolicy for one wait loop
 */
class Backoff {
public:
    explicit Backoff(const WaitPolicy& policy) : policy_(policy) {}

    void pause();
    void reset() { iterations_ = 0; }
    uint32_t iterations() const { return iterations_; }

    static void cpu_relax();

private:
    const WaitPolicy& policy_;
    uint32_t iterations_ = 0;
};

}  // namespace LapRing
