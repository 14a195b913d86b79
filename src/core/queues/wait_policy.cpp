#include <lapring/core/queues/wait_policy.hpp>
#include <stdexcept>
#include <thread>

#if defined(__x86_64__) || defined(__i386__)
#include <x86intrin.h>
#endif

namespace LapRing {

const char* to_string(BackoffMode mode) {
    switch (mode) {
        case BackoffMode::SPIN:
            return "spin";
        case BackoffMode::YIELD:
            return "yield";
        case BackoffMode::SLEEP:
            return "sleep";
    }
    return "unknown";
}

BackoffMode parseBackoffMode(const std::string& name) {
    if (name == "spin") return BackoffMode::SPIN;
    if (name == "yield") return BackoffMode::YIELD;
    if (name == "sleep") return BackoffMode::SLEEP;
    throw std::invalid_argument("Unknown backoff mode: " + name);
}

void validate(const WaitPolicy& policy) {
    if (policy.starvation_valve && policy.starvation_spin_limit == 0) {
        throw std::invalid_argument("starvation_spin_limit must be > 0 when the valve is enabled");
    }
    if (policy.backoff == BackoffMode::SLEEP && policy.sleep_duration.count() <= 0) {
        throw std::invalid_argument("sleep backoff needs a positive sleep_duration");
    }
}

void Backoff::cpu_relax() {
#if defined(__x86_64__) || defined(__i386__)
    _mm_pause();
#elif defined(__aarch64__)
    asm volatile("yield" ::: "memory");
#endif
}

void Backoff::pause() {
    ++iterations_;
    if (iterations_ <= policy_.spins_before_backoff) {
        cpu_relax();
        return;
    }

    switch (policy_.backoff) {
        case BackoffMode::SPIN:
            cpu_relax();
            break;
        case BackoffMode::YIELD:
            std::this_thread::yield();
            break;
        case BackoffMode::SLEEP:
            std::this_thread::sleep_for(policy_.sleep_duration);
            break;
    }
}

}  // namespace LapRing
