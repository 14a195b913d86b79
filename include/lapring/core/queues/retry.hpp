#pragma once

#include <chrono>
#include <utility>

#include <lapring/core/queues/bounded_queue.hpp>
#include <lapring/core/queues/wait_policy.hpp>

namespace LapRing {

// ============================================================================
// Caller-side retry loops. The queue never blocks; these keep retrying a
// failed attempt with the policy's backoff until success or the deadline.
// ============================================================================

template<typename T, typename Clock, typename Duration>
PutResult put_until(IBoundedQueue<T>& queue, const T& value,
                    const std::chrono::time_point<Clock, Duration>& deadline,
                    const WaitPolicy& policy = WaitPolicy{}) {
    Backoff backoff(policy);
    PutResult result;
    do {
        result = queue.put(value);
        if (result.ok) {
            return result;
        }
        backoff.pause();
    } while (Clock::now() < deadline);
    return result;
}

template<typename T, typename Clock, typename Duration>
GetResult<T> get_until(IBoundedQueue<T>& queue,
                       const std::chrono::time_point<Clock, Duration>& deadline,
                       const WaitPolicy& policy = WaitPolicy{}) {
    Backoff backoff(policy);
    GetResult<T> result;
    do {
        result = queue.get();
        if (result.ok) {
            return result;
        }
        // PLACEHOLDER consumed a slot but carried nothing, keep going
        backoff.pause();
    } while (Clock::now() < deadline);
    return result;
}

}  // namespace LapRing
