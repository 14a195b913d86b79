#pragma once

#include <cstdint>
#include <string>
#include <lapring/core/queues/queue_result.hpp>

namespace LapRing {

/**
 * @class IBoundedQueue
 * @brief Non-blocking fixed-capacity queue contract
 *
 * put/get are single attempts. ok == false means no progress was made and
 * the caller owns the retry policy.
 */
template<typename T>
class IBoundedQueue {
public:
    virtual ~IBoundedQueue() = default;

    virtual PutResult put(const T& value) = 0;
    virtual PutResult put(T&& value) = 0;
    virtual GetResult<T> get() = 0;

    virtual uint32_t capacity() const = 0;

    // Approximate occupancy, racy by design
    virtual uint32_t count() const = 0;

    virtual const std::string& name() const = 0;
};

}  // namespace LapRing
