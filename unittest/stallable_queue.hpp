// ============================================================================
// TEST HELPER: STALLABLE QUEUE
// ============================================================================
// Exposes the two-phase primitives so a test can reserve a cursor and finish
// the slot access later, like a thread preempted between its CAS and its
// slot access.
// ============================================================================

#pragma once

#include <chrono>
#include <optional>
#include <thread>
#include <utility>
#include <lapring/core/queues/mpmc_ring_queue.hpp>

namespace LapRing {
namespace test_support {

template<typename T>
class StallableQueue : public MpmcRingQueue<T> {
public:
    using MpmcRingQueue<T>::MpmcRingQueue;

    std::optional<uint32_t> stallPut() {
        PutResult result;
        return this->reserveWrite(result);
    }

    // allow_valve = true behaves like a put() that was stuck on this target
    void finishPut(uint32_t target, T value, bool allow_valve = false) {
        LapSlot<T>& slot = this->awaitWritable(target, allow_valve);
        slot.payload.emplace(std::move(value));
        this->commitWrite(slot);
    }

    // Completes a reserved put with an empty payload
    void publishPlaceholder(uint32_t target) {
        LapSlot<T>& slot = this->awaitWritable(target, false);
        slot.payload.reset();
        this->commitWrite(slot);
    }

    std::optional<uint32_t> stallGet() {
        GetResult<T> result;
        return this->reserveRead(result);
    }

    std::optional<T> finishGet(uint32_t target) {
        LapSlot<T>& slot = this->awaitReadable(target, false);
        std::optional<T> value = std::move(slot.payload);
        slot.payload.reset();
        this->commitRead(slot);
        return value;
    }
};

template<typename Predicate>
bool waitFor(Predicate pred, std::chrono::milliseconds timeout = std::chrono::seconds(10)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return pred();
}

}  // namespace test_support
}  // namespace LapRing
