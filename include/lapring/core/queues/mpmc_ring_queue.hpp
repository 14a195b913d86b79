// ============================================================================
// LOCK-FREE MPMC LAP RING QUEUE
// ============================================================================
// Fixed-capacity multi-producer / multi-consumer queue without a global lock.
//
// put():
//   1. snapshot cursors, fast-fail if occupancy >= capacity - 2
//   2. CAS write cursor w -> w + 1, fail if another producer won
//   3. spin on slot (w + 1) & mask until its generations say "empty, this lap"
//   4. store payload, write_generation += capacity (publish)
//
// get() is symmetric on the read cursor and read_generation.
//
// Only the slot spin can loop; every other failure returns to the caller.
// ============================================================================

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

#include <lapring/core/metrics/registry.hpp>
#include <lapring/core/queues/bounded_queue.hpp>
#include <lapring/core/queues/capacity.hpp>
#include <lapring/core/queues/lap_slot.hpp>
#include <lapring/core/queues/occupancy.hpp>
#include <lapring/core/queues/queue_result.hpp>
#include <lapring/core/queues/wait_policy.hpp>

namespace LapRing {

struct QueueOptions {
    std::string name = "MpmcRingQueue";  // metrics key
    uint32_t min_capacity = kDefaultMinCapacity;
    WaitPolicy wait;
};

template<typename T>
class MpmcRingQueue : public IBoundedQueue<T> {
public:
    explicit MpmcRingQueue(int64_t requested_capacity, QueueOptions options = {})
        : options_(std::move(options)),
          capacity_(checkedCapacity(requested_capacity, options_)),
          mask_(capacity_ - 1),
          slots_(std::make_unique<LapSlot<T>[]>(capacity_)),
          metrics_(MetricRegistry::getInstance().getMetrics(options_.name)) {
        // Slot i expects target i first. Targets are cursor + 1, so slot 0's
        // first target is capacity.
        slots_[0].reset(capacity_);
        for (uint32_t i = 1; i < capacity_; ++i) {
            slots_[i].reset(i);
        }

        spdlog::debug("[MpmcRingQueue] {} created: requested={} capacity={} backoff={} starvation_valve={}",
                      options_.name, requested_capacity, capacity_,
                      to_string(options_.wait.backoff),
                      options_.wait.starvation_valve ? "ON (lossy)" : "off");
    }

    ~MpmcRingQueue() override = default;

    // Copying would duplicate the cursors and desynchronize shared state
    MpmcRingQueue(const MpmcRingQueue&) = delete;
    MpmcRingQueue& operator=(const MpmcRingQueue&) = delete;
    MpmcRingQueue(MpmcRingQueue&&) = delete;
    MpmcRingQueue& operator=(MpmcRingQueue&&) = delete;

    PutResult put(const T& value) override {
        return putValue(value);
    }

    PutResult put(T&& value) override {
        return putValue(std::move(value));
    }

    GetResult<T> get() override {
        GetResult<T> result = drainOne(std::nullopt, true);
        if (result.ok) {
            metrics_.gets_ok.fetch_add(1, std::memory_order_relaxed);
            metrics_.current_depth.store(result.count, std::memory_order_relaxed);
        } else if (result.status == QueueStatus::PLACEHOLDER) {
            metrics_.placeholder_drains.fetch_add(1, std::memory_order_relaxed);
        }
        return result;
    }

    uint32_t capacity() const override { return capacity_; }

    uint32_t count() const override {
        return clampCount(snapshot_cursors(read_cursor_, write_cursor_).occupancy());
    }

    const std::string& name() const override { return options_.name; }

    const WaitPolicy& waitPolicy() const { return options_.wait; }

    QueueMetricSnapshot stats() const { return takeSnapshot(metrics_); }

protected:
    // ------------------------------------------------------------------------
    // Two-phase primitives. put() = reserveWrite + awaitWritable + commitWrite,
    // get() = reserveRead + awaitReadable + commitRead.
    //
    // blocked_on: target generation the caller is already stuck on. Set only
    // for forced operations from the starvation valve. Such a reservation is
    // refused when it maps onto the stuck slot (any lap) or when its own slot
    // is not ready yet, so a forced operation never spins: it cannot end up
    // waiting on the caller or on another stuck operation.
    // ------------------------------------------------------------------------

    std::optional<uint32_t> reserveWrite(PutResult& result,
                                         std::optional<uint32_t> blocked_on = std::nullopt) {
        const CursorSnapshot snap = snapshot_cursors(read_cursor_, write_cursor_);
        const uint32_t count = snap.occupancy();

        // 2-slot margin below raw capacity
        bool denied = count >= capacity_ - 2;
        if (!denied && blocked_on) {
            const uint32_t target = snap.write + 1;
            denied = (target & mask_) == (*blocked_on & mask_) ||
                     !slotFor(target).writable_for(target);
        }
        if (denied) {
            metrics_.put_admission_denied.fetch_add(1, std::memory_order_relaxed);
            result = PutResult{false, clampCount(count), QueueStatus::ADMISSION_DENIED};
            yieldAfterFastFail();
            return std::nullopt;
        }

        uint32_t expected = snap.write;
        if (!write_cursor_.compare_exchange_strong(expected, snap.write + 1,
                                                   std::memory_order_acq_rel,
                                                   std::memory_order_relaxed)) {
            metrics_.put_reservation_lost.fetch_add(1, std::memory_order_relaxed);
            result = PutResult{false, clampCount(count), QueueStatus::RESERVATION_LOST};
            yieldAfterFastFail();
            return std::nullopt;
        }

        result = PutResult{true, clampCount(count + 1), QueueStatus::OK};
        return snap.write + 1;
    }

    std::optional<uint32_t> reserveRead(GetResult<T>& result,
                                        std::optional<uint32_t> blocked_on = std::nullopt) {
        const CursorSnapshot snap = snapshot_cursors(read_cursor_, write_cursor_);
        const uint32_t count = snap.occupancy();

        bool denied = count < 1;
        if (!denied && blocked_on) {
            const uint32_t target = snap.read + 1;
            denied = (target & mask_) == (*blocked_on & mask_) ||
                     !slotFor(target).readable_for(target, capacity_);
        }
        if (denied) {
            metrics_.get_admission_denied.fetch_add(1, std::memory_order_relaxed);
            result.ok = false;
            result.count = clampCount(count);
            result.status = QueueStatus::ADMISSION_DENIED;
            yieldAfterFastFail();
            return std::nullopt;
        }

        uint32_t expected = snap.read;
        if (!read_cursor_.compare_exchange_strong(expected, snap.read + 1,
                                                  std::memory_order_acq_rel,
                                                  std::memory_order_relaxed)) {
            metrics_.get_reservation_lost.fetch_add(1, std::memory_order_relaxed);
            result.ok = false;
            result.count = clampCount(count);
            result.status = QueueStatus::RESERVATION_LOST;
            yieldAfterFastFail();
            return std::nullopt;
        }

        result.ok = true;
        result.count = clampCount(count - 1);
        result.status = QueueStatus::OK;
        return snap.read + 1;
    }

    LapSlot<T>& awaitWritable(uint32_t target, bool allow_valve) {
        LapSlot<T>& slot = slotFor(target);
        Backoff backoff(options_.wait);
        uint32_t stalled = 0;

        while (!slot.writable_for(target)) {
            // A consumer from the previous lap has not vacated the slot yet
            if (allow_valve && options_.wait.starvation_valve &&
                ++stalled >= options_.wait.starvation_spin_limit) {
                stalled = 0;
                evictOne(target);
            }
            backoff.pause();
        }
        return slot;
    }

    LapSlot<T>& awaitReadable(uint32_t target, bool allow_valve) {
        LapSlot<T>& slot = slotFor(target);
        Backoff backoff(options_.wait);
        uint32_t stalled = 0;

        while (!slot.readable_for(target, capacity_)) {
            // The producer that reserved this target has not published yet
            if (allow_valve && options_.wait.starvation_valve &&
                ++stalled >= options_.wait.starvation_spin_limit) {
                stalled = 0;
                injectPlaceholder(target);
            }
            backoff.pause();
        }
        return slot;
    }

    void commitWrite(LapSlot<T>& slot) {
        slot.write_generation.fetch_add(capacity_, std::memory_order_release);
    }

    void commitRead(LapSlot<T>& slot) {
        slot.read_generation.fetch_add(capacity_, std::memory_order_release);
    }

private:
    static uint32_t checkedCapacity(int64_t requested, const QueueOptions& options) {
        if (options.min_capacity < kMinSupportedCapacity) {
            throw std::invalid_argument("min_capacity must be >= " +
                                        std::to_string(kMinSupportedCapacity));
        }
        validate(options.wait);
        return resolve_capacity(requested, options.min_capacity);
    }

    template<typename U>
    PutResult putValue(U&& value) {
        PutResult result;
        std::optional<uint32_t> target = reserveWrite(result);
        if (!target) {
            return result;
        }

        LapSlot<T>& slot = awaitWritable(*target, true);
        slot.payload.emplace(std::forward<U>(value));
        commitWrite(slot);

        metrics_.puts_ok.fetch_add(1, std::memory_order_relaxed);
        metrics_.current_depth.store(result.count, std::memory_order_relaxed);
        return result;
    }

    GetResult<T> drainOne(std::optional<uint32_t> blocked_on, bool allow_valve) {
        GetResult<T> result;
        std::optional<uint32_t> target = reserveRead(result, blocked_on);
        if (!target) {
            return result;
        }

        LapSlot<T>& slot = awaitReadable(*target, allow_valve);
        result.value = std::move(slot.payload);
        slot.payload.reset();
        commitRead(slot);

        if (!result.value) {
            // Slot protocol completed but the slot carried a placeholder
            result.ok = false;
            result.status = QueueStatus::PLACEHOLDER;
        }
        return result;
    }

    // Starvation valve, put side: drop the oldest reachable element.
    void evictOne(uint32_t stuck_target) {
        GetResult<T> evicted = drainOne(stuck_target, false);
        if (evicted.ok) {
            metrics_.starvation_evictions.fetch_add(1, std::memory_order_relaxed);
            spdlog::warn("[MpmcRingQueue] {}: put stalled on generation {}, evicted one element (data lost)",
                         options_.name, stuck_target);
        } else if (evicted.status == QueueStatus::PLACEHOLDER) {
            // Freed a slot without losing data
            metrics_.placeholder_drains.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // Starvation valve, get side: publish an empty payload on the next write slot.
    void injectPlaceholder(uint32_t stuck_target) {
        PutResult result;
        std::optional<uint32_t> target = reserveWrite(result, stuck_target);
        if (!target) {
            return;
        }
        LapSlot<T>& slot = awaitWritable(*target, false);
        slot.payload.reset();
        commitWrite(slot);

        metrics_.starvation_placeholders.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("[MpmcRingQueue] {}: get stalled on generation {}, injected placeholder at generation {}",
                     options_.name, stuck_target, *target);
    }

    void yieldAfterFastFail() const {
        if (options_.wait.yield_on_fast_fail) {
            std::this_thread::yield();
        }
    }

    uint32_t clampCount(uint32_t count) const {
        return count < capacity_ ? count : capacity_ - 1;
    }

    LapSlot<T>& slotFor(uint32_t target) {
        return slots_[target & mask_];
    }

    const QueueOptions options_;
    const uint32_t capacity_;
    const uint32_t mask_;
    std::unique_ptr<LapSlot<T>[]> slots_;
    QueueMetrics& metrics_;

    // Producers CAS write_cursor_, consumers CAS read_cursor_
    alignas(64) std::atomic<uint32_t> write_cursor_{0};
    alignas(64) std::atomic<uint32_t> read_cursor_{0};
};

}  // namespace LapRing
