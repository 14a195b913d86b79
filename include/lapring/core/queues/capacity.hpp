// ============================================================================
// CAPACITY RESOLVER
// ============================================================================
// Ring capacities are powers of two so that "cursor % capacity" becomes
// "cursor & (capacity - 1)".
//
// - Requested values <= 0 mean "use the minimum"
// - The minimum is a contention knob, not a correctness requirement
// - Values above 2^31 saturate (2^32 does not fit in the uint32_t cursors)
// ============================================================================

#pragma once

#include <cstdint>

namespace LapRing {

static constexpr uint32_t kDefaultMinCapacity = 8;

// Below 4 slots the 2-slot admission margin leaves no usable room.
static constexpr uint32_t kMinSupportedCapacity = 4;

static constexpr uint32_t kMaxCapacity = uint32_t{1} << 31;

// Smallest power of two >= v. round_up_pow2(0) == 1.
constexpr uint32_t round_up_pow2(uint32_t v) {
    if (v <= 1) {
        return 1;
    }
    if (v > kMaxCapacity) {
        return kMaxCapacity;  // would wrap to 0 otherwise
    }
    v--;
    v |= v >> 1;
    v |= v >> 2;
    v |= v >> 4;
    v |= v >> 8;
    v |= v >> 16;
    return v + 1;
}

constexpr bool is_pow2(uint32_t v) {
    return v != 0 && (v & (v - 1)) == 0;
}

constexpr uint32_t resolve_capacity(int64_t requested,
                                    uint32_t min_capacity = kDefaultMinCapacity) {
    int64_t wanted = requested > static_cast<int64_t>(min_capacity)
                         ? requested
                         : static_cast<int64_t>(min_capacity);
    if (wanted > static_cast<int64_t>(kMaxCapacity)) {
        return kMaxCapacity;
    }
    return round_up_pow2(static_cast<uint32_t>(wanted));
}

}  // namespace LapRing
