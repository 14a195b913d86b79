#pragma once

#include <atomic>
#include <cstdint>

namespace LapRing {

// Approximate number of buffered items between two cursor snapshots.
// Unsigned subtraction keeps the distance correct when the write cursor has
// wrapped past 2^32 and the read cursor has not.
// Admission control only: slot generations are the source of truth.
constexpr uint32_t estimate_occupancy(uint32_t read, uint32_t write) {
    return write - read;
}

struct CursorSnapshot {
    uint32_t read;
    uint32_t write;

    uint32_t occupancy() const { return estimate_occupancy(read, write); }
};

// Read cursor first: the live cursors satisfy read <= write, so a stale read
// paired with a newer write can only overestimate, never go negative.
inline CursorSnapshot snapshot_cursors(const std::atomic<uint32_t>& read_cursor,
                                       const std::atomic<uint32_t>& write_cursor) {
    CursorSnapshot s;
    s.read = read_cursor.load(std::memory_order_acquire);
    s.write = write_cursor.load(std::memory_order_acquire);
    return s;
}

}  // namespace LapRing
