#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

namespace LapRing {

/**
 * @struct LapSlot
 * @brief One ring cell with a write generation and a read generation
 *
 * Lap encoding (capacity C, slot index i, k completed laps):
 * - empty:        write_generation == read_generation == i + k*C
 * - holds value:  write_generation == read_generation + C
 *
 * A producer owns the slot when write_generation == read_generation == its
 * target; a consumer owns it when read_generation == its target and
 * write_generation == target + C. Only one reservation can produce a given
 * target, so payload needs no atomics.
 *
 * payload being disengaged is the explicit "no value" marker, so every T is
 * a legal payload.
 */
template<typename T>
struct alignas(64) LapSlot {
    std::atomic<uint32_t> write_generation{0};
    std::atomic<uint32_t> read_generation{0};
    std::optional<T> payload;

    void reset(uint32_t generation) {
        write_generation.store(generation, std::memory_order_relaxed);
        read_generation.store(generation, std::memory_order_relaxed);
        payload.reset();
    }

    bool writable_for(uint32_t target) const {
        uint32_t w = write_generation.load(std::memory_order_acquire);
        uint32_t r = read_generation.load(std::memory_order_acquire);
        return w == target && r == w;
    }

    bool readable_for(uint32_t target, uint32_t capacity) const {
        uint32_t r = read_generation.load(std::memory_order_acquire);
        uint32_t w = write_generation.load(std::memory_order_acquire);
        return r == target && r + capacity == w;
    }
};

}  // namespace LapRing
