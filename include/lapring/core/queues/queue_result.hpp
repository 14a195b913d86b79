#pragma once

#include <cstdint>
#include <optional>

namespace LapRing {

// Outcome of a single put/get attempt. Nothing here is an error: a failed
// attempt means "no progress, retry or back off".
enum class QueueStatus : uint8_t {
    OK = 0,
    ADMISSION_DENIED = 1,   // looked full (put) or empty (get), nothing mutated
    RESERVATION_LOST = 2,   // another caller won the cursor CAS
    PLACEHOLDER = 3         // get drained an empty payload injected by the starvation valve
};

const char* to_string(QueueStatus status);

struct PutResult {
    bool ok = false;
    uint32_t count = 0;     // approximate occupancy after the attempt
    QueueStatus status = QueueStatus::ADMISSION_DENIED;
};

template<typename T>
struct GetResult {
    std::optional<T> value;
    bool ok = false;
    uint32_t count = 0;
    QueueStatus status = QueueStatus::ADMISSION_DENIED;
};

}  // namespace LapRing
