#include <lapring/core/queues/queue_result.hpp>

namespace LapRing {

const char* to_string(QueueStatus status) {
    switch (status) {
        case QueueStatus::OK:
            return "OK";
        case QueueStatus::ADMISSION_DENIED:
            return "ADMISSION_DENIED";
        case QueueStatus::RESERVATION_LOST:
            return "RESERVATION_LOST";
        case QueueStatus::PLACEHOLDER:
            return "PLACEHOLDER";
    }
    return "UNKNOWN";
}

}  // namespace LapRing
