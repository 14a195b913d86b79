#include <lapring/core/utils/thread_affinity.hpp>
#include <stdexcept>
#include <string>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace LapRing {

void pinThreadToCore(std::thread& t, int core_id) {
    if (!t.joinable()) {
        throw std::runtime_error("Thread is not joinable - cannot set affinity");
    }
    if (core_id < 0) {
        throw std::runtime_error("Invalid core_id: " + std::to_string(core_id));
    }

#ifdef __linux__
    cpu_set_t cpuset;
    CPU_ZERO(&cpuset);
    CPU_SET(core_id, &cpuset);
    int rc = pthread_setaffinity_np(t.native_handle(), sizeof(cpu_set_t), &cpuset);
    if (rc != 0) {
        throw std::runtime_error("Error calling pthread_setaffinity_np: " + std::to_string(rc));
    }
#else
    throw std::runtime_error("Thread affinity not supported on this platform");
#endif
}

int availableCores() {
    unsigned n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<int>(n);
}

}  // namespace LapRing
