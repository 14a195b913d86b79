#pragma once
#include <thread>

namespace LapRing {

// Pin a running thread to one CPU core. Throws std::runtime_error on failure.
void pinThreadToCore(std::thread& t, int core_id);

// Number of cores available for pinning (at least 1).
int availableCores();

}  // namespace LapRing
