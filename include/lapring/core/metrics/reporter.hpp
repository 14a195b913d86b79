#pragma once
#include <lapring/core/metrics/registry.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace LapRing {

/**
 * CONTROL PLANE: Metrics Reporter
 * Periodically logs a snapshot of every registered queue.
 */
class MetricsReporter {
public:
    explicit MetricsReporter(std::chrono::milliseconds interval = std::chrono::seconds(5))
        : interval_(interval) {}
    ~MetricsReporter() noexcept;

    MetricsReporter(const MetricsReporter&) = delete;
    MetricsReporter& operator=(const MetricsReporter&) = delete;

    void start();
    void stop();

    // Logs one snapshot on the calling thread, returns the number of queues reported.
    size_t reportOnce();

private:
    void loop();

    std::chrono::milliseconds interval_;
    std::atomic<bool> running_{false};
    std::mutex mtx_;
    std::condition_variable cv_;
    std::thread worker_;
};

}  // namespace LapRing
