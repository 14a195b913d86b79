#pragma once
#include <lapring/core/metrics/metrics.hpp>
#include <unordered_map>
#include <string>
#include <string_view>
#include <mutex>
#include <optional>

namespace LapRing {

/**
 * Process-wide registry of queue counters, keyed by queue name.
 * Queues sharing a name share one QueueMetrics.
 */
class MetricRegistry {
public:
    static MetricRegistry& getInstance();

    QueueMetrics& getMetrics(const std::string& name);
    QueueMetrics& getMetrics(std::string_view name);
    std::unordered_map<std::string, QueueMetricSnapshot> getSnapshots();
    std::optional<QueueMetricSnapshot> getSnapshot(const std::string& name);

    // Zero the counters of one queue; the QueueMetrics object stays valid.
    void reset(const std::string& name);

private:
    // std::unordered_map keeps element addresses stable across rehash,
    // queues hold references into it.
    std::unordered_map<std::string, QueueMetrics> metrics_map_;
    mutable std::mutex mtx_;

    MetricRegistry() = default;
    ~MetricRegistry() = default;
    MetricRegistry(const MetricRegistry&) = delete;
    MetricRegistry& operator=(const MetricRegistry&) = delete;
};

}  // namespace LapRing
