#include <lapring/core/metrics/registry.hpp>

namespace LapRing {

QueueMetricSnapshot takeSnapshot(const QueueMetrics& m) {
    QueueMetricSnapshot snap;
    snap.puts_ok = m.puts_ok.load(std::memory_order_relaxed);
    snap.gets_ok = m.gets_ok.load(std::memory_order_relaxed);
    snap.put_admission_denied = m.put_admission_denied.load(std::memory_order_relaxed);
    snap.get_admission_denied = m.get_admission_denied.load(std::memory_order_relaxed);
    snap.put_reservation_lost = m.put_reservation_lost.load(std::memory_order_relaxed);
    snap.get_reservation_lost = m.get_reservation_lost.load(std::memory_order_relaxed);
    snap.starvation_evictions = m.starvation_evictions.load(std::memory_order_relaxed);
    snap.starvation_placeholders = m.starvation_placeholders.load(std::memory_order_relaxed);
    snap.placeholder_drains = m.placeholder_drains.load(std::memory_order_relaxed);
    snap.current_depth = m.current_depth.load(std::memory_order_relaxed);
    return snap;
}

MetricRegistry& MetricRegistry::getInstance() {
    static MetricRegistry instance;
    return instance;
}

QueueMetrics& MetricRegistry::getMetrics(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    // try_emplace: QueueMetrics holds atomics and cannot be copied
    auto [it, inserted] = metrics_map_.try_emplace(name);
    return it->second;
}

QueueMetrics& MetricRegistry::getMetrics(std::string_view name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto [it, inserted] = metrics_map_.try_emplace(std::string(name));
    return it->second;
}

std::unordered_map<std::string, QueueMetricSnapshot> MetricRegistry::getSnapshots() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::unordered_map<std::string, QueueMetricSnapshot> snaps;
    snaps.reserve(metrics_map_.size());
    for (auto& [name, m] : metrics_map_) {
        snaps[name] = takeSnapshot(m);
    }
    return snaps;
}

std::optional<QueueMetricSnapshot> MetricRegistry::getSnapshot(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return std::nullopt;
    return takeSnapshot(it->second);
}

void MetricRegistry::reset(const std::string& name) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = metrics_map_.find(name);
    if (it == metrics_map_.end()) return;

    QueueMetrics& m = it->second;
    m.puts_ok.store(0, std::memory_order_relaxed);
    m.gets_ok.store(0, std::memory_order_relaxed);
    m.put_admission_denied.store(0, std::memory_order_relaxed);
    m.get_admission_denied.store(0, std::memory_order_relaxed);
    m.put_reservation_lost.store(0, std::memory_order_relaxed);
    m.get_reservation_lost.store(0, std::memory_order_relaxed);
    m.starvation_evictions.store(0, std::memory_order_relaxed);
    m.starvation_placeholders.store(0, std::memory_order_relaxed);
    m.placeholder_drains.store(0, std::memory_order_relaxed);
    m.current_depth.store(0, std::memory_order_relaxed);
}

}  // namespace LapRing
