#include <lapring/core/metrics/reporter.hpp>
#include <spdlog/spdlog.h>

namespace LapRing {

MetricsReporter::~MetricsReporter() noexcept {
    stop();
}

void MetricsReporter::start() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    worker_ = std::thread(&MetricsReporter::loop, this);
}

void MetricsReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        running_.store(false, std::memory_order_release);
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void MetricsReporter::loop() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (running_.load(std::memory_order_acquire)) {
        // Wake early on stop() instead of sleeping out the interval
        if (cv_.wait_for(lock, interval_, [this] { return !running_.load(std::memory_order_acquire); })) {
            break;
        }
        lock.unlock();
        reportOnce();
        lock.lock();
    }
}

size_t MetricsReporter::reportOnce() {
    auto snaps = MetricRegistry::getInstance().getSnapshots();

    spdlog::info("========================================================");
    spdlog::info("              QUEUE METRICS SNAPSHOT                    ");
    spdlog::info("========================================================");

    for (const auto& [name, s] : snaps) {
        spdlog::info("");
        spdlog::info("[{}]", name);
        spdlog::info("  +- Puts:        {} ok, {} denied (full), {} lost races",
                     s.puts_ok, s.put_admission_denied, s.put_reservation_lost);
        spdlog::info("  +- Gets:        {} ok, {} denied (empty), {} lost races",
                     s.gets_ok, s.get_admission_denied, s.get_reservation_lost);
        spdlog::info("  +- Depth:       {} items", s.current_depth);
        spdlog::info("  +- Contention:  {:.2f}%", s.contention_rate_percent());
        if (s.loss_total() > 0 || s.placeholder_drains > 0) {
            spdlog::warn("  +- Starvation:  {} evicted, {} placeholders injected, {} placeholders drained",
                         s.starvation_evictions, s.starvation_placeholders, s.placeholder_drains);
        }
    }

    spdlog::info("========================================================");
    return snaps.size();
}

}  // namespace LapRing
