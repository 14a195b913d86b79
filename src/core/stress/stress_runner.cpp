#include <lapring/core/stress/stress_runner.hpp>
#include <lapring/core/queues/retry.hpp>
#include <lapring/core/utils/clock.hpp>
#include <lapring/core/utils/thread_affinity.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace LapRing {

StressRunner::StressRunner(MpmcRingQueue<uint64_t>& queue, const AppConfig::StressConfig& config)
    : queue_(queue),
      config_(config),
      total_(static_cast<uint64_t>(config.producers) * config.itemsPerProducer),
      visited_(total_) {
    if (config_.producers == 0 || config_.consumers == 0) {
        throw std::invalid_argument("StressRunner needs at least one producer and one consumer");
    }
    for (auto& v : visited_) {
        v.store(0, std::memory_order_relaxed);
    }
}

bool StressRunner::settled() const {
    auto stats = queue_.stats();
    uint64_t evicted = stats.starvation_evictions - evictions_before_;
    return consumed_.load(std::memory_order_acquire) + evicted +
               timed_out_.load(std::memory_order_acquire) >= total_;
}

void StressRunner::record(uint64_t value) {
    if (value >= total_) {
        out_of_range_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[StressRunner] Out-of-range value {}", value);
        return;
    }
    uint8_t prev = visited_[value].exchange(1, std::memory_order_relaxed);
    if (prev != 0) {
        duplicates_.fetch_add(1, std::memory_order_relaxed);
        spdlog::error("[StressRunner] Duplicate value {}", value);
        return;
    }
    consumed_.fetch_add(1, std::memory_order_release);
}

void StressRunner::produce(uint32_t producer_id) {
    while (!go_.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }

    const WaitPolicy& policy = queue_.waitPolicy();
    const uint64_t base = static_cast<uint64_t>(producer_id) * config_.itemsPerProducer;

    for (uint64_t i = 0; i < config_.itemsPerProducer; ++i) {
        const uint64_t value = base + i;
        if (config_.deadlineMs == 0) {
            Backoff backoff(policy);
            while (!queue_.put(value).ok) {
                backoff.pause();
            }
        } else {
            auto deadline = std::chrono::steady_clock::now() +
                            std::chrono::milliseconds(config_.deadlineMs);
            PutResult r = put_until<uint64_t>(queue_, value, deadline, policy);
            if (!r.ok) {
                timed_out_.fetch_add(1, std::memory_order_release);
                spdlog::warn("[StressRunner] Producer {} gave up on value {} after {} ms ({})",
                             producer_id, value, config_.deadlineMs, to_string(r.status));
                continue;
            }
        }
        produced_.fetch_add(1, std::memory_order_relaxed);
    }
    producers_done_.fetch_add(1, std::memory_order_release);
}

void StressRunner::consume() {
    while (!go_.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }

    Backoff backoff(queue_.waitPolicy());
    while (!settled()) {
        GetResult<uint64_t> r = queue_.get();
        if (r.ok) {
            record(*r.value);
            backoff.reset();
        } else {
            backoff.pause();
        }
    }
}

StressReport StressRunner::run() {
    auto baseline = queue_.stats();
    evictions_before_ = baseline.starvation_evictions;
    placeholders_before_ = baseline.placeholder_drains;

    spdlog::info("[StressRunner] {} producers x {} items, {} consumers, queue {} (capacity {})",
                 config_.producers, config_.itemsPerProducer, config_.consumers,
                 queue_.name(), queue_.capacity());

    std::vector<std::thread> threads;
    threads.reserve(config_.producers + config_.consumers);
    for (uint32_t p = 0; p < config_.producers; ++p) {
        threads.emplace_back(&StressRunner::produce, this, p);
    }
    for (uint32_t c = 0; c < config_.consumers; ++c) {
        threads.emplace_back(&StressRunner::consume, this);
    }

    if (config_.pinThreads) {
        const int cores = availableCores();
        for (size_t i = 0; i < threads.size(); ++i) {
            try {
                pinThreadToCore(threads[i], static_cast<int>(i % cores));
            } catch (const std::runtime_error& e) {
                spdlog::warn("[StressRunner] Pinning thread {} failed, running unpinned: {}", i, e.what());
            }
        }
    }

    const uint64_t start_ns = Clock::now_ns();
    go_.store(true, std::memory_order_release);
    for (auto& t : threads) {
        t.join();
    }
    const uint64_t end_ns = Clock::now_ns();

    auto after = queue_.stats();

    StressReport report;
    report.expected = total_;
    report.produced = produced_.load();
    report.consumed = consumed_.load();
    report.duplicates = duplicates_.load();
    report.out_of_range = out_of_range_.load();
    report.timed_out_ops = timed_out_.load();
    report.evicted = after.starvation_evictions - evictions_before_;
    report.placeholder_drains = after.placeholder_drains - placeholders_before_;
    report.elapsed_seconds = Clock::elapsed_seconds(start_ns, end_ns);

    uint64_t unvisited = 0;
    for (uint64_t i = 0; i < total_; ++i) {
        if (visited_[i].load(std::memory_order_relaxed) == 0) {
            if (++unvisited <= 10 && report.evicted == 0 && report.timed_out_ops == 0) {
                spdlog::error("[StressRunner] Missing value {}", i);
            }
        }
    }
    // Evicted and never-produced values are accounted for, not missing
    uint64_t accounted = report.evicted + report.timed_out_ops;
    report.missing = unvisited > accounted ? unvisited - accounted : 0;

    return report;
}

}  // namespace LapRing
