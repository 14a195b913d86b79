#include <spdlog/spdlog.h>
#include <cstdlib>
#include <chrono>
#include <memory>

#include <lapring/core/config/loader.hpp>
#include <lapring/core/metrics/reporter.hpp>
#include <lapring/core/queues/mpmc_ring_queue.hpp>
#include <lapring/core/stress/stress_runner.hpp>

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging(const AppConfig::LoggingConfig& logging) {
    spdlog::set_pattern(logging.pattern);
    spdlog::set_level(spdlog::level::from_str(logging.level));
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

static void logReport(const LapRing::StressReport& r) {
    spdlog::info("=== STRESS REPORT ===");
    spdlog::info("  expected      = {}", r.expected);
    spdlog::info("  produced      = {}", r.produced);
    spdlog::info("  consumed      = {}", r.consumed);
    spdlog::info("  duplicates    = {}", r.duplicates);
    spdlog::info("  out of range  = {}", r.out_of_range);
    spdlog::info("  missing       = {}", r.missing);
    if (r.evicted > 0 || r.placeholder_drains > 0) {
        spdlog::warn("  evicted       = {} (starvation valve)", r.evicted);
        spdlog::warn("  placeholders  = {} (starvation valve)", r.placeholder_drains);
    }
    if (r.timed_out_ops > 0) {
        spdlog::warn("  timed out     = {}", r.timed_out_ops);
    }
    spdlog::info("  elapsed       = {:.3f} s", r.elapsed_seconds);
    spdlog::info("  throughput    = {:.2f} M ops/s", r.throughput_ops_per_sec() / 1e6);
}

int main(int argc, char* argv[]) {
    try {
        auto config = loadConfiguration(argc, argv);
        setupLogging(config.logging);
        spdlog::info("{} v{} starting...", config.app_name, config.version);
        spdlog::info("Build: {} {}", __DATE__, __TIME__);

        auto queue = std::make_unique<LapRing::MpmcRingQueue<uint64_t>>(
            config.queue.capacity, ConfigLoader::toQueueOptions(config.queue));
        spdlog::info("Queue {} ready: capacity={} starvation_valve={}",
                     queue->name(), queue->capacity(),
                     config.queue.starvationValve.enable ? "ON (lossy)" : "off");

        LapRing::MetricsReporter reporter(std::chrono::milliseconds(config.stress.reportIntervalMs));
        reporter.start();

        LapRing::StressRunner runner(*queue, config.stress);
        LapRing::StressReport report = runner.run();

        reporter.stop();
        reporter.reportOnce();
        logReport(report);

        if (!report.passed()) {
            spdlog::error("FAIL: exactly-once check did not hold");
            return EXIT_FAILURE;
        }
        spdlog::info("PASS: exactly-once under MPMC load");
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
