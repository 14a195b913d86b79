#include <lapring/core/config/loader.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <limits>
#include <stdexcept>

namespace {

// Dotted path used in error messages, e.g. "queue.wait.backoff"
std::string joinPath(const std::string& parent, const std::string& key) {
    return parent.empty() ? key : parent + "." + key;
}

YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        throw std::runtime_error("Missing required config field: " + joinPath(path, key));
    }
    return node;
}

template<typename T>
T convert(const YAML::Node& node, const std::string& fullPath) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field " + fullPath + ": " + e.what());
    }
}

template<typename T>
T requiredField(const YAML::Node& parent, const std::string& key, const std::string& path) {
    return convert<T>(requireNode(parent, key, path), joinPath(path, key));
}

template<typename T>
T optionalField(const YAML::Node& parent, const std::string& key, const std::string& path, T fallback) {
    if (!parent) {
        return fallback;
    }
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) {
        return fallback;
    }
    return convert<T>(node, joinPath(path, key));
}

// Integers go through int64_t so that "-3" for an unsigned field is reported
// as an invalid value instead of wrapping.
uint64_t checkedUnsigned(int64_t value, const std::string& fullPath, uint64_t minimum,
                         uint64_t maximum = std::numeric_limits<uint32_t>::max()) {
    if (value < 0 || static_cast<uint64_t>(value) < minimum || static_cast<uint64_t>(value) > maximum) {
        throw std::runtime_error("Invalid value for config field " + fullPath + ": " +
                                 std::to_string(value) + " (expected " + std::to_string(minimum) +
                                 ".." + std::to_string(maximum) + ")");
    }
    return static_cast<uint64_t>(value);
}

void loadLogging(const YAML::Node& root, AppConfig::LoggingConfig& out) {
    YAML::Node node = root["logging"];
    if (!node) {
        return;
    }
    out.level = optionalField<std::string>(node, "level", "logging", out.level);
    out.pattern = optionalField<std::string>(node, "pattern", "logging", out.pattern);

    if (spdlog::level::from_str(out.level) == spdlog::level::off && out.level != "off") {
        throw std::runtime_error("Invalid value for config field logging.level: " + out.level);
    }
}

void loadQueue(const YAML::Node& root, AppConfig::QueueConfig& out) {
    YAML::Node node = requireNode(root, "queue", "");

    out.name = optionalField<std::string>(node, "name", "queue", out.name);
    if (out.name.empty()) {
        throw std::runtime_error("Invalid value for config field queue.name: empty");
    }
    // Zero or negative means "use min_capacity", same as the queue constructor
    out.capacity = requiredField<int64_t>(node, "capacity", "queue");
    out.minCapacity = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(node, "min_capacity", "queue", out.minCapacity),
        "queue.min_capacity", LapRing::kMinSupportedCapacity, LapRing::kMaxCapacity));

    YAML::Node wait = node["wait"];
    out.wait.backoff = optionalField<std::string>(wait, "backoff", "queue.wait", out.wait.backoff);
    try {
        LapRing::parseBackoffMode(out.wait.backoff);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid value for config field queue.wait.backoff: " + out.wait.backoff);
    }
    out.wait.spinsBeforeBackoff = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(wait, "spins_before_backoff", "queue.wait", out.wait.spinsBeforeBackoff),
        "queue.wait.spins_before_backoff", 0));
    out.wait.sleepUs = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(wait, "sleep_us", "queue.wait", out.wait.sleepUs),
        "queue.wait.sleep_us", 1));
    out.wait.yieldOnFastFail = optionalField<bool>(wait, "yield_on_fast_fail", "queue.wait", out.wait.yieldOnFastFail);

    YAML::Node valve = node["starvation_valve"];
    out.starvationValve.enable = optionalField<bool>(valve, "enable", "queue.starvation_valve",
                                                out.starvationValve.enable);
    out.starvationValve.spinLimit = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(valve, "spin_limit", "queue.starvation_valve", out.starvationValve.spinLimit),
        "queue.starvation_valve.spin_limit", 1));
}

void loadStress(const YAML::Node& root, AppConfig::StressConfig& out) {
    YAML::Node node = requireNode(root, "stress", "");

    out.producers = static_cast<uint32_t>(checkedUnsigned(
        requiredField<int64_t>(node, "producers", "stress"), "stress.producers", 1, 1024));
    out.consumers = static_cast<uint32_t>(checkedUnsigned(
        requiredField<int64_t>(node, "consumers", "stress"), "stress.consumers", 1, 1024));
    out.itemsPerProducer = checkedUnsigned(
        requiredField<int64_t>(node, "items_per_producer", "stress"), "stress.items_per_producer", 1,
        std::numeric_limits<uint32_t>::max());
    out.pinThreads = optionalField<bool>(node, "pin_threads", "stress", out.pinThreads);
    out.reportIntervalMs = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(node, "report_interval_ms", "stress", out.reportIntervalMs),
        "stress.report_interval_ms", 1));
    out.deadlineMs = static_cast<uint32_t>(checkedUnsigned(
        optionalField<int64_t>(node, "deadline_ms", "stress", out.deadlineMs),
        "stress.deadline_ms", 0));
}

}  // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Config file not found or unreadable: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Config file " + filepath + " is not valid YAML: " + e.what());
    }

    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a YAML mapping");
    }

    AppConfig::AppConfiguration config;
    config.app_name = requiredField<std::string>(root, "app_name", "");
    config.version = requiredField<std::string>(root, "version", "");
    loadLogging(root, config.logging);
    loadQueue(root, config.queue);
    loadStress(root, config.stress);

    spdlog::debug("[ConfigLoader] Loaded {}: queue={} capacity={} producers={} consumers={}",
                  filepath, config.queue.name, config.queue.capacity,
                  config.stress.producers, config.stress.consumers);
    return config;
}

LapRing::QueueOptions ConfigLoader::toQueueOptions(const AppConfig::QueueConfig& config) {
    LapRing::QueueOptions options;
    options.name = config.name;
    options.min_capacity = config.minCapacity;
    options.wait.backoff = LapRing::parseBackoffMode(config.wait.backoff);
    options.wait.spins_before_backoff = config.wait.spinsBeforeBackoff;
    options.wait.sleep_duration = std::chrono::microseconds(config.wait.sleepUs);
    options.wait.yield_on_fast_fail = config.wait.yieldOnFastFail;
    options.wait.starvation_valve = config.starvationValve.enable;
    options.wait.starvation_spin_limit = config.starvationValve.spinLimit;
    return options;
}
