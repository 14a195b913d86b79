#pragma once
#include <cstdint>
#include <string>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct WaitConfig {
    std::string backoff = "yield";   // spin | yield | sleep
    uint32_t spinsBeforeBackoff = 0;
    uint32_t sleepUs = 50;
    bool yieldOnFastFail = true;
};

struct StarvationValveConfig {
    bool enable = false;
    uint32_t spinLimit = 100;
};

struct QueueConfig {
    std::string name = "MpmcRingQueue";
    int64_t capacity = 0;            // required
    uint32_t minCapacity = 8;
    WaitConfig wait;
    StarvationValveConfig starvationValve;
};

struct StressConfig {
    uint32_t producers = 0;          // required
    uint32_t consumers = 0;          // required
    uint64_t itemsPerProducer = 0;   // required
    bool pinThreads = false;
    uint32_t reportIntervalMs = 1000;
    uint32_t deadlineMs = 0;         // per-operation retry deadline, 0 = retry forever
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    QueueConfig queue;
    StressConfig stress;
};

} // namespace AppConfig
