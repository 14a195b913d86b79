#pragma once
#include <lapring/core/config/app_config.hpp>
#include <lapring/core/queues/mpmc_ring_queue.hpp>
#include <string>

class ConfigLoader {
public:
    // Throws std::runtime_error on a missing file, missing required field,
    // wrong field type or invalid value.
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    static LapRing::QueueOptions toQueueOptions(const AppConfig::QueueConfig& config);
};
