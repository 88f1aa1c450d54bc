#pragma once

#include "buffer/network_ceiling_policy.hpp"
#include "memory/memory_thresholds.hpp"
#include <cstddef>
#include <string>

namespace streamingcore {
namespace utils {

/**
 * Runtime settings read from a JSON file. Every key is optional and missing
 * keys keep their defaults.
 *
 * {
 *   "logLevel": "INFO",
 *   "memory": { "warningAvailableMB": 100, "criticalAvailableMB": 50, "pollingIntervalMs": 2000 },
 *   "network": { "monitoringIntervalMs": 1000, "historySize": 60,
 *                "ceilings": { "poor": "minimal", "excellent": "aggressive", ... } }
 * }
 */
class Config {
public:
    /**
     * Load configuration from a file. A missing file logs a warning and
     * yields defaults.
     * @throws ConfigurationException on malformed or invalid content
     */
    static Config load(const std::string& configPath);

    /**
     * Parse configuration from a JSON document
     * @throws ConfigurationException on malformed or invalid content
     */
    static Config fromJson(const std::string& json);

    static Config defaults() { return Config(); }

    const std::string& getLogLevel() const { return logLevel_; }
    const memory::MemoryThresholds& getMemoryThresholds() const { return memoryThresholds_; }
    int getNetworkMonitoringIntervalMs() const { return networkMonitoringIntervalMs_; }
    size_t getNetworkHistorySize() const { return networkHistorySize_; }
    const buffer::NetworkCeilingPolicy& getCeilingPolicy() const { return ceilingPolicy_; }

    std::string toJson() const;

private:
    Config() = default;

    std::string logLevel_ = "INFO";
    memory::MemoryThresholds memoryThresholds_;
    int networkMonitoringIntervalMs_ = 1000;
    size_t networkHistorySize_ = 60;
    buffer::NetworkCeilingPolicy ceilingPolicy_;
};

} // namespace utils
} // namespace streamingcore
