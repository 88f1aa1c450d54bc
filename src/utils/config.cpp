#include "utils/config.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

namespace streamingcore {
namespace utils {

namespace {

const network::NetworkQuality kAllQualities[] = {
    network::NetworkQuality::OFFLINE,
    network::NetworkQuality::POOR,
    network::NetworkQuality::FAIR,
    network::NetworkQuality::GOOD,
    network::NetworkQuality::EXCELLENT
};

const nlohmann::json* section(const nlohmann::json& parent, const char* key) {
    if (!parent.contains(key)) {
        return nullptr;
    }
    const auto& value = parent.at(key);
    if (!value.is_object()) {
        throw ConfigurationException("Invalid configuration", std::string("'") + key + "' must be an object");
    }
    return &value;
}

double readNumber(const nlohmann::json& parent, const char* key, double fallback) {
    if (!parent.contains(key)) {
        return fallback;
    }
    const auto& value = parent.at(key);
    if (!value.is_number()) {
        throw ConfigurationException("Invalid configuration", std::string("'") + key + "' must be a number");
    }
    return value.get<double>();
}

long long readPositiveInteger(const nlohmann::json& parent, const char* key, long long fallback) {
    if (!parent.contains(key)) {
        return fallback;
    }
    const auto& value = parent.at(key);
    if (!value.is_number_integer()) {
        throw ConfigurationException("Invalid configuration", std::string("'") + key + "' must be an integer");
    }
    long long result = value.get<long long>();
    if (result <= 0) {
        throw ConfigurationException("Invalid configuration", std::string("'") + key + "' must be positive");
    }
    return result;
}

std::string readString(const nlohmann::json& parent, const char* key, const std::string& fallback) {
    if (!parent.contains(key)) {
        return fallback;
    }
    const auto& value = parent.at(key);
    if (!value.is_string()) {
        throw ConfigurationException("Invalid configuration", std::string("'") + key + "' must be a string");
    }
    return value.get<std::string>();
}

bool isKnownLogLevel(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper == "DEBUG" || upper == "INFO" || upper == "WARN" || upper == "WARNING" || upper == "ERROR";
}

} // namespace

Config Config::load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open()) {
        Logger::warn("Config file not found: " + configPath + ", using defaults");
        return Config();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    Config config = fromJson(buffer.str());
    Logger::info("Configuration loaded from: " + configPath);
    return config;
}

Config Config::fromJson(const std::string& json) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationException("Malformed configuration JSON", e.what());
    }

    if (!j.is_object()) {
        throw ConfigurationException("Invalid configuration", "top level must be an object");
    }

    Config config;

    config.logLevel_ = readString(j, "logLevel", config.logLevel_);
    if (!isKnownLogLevel(config.logLevel_)) {
        throw ConfigurationException("Invalid configuration", "unknown log level '" + config.logLevel_ + "'");
    }

    if (const auto* memory = section(j, "memory")) {
        auto& thresholds = config.memoryThresholds_;
        thresholds.warningAvailableMB = readNumber(*memory, "warningAvailableMB", thresholds.warningAvailableMB);
        thresholds.criticalAvailableMB = readNumber(*memory, "criticalAvailableMB", thresholds.criticalAvailableMB);
        thresholds.pollingInterval = std::chrono::milliseconds(
            readPositiveInteger(*memory, "pollingIntervalMs", thresholds.pollingInterval.count()));
    }

    if (config.memoryThresholds_.criticalAvailableMB >= config.memoryThresholds_.warningAvailableMB) {
        throw ConfigurationException("Invalid configuration",
                                     "criticalAvailableMB must be below warningAvailableMB");
    }

    if (const auto* network = section(j, "network")) {
        config.networkMonitoringIntervalMs_ = static_cast<int>(
            readPositiveInteger(*network, "monitoringIntervalMs", config.networkMonitoringIntervalMs_));
        config.networkHistorySize_ = static_cast<size_t>(
            readPositiveInteger(*network, "historySize", static_cast<long long>(config.networkHistorySize_)));

        if (const auto* ceilings = section(*network, "ceilings")) {
            for (auto it = ceilings->begin(); it != ceilings->end(); ++it) {
                auto quality = network::parseNetworkQuality(it.key());
                if (!quality) {
                    throw ConfigurationException("Invalid configuration",
                                                 "unknown network quality '" + it.key() + "'");
                }
                if (!it.value().is_string()) {
                    throw ConfigurationException("Invalid configuration",
                                                 "ceiling for '" + it.key() + "' must be a string");
                }
                auto strategy = buffer::parseStrategy(it.value().get<std::string>());
                if (!strategy) {
                    throw ConfigurationException("Invalid configuration",
                                                 "unknown buffer strategy '" + it.value().get<std::string>() + "'");
                }
                config.ceilingPolicy_.setCeiling(*quality, *strategy);
            }
        }
    }

    return config;
}

std::string Config::toJson() const {
    nlohmann::json j;
    j["logLevel"] = logLevel_;
    j["memory"] = {
        {"warningAvailableMB", memoryThresholds_.warningAvailableMB},
        {"criticalAvailableMB", memoryThresholds_.criticalAvailableMB},
        {"pollingIntervalMs", memoryThresholds_.pollingInterval.count()}
    };

    nlohmann::json ceilings = nlohmann::json::object();
    for (auto quality : kAllQualities) {
        ceilings[network::networkQualityName(quality)] = buffer::strategyName(ceilingPolicy_.ceilingFor(quality));
    }
    j["network"] = {
        {"monitoringIntervalMs", networkMonitoringIntervalMs_},
        {"historySize", networkHistorySize_},
        {"ceilings", ceilings}
    };

    return j.dump(2);
}

} // namespace utils
} // namespace streamingcore
