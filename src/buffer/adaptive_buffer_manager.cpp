#include "buffer/adaptive_buffer_manager.hpp"
#include "utils/logging.hpp"

namespace streamingcore {
namespace buffer {

AdaptiveBufferManager::AdaptiveBufferManager(const memory::MemoryThresholds& thresholds,
                                             const NetworkCeilingPolicy& ceilingPolicy)
    : thresholds_(thresholds)
    , ceilingPolicy_(ceilingPolicy)
    , memoryPressure_(memory::MemoryPressureLevel::NORMAL)
    , networkQuality_(network::NetworkQuality::GOOD)
    , configuration_(computeConfiguration(memory::MemoryPressureLevel::NORMAL,
                                          network::NetworkQuality::GOOD, ceilingPolicy))
    , broadcaster_("AdaptiveBufferManager")
    , totalUpdates_(0)
    , configurationChanges_(0) {
    utils::Logger::debug("AdaptiveBufferManager initial configuration: " + configuration_.toString());
}

AdaptiveBufferManager::~AdaptiveBufferManager() {
    broadcaster_.finish();
}

void AdaptiveBufferManager::updateMemoryState(const memory::MemoryState& state) {
    updateMemoryPressure(state.pressureLevel(thresholds_));
}

void AdaptiveBufferManager::updateMemoryPressure(memory::MemoryPressureLevel level) {
    std::lock_guard<std::mutex> updateLock(updateMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        memoryPressure_ = level;
    }
    recompute(std::string("memory pressure ") + memory::pressureLevelName(level));
}

void AdaptiveBufferManager::updateNetworkQuality(network::NetworkQuality quality) {
    std::lock_guard<std::mutex> updateLock(updateMutex_);
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        networkQuality_ = quality;
    }
    recompute(std::string("network quality ") + network::networkQualityName(quality));
}

void AdaptiveBufferManager::recompute(const std::string& trigger) {
    totalUpdates_++;

    BufferConfiguration next = BufferConfiguration::balanced();
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        next = computeConfiguration(memoryPressure_, networkQuality_, ceilingPolicy_);
        if (next == configuration_) {
            return;
        }
        configuration_ = next;
    }

    configurationChanges_++;
    utils::Logger::info("Buffer configuration changed (" + trigger + "): " + next.toString());
    broadcaster_.publish(next);
}

BufferConfiguration AdaptiveBufferManager::currentConfiguration() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return configuration_;
}

memory::MemoryPressureLevel AdaptiveBufferManager::currentMemoryPressure() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return memoryPressure_;
}

network::NetworkQuality AdaptiveBufferManager::currentNetworkQuality() const {
    std::lock_guard<std::mutex> lock(stateMutex_);
    return networkQuality_;
}

core::Subscription AdaptiveBufferManager::subscribe(ConfigurationCallback callback) {
    return broadcaster_.subscribe(std::move(callback));
}

std::unique_ptr<core::UpdateStream<BufferConfiguration>> AdaptiveBufferManager::configurationStream() {
    return std::make_unique<core::UpdateStream<BufferConfiguration>>(broadcaster_);
}

std::map<std::string, double> AdaptiveBufferManager::getStatistics() const {
    std::map<std::string, double> stats;
    stats["total_updates"] = static_cast<double>(totalUpdates_.load());
    stats["configuration_changes"] = static_cast<double>(configurationChanges_.load());

    std::lock_guard<std::mutex> lock(stateMutex_);
    stats["current_strategy"] = static_cast<double>(configuration_.strategy());
    stats["current_forward_buffer_seconds"] = configuration_.preferredForwardBufferSeconds();
    stats["memory_pressure"] = static_cast<double>(memoryPressure_);
    stats["network_quality"] = static_cast<double>(networkQuality_);
    return stats;
}

BufferStrategy AdaptiveBufferManager::memoryCeiling(memory::MemoryPressureLevel level) {
    switch (level) {
        case memory::MemoryPressureLevel::CRITICAL: return BufferStrategy::MINIMAL;
        case memory::MemoryPressureLevel::WARNING: return BufferStrategy::CONSERVATIVE;
        case memory::MemoryPressureLevel::NORMAL: return BufferStrategy::AGGRESSIVE;
    }
    return BufferStrategy::AGGRESSIVE;
}

BufferConfiguration AdaptiveBufferManager::computeConfiguration(memory::MemoryPressureLevel pressure,
                                                                network::NetworkQuality quality,
                                                                const NetworkCeilingPolicy& ceilingPolicy) {
    BufferStrategy memoryLimit = memoryCeiling(pressure);
    BufferStrategy networkLimit = ceilingPolicy.ceilingFor(quality);

    BufferStrategy effective = minStrategy(memoryLimit, networkLimit);

    if (effective == memoryLimit) {
        return BufferConfiguration::forStrategy(effective);
    }
    return BufferConfiguration::networkLimited(effective);
}

} // namespace buffer
} // namespace streamingcore
