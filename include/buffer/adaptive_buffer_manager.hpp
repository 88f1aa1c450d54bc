#pragma once

#include "buffer/buffer_manager.hpp"
#include "buffer/network_ceiling_policy.hpp"
#include "core/broadcaster.hpp"
#include "memory/memory_thresholds.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace streamingcore {
namespace buffer {

/**
 * Fuses memory pressure and network quality into one buffering policy.
 *
 * Each input maps to a strategy ceiling and the effective strategy is the
 * lower of the two. When memory binds (including ties) the canonical preset
 * is used; when the network binds strictly the reason names the network.
 *
 * Every update runs "read inputs -> compute -> write -> broadcast" under one
 * mutex, so broadcasts follow the order of the changes they announce.
 * Accessors only take a short state lock and may be called from callbacks.
 * Callbacks must not call the update methods.
 */
class AdaptiveBufferManager : public BufferManager {
public:
    explicit AdaptiveBufferManager(const memory::MemoryThresholds& thresholds = memory::MemoryThresholds::defaults(),
                                   const NetworkCeilingPolicy& ceilingPolicy = NetworkCeilingPolicy::defaults());
    ~AdaptiveBufferManager() override;

    AdaptiveBufferManager(const AdaptiveBufferManager&) = delete;
    AdaptiveBufferManager& operator=(const AdaptiveBufferManager&) = delete;

    void updateMemoryState(const memory::MemoryState& state) override;
    void updateMemoryPressure(memory::MemoryPressureLevel level) override;
    void updateNetworkQuality(network::NetworkQuality quality) override;

    BufferConfiguration currentConfiguration() const override;
    memory::MemoryPressureLevel currentMemoryPressure() const;
    network::NetworkQuality currentNetworkQuality() const;

    core::Subscription subscribe(ConfigurationCallback callback) override;
    std::unique_ptr<core::UpdateStream<BufferConfiguration>> configurationStream() override;

    const memory::MemoryThresholds& getThresholds() const { return thresholds_; }
    const NetworkCeilingPolicy& getCeilingPolicy() const { return ceilingPolicy_; }

    /**
     * Get controller statistics
     * @return map with total_updates, configuration_changes,
     *         current_strategy and current_forward_buffer_seconds
     */
    std::map<std::string, double> getStatistics() const;

    /**
     * Strategy ceiling imposed by memory pressure
     */
    static BufferStrategy memoryCeiling(memory::MemoryPressureLevel level);

    /**
     * The combining function: min of both ceilings, reason from the
     * binding input (memory wins ties)
     */
    static BufferConfiguration computeConfiguration(memory::MemoryPressureLevel pressure,
                                                    network::NetworkQuality quality,
                                                    const NetworkCeilingPolicy& ceilingPolicy);

private:
    // Requires updateMutex_
    void recompute(const std::string& trigger);

    memory::MemoryThresholds thresholds_;
    NetworkCeilingPolicy ceilingPolicy_;

    // Serializes recomputation and broadcast
    std::mutex updateMutex_;

    // Guards the fields below for readers
    mutable std::mutex stateMutex_;
    memory::MemoryPressureLevel memoryPressure_;
    network::NetworkQuality networkQuality_;
    BufferConfiguration configuration_;

    core::Broadcaster<BufferConfiguration> broadcaster_;

    std::atomic<uint64_t> totalUpdates_;
    std::atomic<uint64_t> configurationChanges_;
};

} // namespace buffer
} // namespace streamingcore
