#pragma once

#include "core/broadcaster.hpp"
#include "memory/memory_monitor.hpp"
#include "memory/memory_sampler.hpp"
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace streamingcore {
namespace memory {

/**
 * Memory monitor that polls a MemorySampler on a dedicated thread every
 * thresholds.pollingInterval and broadcasts each successful sample.
 *
 * A failed sample (nullopt or exception) skips that tick; the previous state
 * is kept and sampling continues on the next interval.
 *
 * Subscribers may stop or restart monitoring from their callback. A loop
 * stopped that way finishes on its own and is joined by the next start, stop
 * or the destructor.
 */
class PollingMemoryMonitor : public MemoryMonitor {
public:
    explicit PollingMemoryMonitor(std::shared_ptr<MemorySampler> sampler,
                                  const MemoryThresholds& thresholds = MemoryThresholds::defaults());
    ~PollingMemoryMonitor() override;

    PollingMemoryMonitor(const PollingMemoryMonitor&) = delete;
    PollingMemoryMonitor& operator=(const PollingMemoryMonitor&) = delete;

    MemoryState currentMemoryState() override;
    void startMonitoring() override;
    void stopMonitoring() override;
    bool isMonitoring() const override;

    core::Subscription subscribe(StateCallback callback) override;
    std::unique_ptr<core::UpdateStream<MemoryState>> stateStream() override;

    const MemoryThresholds& getThresholds() const { return thresholds_; }

    /**
     * Pressure level of the latest known snapshot
     */
    MemoryPressureLevel currentPressureLevel();

    /**
     * Get monitoring statistics
     * @return map of monitoring statistics
     */
    std::map<std::string, double> getMonitoringStats() const;

private:
    // Stop flag owned by one run of the sampling loop, guarded by wakeMutex_
    struct LoopControl {
        bool stopRequested = false;
    };

    void monitoringLoop(std::shared_ptr<LoopControl> control);
    std::optional<MemoryState> takeSample();

    // Requires lifecycleMutex_. Hands back stopped threads other than the caller's.
    std::vector<std::unique_ptr<std::thread>> takeStoppedThreadsLocked();

    std::shared_ptr<MemorySampler> sampler_;
    MemoryThresholds thresholds_;

    // Monitoring state
    std::mutex lifecycleMutex_;
    std::atomic<bool> monitoring_;
    std::unique_ptr<std::thread> monitoringThread_;
    std::shared_ptr<LoopControl> loopControl_;
    std::vector<std::unique_ptr<std::thread>> stoppedThreads_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCondition_;

    // Latest snapshot
    mutable std::mutex stateMutex_;
    std::optional<MemoryState> lastState_;

    std::mutex samplerMutex_;
    core::Broadcaster<MemoryState> broadcaster_;

    // Statistics
    std::atomic<uint64_t> totalSamples_;
    std::atomic<uint64_t> failedSamples_;
};

} // namespace memory
} // namespace streamingcore
