#pragma once

#include "cleanup/resource_cleaner.hpp"
#include "core/broadcaster.hpp"
#include "memory/memory_monitor.hpp"
#include "memory/memory_thresholds.hpp"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace streamingcore {
namespace cleanup {

/**
 * Runs registered cleaners in priority order, manually or automatically in
 * response to memory pressure.
 *
 * With auto cleanup enabled, each memory state is classified with the
 * configured thresholds: CRITICAL cleans everything, WARNING cleans up to
 * MEDIUM priority, NORMAL does nothing. Results are broadcast to
 * subscribers.
 */
class ResourceCleanupCoordinator {
public:
    using ResultsCallback = std::function<void(const std::vector<CleanupResult>&)>;

    ResourceCleanupCoordinator(std::vector<std::shared_ptr<ResourceCleaner>> cleaners,
                               std::shared_ptr<memory::MemoryMonitor> memoryMonitor,
                               const memory::MemoryThresholds& thresholds = memory::MemoryThresholds::defaults());
    ~ResourceCleanupCoordinator();

    ResourceCleanupCoordinator(const ResourceCleanupCoordinator&) = delete;
    ResourceCleanupCoordinator& operator=(const ResourceCleanupCoordinator&) = delete;

    void registerCleaner(std::shared_ptr<ResourceCleaner> cleaner);

    /**
     * Clean all registered resources, highest priority first
     */
    std::vector<CleanupResult> cleanupAll();

    /**
     * Clean resources whose priority is at most the given one
     */
    std::vector<CleanupResult> cleanupUpTo(CleanupPriority priority);

    /**
     * Estimate total bytes that could be freed
     */
    uint64_t estimateTotalCleanup();

    /**
     * Start the memory monitor and react to pressure. No-op if enabled.
     */
    void enableAutoCleanup();

    /**
     * Stop reacting to pressure and stop the monitor. No-op if disabled.
     */
    void disableAutoCleanup();

    bool isAutoCleanupEnabled() const;

    core::Subscription subscribe(ResultsCallback callback);

    /**
     * Broadcast results to subscribers (manual triggers)
     */
    void publishResults(const std::vector<CleanupResult>& results);

    size_t cleanerCount() const;
    std::map<std::string, double> getCleanupStats() const;

private:
    void handleMemoryState(const memory::MemoryState& state);
    std::vector<std::shared_ptr<ResourceCleaner>> snapshotCleaners() const;
    void sortCleaners();

    std::shared_ptr<memory::MemoryMonitor> memoryMonitor_;
    memory::MemoryThresholds thresholds_;

    mutable std::mutex cleanersMutex_;
    std::vector<std::shared_ptr<ResourceCleaner>> cleaners_;

    mutable std::mutex autoCleanupMutex_;
    bool autoCleanupEnabled_;
    core::Subscription monitorSubscription_;

    core::Broadcaster<std::vector<CleanupResult>> broadcaster_;

    std::atomic<uint64_t> cleanupRuns_;
    std::atomic<uint64_t> failedCleanups_;
    std::atomic<uint64_t> totalBytesFreed_;
};

} // namespace cleanup
} // namespace streamingcore
