#include "cleanup/resource_cleanup_coordinator.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>

namespace streamingcore {
namespace cleanup {

ResourceCleanupCoordinator::ResourceCleanupCoordinator(
    std::vector<std::shared_ptr<ResourceCleaner>> cleaners,
    std::shared_ptr<memory::MemoryMonitor> memoryMonitor,
    const memory::MemoryThresholds& thresholds)
    : memoryMonitor_(std::move(memoryMonitor))
    , thresholds_(thresholds)
    , cleaners_(std::move(cleaners))
    , autoCleanupEnabled_(false)
    , broadcaster_("ResourceCleanupCoordinator")
    , cleanupRuns_(0)
    , failedCleanups_(0)
    , totalBytesFreed_(0) {
    if (!memoryMonitor_) {
        throw utils::ConfigurationException("ResourceCleanupCoordinator requires a memory monitor");
    }
    cleaners_.erase(std::remove(cleaners_.begin(), cleaners_.end(), nullptr), cleaners_.end());
    sortCleaners();
}

ResourceCleanupCoordinator::~ResourceCleanupCoordinator() {
    disableAutoCleanup();
    broadcaster_.finish();
}

void ResourceCleanupCoordinator::registerCleaner(std::shared_ptr<ResourceCleaner> cleaner) {
    if (!cleaner) {
        return;
    }

    std::lock_guard<std::mutex> lock(cleanersMutex_);
    utils::Logger::debug("Registered cleaner: " + cleaner->resourceName() +
                         " (" + priorityName(cleaner->priority()) + ")");
    cleaners_.push_back(std::move(cleaner));
    sortCleaners();
}

std::vector<CleanupResult> ResourceCleanupCoordinator::cleanupAll() {
    std::vector<CleanupResult> results;
    for (const auto& cleaner : snapshotCleaners()) {
        results.push_back(cleaner->cleanup());
    }

    cleanupRuns_++;
    for (const auto& result : results) {
        if (result.success) {
            totalBytesFreed_ += result.bytesFreed;
        } else {
            failedCleanups_++;
        }
    }
    return results;
}

std::vector<CleanupResult> ResourceCleanupCoordinator::cleanupUpTo(CleanupPriority priority) {
    std::vector<CleanupResult> results;
    for (const auto& cleaner : snapshotCleaners()) {
        if (static_cast<int>(cleaner->priority()) <= static_cast<int>(priority)) {
            results.push_back(cleaner->cleanup());
        }
    }

    cleanupRuns_++;
    for (const auto& result : results) {
        if (result.success) {
            totalBytesFreed_ += result.bytesFreed;
        } else {
            failedCleanups_++;
        }
    }
    return results;
}

uint64_t ResourceCleanupCoordinator::estimateTotalCleanup() {
    uint64_t total = 0;
    for (const auto& cleaner : snapshotCleaners()) {
        total += cleaner->estimateCleanup();
    }
    return total;
}

void ResourceCleanupCoordinator::enableAutoCleanup() {
    std::lock_guard<std::mutex> lock(autoCleanupMutex_);
    if (autoCleanupEnabled_) {
        return;
    }
    autoCleanupEnabled_ = true;

    monitorSubscription_ = memoryMonitor_->subscribe(
        [this](const memory::MemoryState& state) { handleMemoryState(state); });
    memoryMonitor_->startMonitoring();

    utils::Logger::info("Automatic resource cleanup enabled");
}

void ResourceCleanupCoordinator::disableAutoCleanup() {
    std::lock_guard<std::mutex> lock(autoCleanupMutex_);
    if (!autoCleanupEnabled_) {
        return;
    }
    autoCleanupEnabled_ = false;

    monitorSubscription_.unsubscribe();
    memoryMonitor_->stopMonitoring();

    utils::Logger::info("Automatic resource cleanup disabled");
}

bool ResourceCleanupCoordinator::isAutoCleanupEnabled() const {
    std::lock_guard<std::mutex> lock(autoCleanupMutex_);
    return autoCleanupEnabled_;
}

core::Subscription ResourceCleanupCoordinator::subscribe(ResultsCallback callback) {
    return broadcaster_.subscribe(std::move(callback));
}

void ResourceCleanupCoordinator::publishResults(const std::vector<CleanupResult>& results) {
    broadcaster_.publish(results);
}

size_t ResourceCleanupCoordinator::cleanerCount() const {
    std::lock_guard<std::mutex> lock(cleanersMutex_);
    return cleaners_.size();
}

std::map<std::string, double> ResourceCleanupCoordinator::getCleanupStats() const {
    std::map<std::string, double> stats;
    stats["cleanup_runs"] = static_cast<double>(cleanupRuns_.load());
    stats["failed_cleanups"] = static_cast<double>(failedCleanups_.load());
    stats["total_freed_mb"] = static_cast<double>(totalBytesFreed_.load()) / (1024.0 * 1024.0);
    stats["registered_cleaners"] = static_cast<double>(cleanerCount());
    stats["auto_cleanup_enabled"] = isAutoCleanupEnabled() ? 1.0 : 0.0;
    return stats;
}

void ResourceCleanupCoordinator::handleMemoryState(const memory::MemoryState& state) {
    switch (state.pressureLevel(thresholds_)) {
        case memory::MemoryPressureLevel::CRITICAL: {
            utils::Logger::warn("Critical memory pressure (" + std::to_string(state.availableMB()) +
                                " MB available), cleaning all resources");
            auto results = cleanupAll();
            publishResults(results);
            break;
        }
        case memory::MemoryPressureLevel::WARNING: {
            auto results = cleanupUpTo(CleanupPriority::MEDIUM);
            if (!results.empty()) {
                publishResults(results);
            }
            break;
        }
        case memory::MemoryPressureLevel::NORMAL:
            break;
    }
}

std::vector<std::shared_ptr<ResourceCleaner>> ResourceCleanupCoordinator::snapshotCleaners() const {
    std::lock_guard<std::mutex> lock(cleanersMutex_);
    return cleaners_;
}

void ResourceCleanupCoordinator::sortCleaners() {
    // Highest priority first, registration order kept within a priority
    std::stable_sort(cleaners_.begin(), cleaners_.end(),
                     [](const std::shared_ptr<ResourceCleaner>& a, const std::shared_ptr<ResourceCleaner>& b) {
                         return static_cast<int>(a->priority()) > static_cast<int>(b->priority());
                     });
}

} // namespace cleanup
} // namespace streamingcore
