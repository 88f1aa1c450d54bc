#pragma once

#include "core/broadcaster.hpp"
#include "core/update_stream.hpp"
#include "network/network_quality.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace streamingcore {
namespace network {

/**
 * Source of raw network measurements. Returns nullopt (or throws) when no
 * measurement could be taken.
 */
class NetworkSampler {
public:
    virtual ~NetworkSampler() = default;
    virtual std::optional<NetworkMetrics> sample() = 0;
};

/**
 * Network condition monitor for adaptive buffering.
 *
 * Classifies metrics into a NetworkQuality and broadcasts the quality
 * whenever it changes. Metrics come either from a sampler polled on a
 * background thread or from updateMetrics() calls by an external source.
 * Subscribers may stop or restart monitoring from their callback.
 */
class NetworkMonitor {
public:
    using QualityCallback = std::function<void(NetworkQuality)>;

    explicit NetworkMonitor(std::shared_ptr<NetworkSampler> sampler = nullptr);
    ~NetworkMonitor();

    NetworkMonitor(const NetworkMonitor&) = delete;
    NetworkMonitor& operator=(const NetworkMonitor&) = delete;

    /**
     * Initialize network monitoring
     * @param monitoringIntervalMs Interval between measurements
     * @param historySize Number of measurements to keep
     * @return true if initialization successful
     */
    bool initialize(int monitoringIntervalMs = 1000, size_t historySize = 60);

    /**
     * Start continuous network monitoring
     * @return true if monitoring is running, false without a sampler
     */
    bool startMonitoring();

    /**
     * Stop network monitoring. Safe to call repeatedly.
     */
    void stopMonitoring();

    bool isMonitoring() const;

    /**
     * Get current network metrics
     * @return current network metrics
     */
    NetworkMetrics getCurrentMetrics() const;

    /**
     * Get network quality classification
     * @return current network quality (GOOD until the first measurement)
     */
    NetworkQuality getNetworkQuality() const;

    /**
     * Get average metrics over specified duration
     * @param durationMs Duration to average over
     * @return averaged network metrics
     */
    NetworkMetrics getAverageMetrics(int durationMs = 5000) const;

    /**
     * Record a measurement (from the sampler loop or an external source)
     * @param metrics Network metrics to record
     */
    void updateMetrics(const NetworkMetrics& metrics);

    /**
     * Check if network conditions are stable
     * @param stabilityThreshold Maximum acceptable coefficient of variation
     * @return true if conditions are stable
     */
    bool isNetworkStable(float stabilityThreshold = 0.2f) const;

    /**
     * Get network monitoring statistics
     * @return map of monitoring statistics
     */
    std::map<std::string, double> getMonitoringStats() const;

    /**
     * Receive every quality change after this call
     */
    core::Subscription subscribe(QualityCallback callback);

    std::unique_ptr<core::UpdateStream<NetworkQuality>> qualityStream();

    static NetworkQuality classifyNetworkQuality(const NetworkMetrics& metrics);

private:
    // Configuration
    std::shared_ptr<NetworkSampler> sampler_;
    int monitoringIntervalMs_;
    size_t historySize_;

    // Stop flag owned by one run of the sampling loop, guarded by wakeMutex_
    struct LoopControl {
        bool stopRequested = false;
    };

    // Monitoring state
    std::mutex lifecycleMutex_;
    std::atomic<bool> monitoring_;
    std::unique_ptr<std::thread> monitoringThread_;
    std::shared_ptr<LoopControl> loopControl_;
    std::vector<std::unique_ptr<std::thread>> stoppedThreads_;
    std::mutex wakeMutex_;
    std::condition_variable wakeCondition_;

    // Metrics storage
    std::mutex updateMutex_;
    mutable std::mutex metricsMutex_;
    std::vector<NetworkMetrics> metricsHistory_;
    NetworkMetrics currentMetrics_;
    NetworkQuality currentQuality_;

    core::Broadcaster<NetworkQuality> broadcaster_;

    // Statistics
    std::atomic<uint64_t> totalMeasurements_;
    std::atomic<uint64_t> failedMeasurements_;
    std::atomic<uint64_t> qualityChanges_;

    // Private methods
    void monitoringLoop(std::shared_ptr<LoopControl> control);
    std::vector<std::unique_ptr<std::thread>> takeStoppedThreadsLocked();
    bool isNetworkStableLocked(float stabilityThreshold) const;
    void pruneOldMetrics();
};

} // namespace network
} // namespace streamingcore
