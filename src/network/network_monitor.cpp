#include "network/network_monitor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace streamingcore {
namespace network {

NetworkMonitor::NetworkMonitor(std::shared_ptr<NetworkSampler> sampler)
    : sampler_(std::move(sampler))
    , monitoringIntervalMs_(1000)
    , historySize_(60)
    , monitoring_(false)
    , currentQuality_(NetworkQuality::GOOD)
    , broadcaster_("NetworkMonitor")
    , totalMeasurements_(0)
    , failedMeasurements_(0)
    , qualityChanges_(0) {
}

NetworkMonitor::~NetworkMonitor() {
    stopMonitoring();

    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        for (auto& thread : stoppedThreads_) {
            utils::Logger::warn("Network monitor destroyed from its sampling thread");
            thread->detach();
        }
        stoppedThreads_.clear();
    }
    broadcaster_.finish();
}

bool NetworkMonitor::initialize(int monitoringIntervalMs, size_t historySize) {
    if (monitoringIntervalMs <= 0 || historySize == 0) {
        utils::Logger::error("NetworkMonitor initialization failed: interval and history size must be positive");
        return false;
    }

    std::lock_guard<std::mutex> lock(metricsMutex_);
    monitoringIntervalMs_ = monitoringIntervalMs;
    historySize_ = historySize;
    metricsHistory_.reserve(historySize_);

    utils::Logger::info("NetworkMonitor initialized: " +
                        std::to_string(monitoringIntervalMs) + "ms interval, " +
                        std::to_string(historySize) + " history size");
    return true;
}

bool NetworkMonitor::startMonitoring() {
    std::vector<std::unique_ptr<std::thread>> stopped;
    bool running = true;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        stopped = takeStoppedThreadsLocked();

        if (monitoring_.load()) {
            utils::Logger::warn("Network monitoring already started");
        } else if (!sampler_) {
            utils::Logger::debug("NetworkMonitor has no sampler; relying on external updates");
            running = false;
        } else {
            loopControl_ = std::make_shared<LoopControl>();
            monitoring_ = true;
            monitoringThread_ = std::make_unique<std::thread>(&NetworkMonitor::monitoringLoop, this, loopControl_);
            utils::Logger::info("Network monitoring started");
        }
    }

    for (auto& thread : stopped) {
        thread->join();
    }
    return running;
}

void NetworkMonitor::stopMonitoring() {
    std::vector<std::unique_ptr<std::thread>> stopped;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        if (monitoring_.load()) {
            {
                std::lock_guard<std::mutex> lock(wakeMutex_);
                loopControl_->stopRequested = true;
            }
            wakeCondition_.notify_all();

            stoppedThreads_.push_back(std::move(monitoringThread_));
            loopControl_.reset();
            monitoring_ = false;

            utils::Logger::info("Network monitoring stopped");
        }
        stopped = takeStoppedThreadsLocked();
    }

    // Joined unlocked so a loop finishing a callback can still call back in
    for (auto& thread : stopped) {
        thread->join();
    }
}

std::vector<std::unique_ptr<std::thread>> NetworkMonitor::takeStoppedThreadsLocked() {
    std::vector<std::unique_ptr<std::thread>> joinable;
    std::vector<std::unique_ptr<std::thread>> remaining;
    for (auto& thread : stoppedThreads_) {
        if (thread->get_id() == std::this_thread::get_id()) {
            remaining.push_back(std::move(thread));
        } else {
            joinable.push_back(std::move(thread));
        }
    }
    stoppedThreads_ = std::move(remaining);
    return joinable;
}

bool NetworkMonitor::isMonitoring() const {
    return monitoring_.load();
}

NetworkMetrics NetworkMonitor::getCurrentMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return currentMetrics_;
}

NetworkQuality NetworkMonitor::getNetworkQuality() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return currentQuality_;
}

NetworkMetrics NetworkMonitor::getAverageMetrics(int durationMs) const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    if (metricsHistory_.empty()) {
        return NetworkMetrics();
    }

    auto cutoffTime = std::chrono::steady_clock::now() - std::chrono::milliseconds(durationMs);

    // Find metrics within the specified duration
    std::vector<NetworkMetrics> recentMetrics;
    for (const auto& metrics : metricsHistory_) {
        if (metrics.timestamp >= cutoffTime) {
            recentMetrics.push_back(metrics);
        }
    }

    if (recentMetrics.empty()) {
        return currentMetrics_;
    }

    // Calculate averages
    NetworkMetrics avgMetrics;
    float totalLatency = 0.0f;
    float totalJitter = 0.0f;
    float totalLoss = 0.0f;
    float totalBandwidth = 0.0f;
    float totalThroughput = 0.0f;
    size_t reachableCount = 0;

    for (const auto& metrics : recentMetrics) {
        totalLatency += metrics.latencyMs;
        totalJitter += metrics.jitterMs;
        totalLoss += metrics.packetLossRate;
        totalBandwidth += metrics.bandwidthKbps;
        totalThroughput += metrics.throughputKbps;
        if (metrics.reachable) {
            reachableCount++;
        }
    }

    float count = static_cast<float>(recentMetrics.size());
    avgMetrics.latencyMs = totalLatency / count;
    avgMetrics.jitterMs = totalJitter / count;
    avgMetrics.packetLossRate = totalLoss / count;
    avgMetrics.bandwidthKbps = totalBandwidth / count;
    avgMetrics.throughputKbps = totalThroughput / count;
    avgMetrics.reachable = reachableCount * 2 >= recentMetrics.size();
    avgMetrics.timestamp = std::chrono::steady_clock::now();

    return avgMetrics;
}

void NetworkMonitor::updateMetrics(const NetworkMetrics& metrics) {
    // Serializes classification and notification so subscribers see changes in order
    std::lock_guard<std::mutex> updateLock(updateMutex_);

    NetworkQuality newQuality = classifyNetworkQuality(metrics);
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(metricsMutex_);
        currentMetrics_ = metrics;
        metricsHistory_.push_back(metrics);
        pruneOldMetrics();

        if (newQuality != currentQuality_) {
            utils::Logger::info(std::string("Network quality changed: ") +
                                networkQualityName(currentQuality_) + " -> " +
                                networkQualityName(newQuality));
            currentQuality_ = newQuality;
            changed = true;
        }
    }

    totalMeasurements_++;
    if (changed) {
        qualityChanges_++;
        broadcaster_.publish(newQuality);
    }
}

bool NetworkMonitor::isNetworkStable(float stabilityThreshold) const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return isNetworkStableLocked(stabilityThreshold);
}

bool NetworkMonitor::isNetworkStableLocked(float stabilityThreshold) const {
    if (metricsHistory_.size() < 5) {
        return false; // Need at least 5 measurements
    }

    // Calculate coefficient of variation for latency
    std::vector<float> latencies;
    latencies.reserve(metricsHistory_.size());
    for (const auto& metrics : metricsHistory_) {
        latencies.push_back(metrics.latencyMs);
    }

    float mean = std::accumulate(latencies.begin(), latencies.end(), 0.0f) / latencies.size();
    float variance = 0.0f;
    for (float latency : latencies) {
        variance += (latency - mean) * (latency - mean);
    }
    variance /= latencies.size();
    float stddev = std::sqrt(variance);

    float coefficientOfVariation = (mean > 0) ? (stddev / mean) : 1.0f;

    return coefficientOfVariation <= stabilityThreshold;
}

std::map<std::string, double> NetworkMonitor::getMonitoringStats() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);

    std::map<std::string, double> stats;
    stats["total_measurements"] = static_cast<double>(totalMeasurements_.load());
    stats["failed_measurements"] = static_cast<double>(failedMeasurements_.load());
    stats["quality_changes"] = static_cast<double>(qualityChanges_.load());
    stats["current_latency_ms"] = static_cast<double>(currentMetrics_.latencyMs);
    stats["current_jitter_ms"] = static_cast<double>(currentMetrics_.jitterMs);
    stats["current_packet_loss_rate"] = static_cast<double>(currentMetrics_.packetLossRate);
    stats["current_bandwidth_kbps"] = static_cast<double>(currentMetrics_.bandwidthKbps);
    stats["current_quality"] = static_cast<double>(currentQuality_);
    stats["history_size"] = static_cast<double>(metricsHistory_.size());
    stats["is_stable"] = isNetworkStableLocked(0.2f) ? 1.0 : 0.0;

    return stats;
}

core::Subscription NetworkMonitor::subscribe(QualityCallback callback) {
    return broadcaster_.subscribe(std::move(callback));
}

std::unique_ptr<core::UpdateStream<NetworkQuality>> NetworkMonitor::qualityStream() {
    return std::make_unique<core::UpdateStream<NetworkQuality>>(broadcaster_);
}

NetworkQuality NetworkMonitor::classifyNetworkQuality(const NetworkMetrics& metrics) {
    if (!metrics.reachable) {
        return NetworkQuality::OFFLINE;
    }

    // Classification based on latency, jitter, and packet loss
    if (metrics.latencyMs < 50.0f && metrics.jitterMs < 5.0f && metrics.packetLossRate < 0.1f) {
        return NetworkQuality::EXCELLENT;
    } else if (metrics.latencyMs < 100.0f && metrics.jitterMs < 10.0f && metrics.packetLossRate < 0.5f) {
        return NetworkQuality::GOOD;
    } else if (metrics.latencyMs < 200.0f && metrics.jitterMs < 20.0f && metrics.packetLossRate < 2.0f) {
        return NetworkQuality::FAIR;
    }
    return NetworkQuality::POOR;
}

void NetworkMonitor::monitoringLoop(std::shared_ptr<LoopControl> control) {
    utils::Logger::debug("Network monitoring loop started");

    while (true) {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (control->stopRequested) {
                break;
            }
        }

        try {
            auto metrics = sampler_->sample();
            if (metrics) {
                updateMetrics(*metrics);
            } else {
                failedMeasurements_++;
                utils::Logger::warn("Network sampler unavailable, skipping tick");
                utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
                    utils::ErrorCategory::NETWORK_MONITORING, utils::ErrorSeverity::WARNING,
                    "Network measurement unavailable", "", "NetworkMonitor"));
            }
        } catch (const std::exception& e) {
            failedMeasurements_++;
            utils::Logger::error("Network monitoring error: " + std::string(e.what()));
            utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
                utils::ErrorCategory::NETWORK_MONITORING, utils::ErrorSeverity::WARNING,
                "Network sampling error", e.what(), "NetworkMonitor"));
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        if (wakeCondition_.wait_for(lock, std::chrono::milliseconds(monitoringIntervalMs_),
                                    [&control] { return control->stopRequested; })) {
            break;
        }
    }

    utils::Logger::debug("Network monitoring loop stopped");
}

void NetworkMonitor::pruneOldMetrics() {
    // Remove metrics older than history size
    while (metricsHistory_.size() > historySize_) {
        metricsHistory_.erase(metricsHistory_.begin());
    }
}

} // namespace network
} // namespace streamingcore
