#include "core/adaptive_streaming_session.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace streamingcore {
namespace core {

AdaptiveStreamingSession::AdaptiveStreamingSession(std::shared_ptr<memory::MemoryMonitor> memoryMonitor,
                                                   std::shared_ptr<buffer::BufferManager> bufferManager,
                                                   std::shared_ptr<network::NetworkMonitor> networkMonitor)
    : memoryMonitor_(std::move(memoryMonitor))
    , bufferManager_(std::move(bufferManager))
    , networkMonitor_(std::move(networkMonitor))
    , running_(false)
    , startCount_(0) {
    if (!memoryMonitor_) {
        throw utils::ConfigurationException("AdaptiveStreamingSession requires a memory monitor");
    }
    if (!bufferManager_) {
        throw utils::ConfigurationException("AdaptiveStreamingSession requires a buffer manager");
    }
}

AdaptiveStreamingSession::~AdaptiveStreamingSession() {
    stop();
}

void AdaptiveStreamingSession::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) {
        return;
    }

    auto manager = bufferManager_;
    memorySubscription_ = memoryMonitor_->subscribe(
        [manager](const memory::MemoryState& state) { manager->updateMemoryState(state); });

    if (networkMonitor_) {
        networkSubscription_ = networkMonitor_->subscribe(
            [manager](network::NetworkQuality quality) { manager->updateNetworkQuality(quality); });
        bufferManager_->updateNetworkQuality(networkMonitor_->getNetworkQuality());
        networkMonitor_->startMonitoring();
    }

    memoryMonitor_->startMonitoring();

    running_ = true;
    startCount_++;
    startTime_ = std::chrono::steady_clock::now();

    utils::Logger::info("Adaptive streaming session started, initial configuration: " +
                        bufferManager_->currentConfiguration().toString());
}

void AdaptiveStreamingSession::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }

    memoryMonitor_->stopMonitoring();
    if (networkMonitor_) {
        networkMonitor_->stopMonitoring();
    }

    memorySubscription_.unsubscribe();
    networkSubscription_.unsubscribe();
    running_ = false;

    utils::Logger::info("Adaptive streaming session stopped");
}

bool AdaptiveStreamingSession::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

std::map<std::string, double> AdaptiveStreamingSession::getSessionStats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::map<std::string, double> stats;
    stats["running"] = running_ ? 1.0 : 0.0;
    stats["start_count"] = static_cast<double>(startCount_);
    stats["has_network_monitor"] = networkMonitor_ ? 1.0 : 0.0;
    if (running_) {
        auto uptime = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - startTime_);
        stats["uptime_ms"] = static_cast<double>(uptime.count());
    }
    stats["current_forward_buffer_seconds"] =
        bufferManager_->currentConfiguration().preferredForwardBufferSeconds();
    return stats;
}

} // namespace core
} // namespace streamingcore
