#pragma once

#include "buffer/buffer_manager.hpp"
#include "core/subscription.hpp"
#include "memory/memory_monitor.hpp"
#include "network/network_monitor.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace streamingcore {
namespace core {

/**
 * Wires the monitors into a buffer manager for the lifetime of a playback
 * session.
 *
 * The session holds no global state: consumers get the buffer manager
 * through bufferManager() and the hosting code owns the session.
 */
class AdaptiveStreamingSession {
public:
    /**
     * @param memoryMonitor Source of memory states (required)
     * @param bufferManager Controller fed by the monitors (required)
     * @param networkMonitor Optional source of network quality changes
     */
    AdaptiveStreamingSession(std::shared_ptr<memory::MemoryMonitor> memoryMonitor,
                             std::shared_ptr<buffer::BufferManager> bufferManager,
                             std::shared_ptr<network::NetworkMonitor> networkMonitor = nullptr);
    ~AdaptiveStreamingSession();

    AdaptiveStreamingSession(const AdaptiveStreamingSession&) = delete;
    AdaptiveStreamingSession& operator=(const AdaptiveStreamingSession&) = delete;

    /**
     * Subscribe the buffer manager to both monitors, push the current
     * network quality once and start monitoring. No-op if running.
     */
    void start();

    /**
     * Stop the monitors and drop the subscriptions. No-op if stopped.
     */
    void stop();

    bool isRunning() const;

    std::shared_ptr<buffer::BufferManager> bufferManager() const { return bufferManager_; }
    std::shared_ptr<memory::MemoryMonitor> memoryMonitor() const { return memoryMonitor_; }
    std::shared_ptr<network::NetworkMonitor> networkMonitor() const { return networkMonitor_; }

    std::map<std::string, double> getSessionStats() const;

private:
    std::shared_ptr<memory::MemoryMonitor> memoryMonitor_;
    std::shared_ptr<buffer::BufferManager> bufferManager_;
    std::shared_ptr<network::NetworkMonitor> networkMonitor_;

    mutable std::mutex mutex_;
    bool running_;
    Subscription memorySubscription_;
    Subscription networkSubscription_;
    std::chrono::steady_clock::time_point startTime_;
    uint64_t startCount_;
};

} // namespace core
} // namespace streamingcore
