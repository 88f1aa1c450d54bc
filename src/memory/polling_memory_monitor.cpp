#include "memory/polling_memory_monitor.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"

namespace streamingcore {
namespace memory {

PollingMemoryMonitor::PollingMemoryMonitor(std::shared_ptr<MemorySampler> sampler,
                                           const MemoryThresholds& thresholds)
    : sampler_(std::move(sampler))
    , thresholds_(thresholds)
    , monitoring_(false)
    , broadcaster_("MemoryMonitor")
    , totalSamples_(0)
    , failedSamples_(0) {
    if (!sampler_) {
        throw utils::ConfigurationException("PollingMemoryMonitor requires a memory sampler");
    }
}

PollingMemoryMonitor::~PollingMemoryMonitor() {
    stopMonitoring();

    // Only left over when destroyed from inside one of our own callbacks
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        for (auto& thread : stoppedThreads_) {
            utils::Logger::warn("Memory monitor destroyed from its sampling thread");
            thread->detach();
        }
        stoppedThreads_.clear();
    }
    broadcaster_.finish();
}

MemoryState PollingMemoryMonitor::currentMemoryState() {
    {
        std::lock_guard<std::mutex> lock(stateMutex_);
        if (lastState_) {
            return *lastState_;
        }
    }

    // Nothing sampled yet: take one reading on demand, cache it, don't broadcast
    auto state = takeSample();
    if (!state) {
        return MemoryState(0, 0, 0, std::chrono::system_clock::now());
    }

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!lastState_) {
        lastState_ = state;
    }
    return *lastState_;
}

void PollingMemoryMonitor::startMonitoring() {
    std::vector<std::unique_ptr<std::thread>> stopped;
    {
        std::lock_guard<std::mutex> lifecycle(lifecycleMutex_);
        stopped = takeStoppedThreadsLocked();

        if (monitoring_.load()) {
            utils::Logger::debug("Memory monitoring already started");
        } else {
            loopControl_ = std::make_shared<LoopControl>();
            monitoring_ = true;
            monitoringThread_ = std::make_unique<std::thread>(&PollingMemoryMonitor::monitoringLoop,
                                                              this, loopControl_);

            utils::Logger::info("Memory monitoring started: " +
                                std::to_string(thresholds_.pollingInterval.count()) + "ms interval");
        }
    }

    // Joined unlocked: a stopped loop may still be inside a callback that calls back in
    for (auto& thread : stopped) {
        thread->join();
    }
}

void PollingMemoryMonitor::stopMonitoring() {
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

            utils::Logger::info("Memory monitoring stopped");
        }
        stopped = takeStoppedThreadsLocked();
    }

    for (auto& thread : stopped) {
        thread->join();
    }
}

std::vector<std::unique_ptr<std::thread>> PollingMemoryMonitor::takeStoppedThreadsLocked() {
    std::vector<std::unique_ptr<std::thread>> joinable;
    std::vector<std::unique_ptr<std::thread>> remaining;
    for (auto& thread : stoppedThreads_) {
        // The calling loop cannot join itself; a later call will
        if (thread->get_id() == std::this_thread::get_id()) {
            remaining.push_back(std::move(thread));
        } else {
            joinable.push_back(std::move(thread));
        }
    }
    stoppedThreads_ = std::move(remaining);
    return joinable;
}

bool PollingMemoryMonitor::isMonitoring() const {
    return monitoring_.load();
}

core::Subscription PollingMemoryMonitor::subscribe(StateCallback callback) {
    return broadcaster_.subscribe(std::move(callback));
}

std::unique_ptr<core::UpdateStream<MemoryState>> PollingMemoryMonitor::stateStream() {
    return std::make_unique<core::UpdateStream<MemoryState>>(broadcaster_);
}

MemoryPressureLevel PollingMemoryMonitor::currentPressureLevel() {
    return currentMemoryState().pressureLevel(thresholds_);
}

std::map<std::string, double> PollingMemoryMonitor::getMonitoringStats() const {
    std::map<std::string, double> stats;
    stats["total_samples"] = static_cast<double>(totalSamples_.load());
    stats["failed_samples"] = static_cast<double>(failedSamples_.load());
    stats["monitoring"] = monitoring_.load() ? 1.0 : 0.0;
    stats["polling_interval_ms"] = static_cast<double>(thresholds_.pollingInterval.count());
    stats["subscribers"] = static_cast<double>(broadcaster_.subscriberCount());

    std::lock_guard<std::mutex> lock(stateMutex_);
    if (lastState_) {
        stats["last_available_mb"] = lastState_->availableMB();
        stats["last_usage_percentage"] = lastState_->usagePercentage();
        stats["last_pressure_level"] = static_cast<double>(lastState_->pressureLevel(thresholds_));
    }
    return stats;
}

void PollingMemoryMonitor::monitoringLoop(std::shared_ptr<LoopControl> control) {
    utils::Logger::debug("Memory monitoring loop started");

    while (true) {
        {
            std::lock_guard<std::mutex> lock(wakeMutex_);
            if (control->stopRequested) {
                break;
            }
        }

        auto state = takeSample();
        if (state) {
            {
                std::lock_guard<std::mutex> lock(stateMutex_);
                lastState_ = state;
            }
            broadcaster_.publish(*state);
        }

        std::unique_lock<std::mutex> lock(wakeMutex_);
        if (wakeCondition_.wait_for(lock, thresholds_.pollingInterval,
                                    [&control] { return control->stopRequested; })) {
            break;
        }
    }

    utils::Logger::debug("Memory monitoring loop stopped");
}

std::optional<MemoryState> PollingMemoryMonitor::takeSample() {
    totalSamples_++;

    try {
        std::optional<RawMemorySample> raw;
        {
            std::lock_guard<std::mutex> lock(samplerMutex_);
            raw = sampler_->sample();
        }

        if (!raw) {
            failedSamples_++;
            utils::Logger::warn("Memory sampler unavailable, skipping tick");
            utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
                utils::ErrorCategory::MEMORY_MONITORING, utils::ErrorSeverity::WARNING,
                "Memory sample unavailable", "", "PollingMemoryMonitor"));
            return std::nullopt;
        }

        return MemoryState::fromSample(*raw);

    } catch (const std::exception& e) {
        failedSamples_++;
        utils::Logger::warn("Memory sampling error: " + std::string(e.what()));
        utils::ErrorHandler::getInstance().reportError(utils::ErrorInfo(
            utils::ErrorCategory::MEMORY_MONITORING, utils::ErrorSeverity::WARNING,
            "Memory sampling error", e.what(), "PollingMemoryMonitor"));
        return std::nullopt;
    }
}

} // namespace memory
} // namespace streamingcore
