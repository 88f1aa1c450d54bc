#include "test_doubles.hpp"
#include <stdexcept>
#include <thread>

namespace fixtures {

namespace {
constexpr uint64_t kBytesPerMB = 1024ULL * 1024ULL;
constexpr uint64_t kTotalBytes = 4096ULL * kBytesPerMB;
}

RawMemorySample sampleWithAvailableMB(double availableMB) {
    uint64_t available = static_cast<uint64_t>(availableMB * kBytesPerMB);
    return RawMemorySample(available, kTotalBytes, kTotalBytes - available);
}

MemoryState stateWithAvailableMB(double availableMB) {
    return MemoryState::fromSample(sampleWithAvailableMB(availableMB));
}

NetworkMetrics networkMetrics(float latencyMs, float jitterMs, float packetLossRate, bool reachable) {
    NetworkMetrics metrics;
    metrics.latencyMs = latencyMs;
    metrics.jitterMs = jitterMs;
    metrics.packetLossRate = packetLossRate;
    metrics.bandwidthKbps = 5000.0f;
    metrics.throughputKbps = 2500.0f;
    metrics.reachable = reachable;
    return metrics;
}

bool waitUntil(const std::function<bool()>& condition, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

// ScriptedMemorySampler

ScriptedMemorySampler::ScriptedMemorySampler(std::optional<RawMemorySample> fallback)
    : fallback_(fallback), calls_(0) {}

void ScriptedMemorySampler::pushSample(const RawMemorySample& sample) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{sample, ""});
}

void ScriptedMemorySampler::pushFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{std::nullopt, ""});
}

void ScriptedMemorySampler::pushException(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{std::nullopt, message});
}

void ScriptedMemorySampler::setFallback(std::optional<RawMemorySample> fallback) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallback_ = fallback;
}

std::optional<RawMemorySample> ScriptedMemorySampler::sample() {
    calls_++;
    std::lock_guard<std::mutex> lock(mutex_);
    if (script_.empty()) {
        return fallback_;
    }
    Step step = script_.front();
    script_.pop_front();
    if (!step.exceptionMessage.empty()) {
        throw std::runtime_error(step.exceptionMessage);
    }
    return step.sample;
}

// ScriptedNetworkSampler

ScriptedNetworkSampler::ScriptedNetworkSampler(std::optional<NetworkMetrics> fallback)
    : fallback_(fallback), calls_(0) {}

void ScriptedNetworkSampler::pushMetrics(const NetworkMetrics& metrics) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{metrics, ""});
}

void ScriptedNetworkSampler::pushFailure() {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{std::nullopt, ""});
}

void ScriptedNetworkSampler::pushException(const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    script_.push_back(Step{std::nullopt, message});
}

std::optional<NetworkMetrics> ScriptedNetworkSampler::sample() {
    calls_++;
    std::lock_guard<std::mutex> lock(mutex_);
    if (script_.empty()) {
        return fallback_;
    }
    Step step = script_.front();
    script_.pop_front();
    if (!step.exceptionMessage.empty()) {
        throw std::runtime_error(step.exceptionMessage);
    }
    return step.metrics;
}

// ManualMemoryMonitor

ManualMemoryMonitor::ManualMemoryMonitor()
    : lastState_(stateWithAvailableMB(2048.0))
    , monitoring_(false)
    , startCalls_(0)
    , stopCalls_(0)
    , broadcaster_("ManualMemoryMonitor") {}

ManualMemoryMonitor::~ManualMemoryMonitor() {
    broadcaster_.finish();
}

MemoryState ManualMemoryMonitor::currentMemoryState() {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastState_;
}

void ManualMemoryMonitor::startMonitoring() {
    startCalls_++;
    monitoring_ = true;
}

void ManualMemoryMonitor::stopMonitoring() {
    stopCalls_++;
    monitoring_ = false;
}

streamingcore::core::Subscription ManualMemoryMonitor::subscribe(StateCallback callback) {
    return broadcaster_.subscribe(std::move(callback));
}

std::unique_ptr<streamingcore::core::UpdateStream<MemoryState>> ManualMemoryMonitor::stateStream() {
    return std::make_unique<streamingcore::core::UpdateStream<MemoryState>>(broadcaster_);
}

void ManualMemoryMonitor::emit(const MemoryState& state) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lastState_ = state;
    }
    broadcaster_.publish(state);
}

} // namespace fixtures
