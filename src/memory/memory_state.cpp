#include "memory/memory_state.hpp"

namespace streamingcore {
namespace memory {

namespace {
constexpr double kBytesPerMB = 1048576.0;
}

MemoryState::MemoryState()
    : availableBytes_(0)
    , totalBytes_(0)
    , usedBytes_(0)
    , timestamp_(std::chrono::system_clock::now()) {
}

MemoryState::MemoryState(uint64_t availableBytes, uint64_t totalBytes, uint64_t usedBytes,
                         std::chrono::system_clock::time_point timestamp)
    : availableBytes_(availableBytes)
    , totalBytes_(totalBytes)
    , usedBytes_(usedBytes)
    , timestamp_(timestamp) {
}

MemoryState MemoryState::fromSample(const RawMemorySample& sample) {
    return MemoryState(sample.availableBytes, sample.totalBytes, sample.usedBytes,
                       std::chrono::system_clock::now());
}

double MemoryState::availableMB() const {
    return static_cast<double>(availableBytes_) / kBytesPerMB;
}

double MemoryState::usedMB() const {
    return static_cast<double>(usedBytes_) / kBytesPerMB;
}

double MemoryState::usagePercentage() const {
    if (totalBytes_ == 0) {
        return 0.0;
    }
    return static_cast<double>(usedBytes_) / static_cast<double>(totalBytes_) * 100.0;
}

MemoryPressureLevel MemoryState::pressureLevel(const MemoryThresholds& thresholds) const {
    return thresholds.pressureLevel(availableMB());
}

bool MemoryState::operator==(const MemoryState& other) const {
    return availableBytes_ == other.availableBytes_ &&
           totalBytes_ == other.totalBytes_ &&
           usedBytes_ == other.usedBytes_ &&
           timestamp_ == other.timestamp_;
}

} // namespace memory
} // namespace streamingcore
