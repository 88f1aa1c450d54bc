#pragma once

#include "memory/memory_thresholds.hpp"
#include <chrono>
#include <cstdint>

namespace streamingcore {
namespace memory {

/**
 * Raw measurement produced by a memory sampler
 */
struct RawMemorySample {
    uint64_t availableBytes;
    uint64_t totalBytes;
    uint64_t usedBytes;

    RawMemorySample() : availableBytes(0), totalBytes(0), usedBytes(0) {}
    RawMemorySample(uint64_t available, uint64_t total, uint64_t used)
        : availableBytes(available), totalBytes(total), usedBytes(used) {}
};

/**
 * Point-in-time memory snapshot. Immutable once constructed.
 */
class MemoryState {
public:
    MemoryState();
    MemoryState(uint64_t availableBytes, uint64_t totalBytes, uint64_t usedBytes,
                std::chrono::system_clock::time_point timestamp);

    /// Wrap a raw sample, stamped with the current time
    static MemoryState fromSample(const RawMemorySample& sample);

    uint64_t availableBytes() const { return availableBytes_; }
    uint64_t totalBytes() const { return totalBytes_; }
    uint64_t usedBytes() const { return usedBytes_; }
    std::chrono::system_clock::time_point timestamp() const { return timestamp_; }

    double availableMB() const;
    double usedMB() const;

    /// used / total * 100, or 0 when total is 0
    double usagePercentage() const;

    MemoryPressureLevel pressureLevel(const MemoryThresholds& thresholds) const;

    bool operator==(const MemoryState& other) const;
    bool operator!=(const MemoryState& other) const { return !(*this == other); }

private:
    uint64_t availableBytes_;
    uint64_t totalBytes_;
    uint64_t usedBytes_;
    std::chrono::system_clock::time_point timestamp_;
};

} // namespace memory
} // namespace streamingcore
