#pragma once

#include <chrono>

namespace streamingcore {
namespace memory {

/**
 * Coarse classification of available memory. Ordered from least to most
 * severe.
 */
enum class MemoryPressureLevel {
    NORMAL = 0,
    WARNING = 1,
    CRITICAL = 2
};

const char* pressureLevelName(MemoryPressureLevel level);

/**
 * Available-memory limits used to classify pressure, plus the sampling
 * interval of the polling monitor.
 *
 * criticalAvailableMB is expected to be below warningAvailableMB. This is
 * not checked here; Config validates it for file-based settings.
 */
struct MemoryThresholds {
    double warningAvailableMB;
    double criticalAvailableMB;
    std::chrono::milliseconds pollingInterval;

    MemoryThresholds()
        : warningAvailableMB(100.0)
        , criticalAvailableMB(50.0)
        , pollingInterval(std::chrono::milliseconds(2000)) {}

    MemoryThresholds(double warningMB, double criticalMB, std::chrono::milliseconds interval)
        : warningAvailableMB(warningMB)
        , criticalAvailableMB(criticalMB)
        , pollingInterval(interval) {}

    /// warning 100 MB, critical 50 MB, 2 s interval
    static MemoryThresholds defaults() { return MemoryThresholds(); }

    MemoryPressureLevel pressureLevel(double availableMB) const;

    bool operator==(const MemoryThresholds& other) const;
    bool operator!=(const MemoryThresholds& other) const { return !(*this == other); }
};

} // namespace memory
} // namespace streamingcore
