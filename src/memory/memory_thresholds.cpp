#include "memory/memory_thresholds.hpp"

namespace streamingcore {
namespace memory {

const char* pressureLevelName(MemoryPressureLevel level) {
    switch (level) {
        case MemoryPressureLevel::NORMAL: return "normal";
        case MemoryPressureLevel::WARNING: return "warning";
        case MemoryPressureLevel::CRITICAL: return "critical";
    }
    return "normal";
}

MemoryPressureLevel MemoryThresholds::pressureLevel(double availableMB) const {
    if (availableMB < criticalAvailableMB) {
        return MemoryPressureLevel::CRITICAL;
    }
    if (availableMB < warningAvailableMB) {
        return MemoryPressureLevel::WARNING;
    }
    return MemoryPressureLevel::NORMAL;
}

bool MemoryThresholds::operator==(const MemoryThresholds& other) const {
    return warningAvailableMB == other.warningAvailableMB &&
           criticalAvailableMB == other.criticalAvailableMB &&
           pollingInterval == other.pollingInterval;
}

} // namespace memory
} // namespace streamingcore
