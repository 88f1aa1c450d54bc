#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace streamingcore {
namespace cleanup {

/**
 * Cleanup priority, higher values are cleaned first
 */
enum class CleanupPriority {
    LOW = 0,     // Nice to have cleared (prefetched thumbnails)
    MEDIUM = 1,  // Should clear under memory pressure (image cache)
    HIGH = 2     // Must clear when critical (video buffer cache)
};

const char* priorityName(CleanupPriority priority);

/**
 * Outcome of one cleaner run
 */
struct CleanupResult {
    std::string resourceName;
    uint64_t bytesFreed;
    int itemsRemoved;
    bool success;
    std::optional<std::string> error;

    CleanupResult(std::string name, uint64_t bytes, int items, bool ok,
                  std::optional<std::string> errorMessage = std::nullopt);

    static CleanupResult failure(const std::string& name, const std::string& errorMessage);

    double freedMB() const;

    bool operator==(const CleanupResult& other) const;
    bool operator!=(const CleanupResult& other) const { return !(*this == other); }
};

} // namespace cleanup
} // namespace streamingcore
