#include "cleanup/cleanup_result.hpp"
#include <utility>

namespace streamingcore {
namespace cleanup {

const char* priorityName(CleanupPriority priority) {
    switch (priority) {
        case CleanupPriority::LOW: return "low";
        case CleanupPriority::MEDIUM: return "medium";
        case CleanupPriority::HIGH: return "high";
    }
    return "low";
}

CleanupResult::CleanupResult(std::string name, uint64_t bytes, int items, bool ok,
                             std::optional<std::string> errorMessage)
    : resourceName(std::move(name))
    , bytesFreed(bytes)
    , itemsRemoved(items)
    , success(ok)
    , error(std::move(errorMessage)) {
}

CleanupResult CleanupResult::failure(const std::string& name, const std::string& errorMessage) {
    return CleanupResult(name, 0, 0, false, errorMessage);
}

double CleanupResult::freedMB() const {
    return static_cast<double>(bytesFreed) / (1024.0 * 1024.0);
}

bool CleanupResult::operator==(const CleanupResult& other) const {
    return resourceName == other.resourceName &&
           bytesFreed == other.bytesFreed &&
           itemsRemoved == other.itemsRemoved &&
           success == other.success &&
           error == other.error;
}

} // namespace cleanup
} // namespace streamingcore
