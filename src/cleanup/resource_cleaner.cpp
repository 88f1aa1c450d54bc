#include "cleanup/resource_cleaner.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <utility>

namespace streamingcore {
namespace cleanup {

CacheCleaner::CacheCleaner(std::string name, CleanupPriority priority, ClearAction clearAction,
                           uint64_t estimatedBytes)
    : name_(std::move(name))
    , priority_(priority)
    , clearAction_(std::move(clearAction))
    , estimatedBytes_(estimatedBytes) {
    if (!clearAction_) {
        throw utils::CleanupException("Cache cleaner requires a clear action", name_);
    }
}

CleanupResult CacheCleaner::cleanup() {
    try {
        ClearedItems cleared = clearAction_();
        utils::Logger::debug(name_ + " cleared " + std::to_string(cleared.itemsRemoved) +
                             " items, " + std::to_string(cleared.bytesFreed) + " bytes");
        return CleanupResult(name_, cleared.bytesFreed, cleared.itemsRemoved, true);
    } catch (const std::exception& e) {
        utils::Logger::warn(name_ + " cleanup failed: " + std::string(e.what()));
        return CleanupResult::failure(name_, e.what());
    }
}

std::shared_ptr<CacheCleaner> makeVideoCacheCleaner(std::function<void()> deleteAction,
                                                    std::function<ClearedItems()> statistics,
                                                    uint64_t estimatedBytes) {
    auto action = [deleteAction, statistics]() {
        deleteAction();
        return statistics ? statistics() : ClearedItems();
    };
    return std::make_shared<CacheCleaner>("Video Cache", CleanupPriority::HIGH, action, estimatedBytes);
}

std::shared_ptr<CacheCleaner> makeImageCacheCleaner(std::function<int()> clearAction,
                                                    uint64_t estimatedBytes) {
    auto action = [clearAction]() {
        ClearedItems cleared;
        cleared.itemsRemoved = clearAction();
        return cleared;
    };
    return std::make_shared<CacheCleaner>("Image Cache", CleanupPriority::MEDIUM, action, estimatedBytes);
}

} // namespace cleanup
} // namespace streamingcore
