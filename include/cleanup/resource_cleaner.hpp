#pragma once

#include "cleanup/cleanup_result.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace streamingcore {
namespace cleanup {

/**
 * A component that can release resources under memory pressure.
 * Cleanup should be idempotent and estimation must not modify state.
 */
class ResourceCleaner {
public:
    virtual ~ResourceCleaner() = default;

    virtual const std::string& resourceName() const = 0;
    virtual CleanupPriority priority() const = 0;

    /**
     * Bytes a cleanup would free, without performing it
     */
    virtual uint64_t estimateCleanup() = 0;

    /**
     * Release the resource. Failures are returned, not thrown.
     */
    virtual CleanupResult cleanup() = 0;
};

/**
 * What a cache reports after clearing
 */
struct ClearedItems {
    uint64_t bytesFreed = 0;
    int itemsRemoved = 0;
};

/**
 * Cleaner backed by an injected clear action, decoupled from the cache
 * implementation. An exception from the action becomes a failed result.
 */
class CacheCleaner : public ResourceCleaner {
public:
    using ClearAction = std::function<ClearedItems()>;

    CacheCleaner(std::string name, CleanupPriority priority, ClearAction clearAction,
                 uint64_t estimatedBytes = 0);

    const std::string& resourceName() const override { return name_; }
    CleanupPriority priority() const override { return priority_; }
    uint64_t estimateCleanup() override { return estimatedBytes_; }
    CleanupResult cleanup() override;

private:
    std::string name_;
    CleanupPriority priority_;
    ClearAction clearAction_;
    uint64_t estimatedBytes_;
};

/**
 * "Video Cache" cleaner, HIGH priority
 * @param deleteAction Deletes cached video files
 * @param statistics Optional reporter of bytes and items freed by the delete
 * @param estimatedBytes Estimated cache size (0 if unknown)
 */
std::shared_ptr<CacheCleaner> makeVideoCacheCleaner(std::function<void()> deleteAction,
                                                    std::function<ClearedItems()> statistics = nullptr,
                                                    uint64_t estimatedBytes = 0);

/**
 * "Image Cache" cleaner, MEDIUM priority. Image caches don't expose their
 * size, so bytesFreed is always 0.
 * @param clearAction Clears the cache and returns the number of items removed
 */
std::shared_ptr<CacheCleaner> makeImageCacheCleaner(std::function<int()> clearAction,
                                                    uint64_t estimatedBytes = 0);

} // namespace cleanup
} // namespace streamingcore
