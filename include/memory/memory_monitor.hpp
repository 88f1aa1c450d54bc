#pragma once

#include "core/subscription.hpp"
#include "core/update_stream.hpp"
#include "memory/memory_state.hpp"
#include <functional>
#include <memory>

namespace streamingcore {
namespace memory {

/**
 * Pull access to the latest memory snapshot
 */
class MemoryStateProvider {
public:
    virtual ~MemoryStateProvider() = default;

    /**
     * Latest known snapshot. Never blocks on sampling once a snapshot exists.
     */
    virtual MemoryState currentMemoryState() = 0;
};

/**
 * Memory monitoring contract: background sampling with push, pull and
 * lazy-sequence delivery of MemoryState values.
 */
class MemoryMonitor : public MemoryStateProvider {
public:
    using StateCallback = std::function<void(const MemoryState&)>;

    /**
     * Begin periodic sampling. No-op if already running.
     */
    virtual void startMonitoring() = 0;

    /**
     * Halt sampling. Safe to call repeatedly or before startMonitoring().
     */
    virtual void stopMonitoring() = 0;

    virtual bool isMonitoring() const = 0;

    /**
     * Receive every state emitted after this call
     */
    virtual core::Subscription subscribe(StateCallback callback) = 0;

    /**
     * Lazy sequence of future states
     */
    virtual std::unique_ptr<core::UpdateStream<MemoryState>> stateStream() = 0;
};

} // namespace memory
} // namespace streamingcore
