#pragma once

#include "buffer/buffer_configuration.hpp"
#include "core/subscription.hpp"
#include "core/update_stream.hpp"
#include "memory/memory_state.hpp"
#include "network/network_quality.hpp"
#include <functional>
#include <memory>

namespace streamingcore {
namespace buffer {

/**
 * Adaptive buffering controller contract.
 *
 * Consumes memory and network inputs and owns the single current
 * BufferConfiguration, which consumers read by pull, push subscription or
 * a lazy stream of future changes.
 */
class BufferManager {
public:
    using ConfigurationCallback = std::function<void(const BufferConfiguration&)>;

    virtual ~BufferManager() = default;

    /**
     * Classify a memory snapshot and recompute the configuration
     * @param state Latest memory snapshot
     */
    virtual void updateMemoryState(const memory::MemoryState& state) = 0;

    /**
     * Recompute with an already classified memory pressure level
     */
    virtual void updateMemoryPressure(memory::MemoryPressureLevel level) = 0;

    /**
     * Recompute with a new network quality
     */
    virtual void updateNetworkQuality(network::NetworkQuality quality) = 0;

    /**
     * Latest computed configuration. Valid before any update.
     */
    virtual BufferConfiguration currentConfiguration() const = 0;

    /**
     * Receive every configuration change after this call
     */
    virtual core::Subscription subscribe(ConfigurationCallback callback) = 0;

    /**
     * Lazy sequence of future configuration changes
     */
    virtual std::unique_ptr<core::UpdateStream<BufferConfiguration>> configurationStream() = 0;
};

} // namespace buffer
} // namespace streamingcore
