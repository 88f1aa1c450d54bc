#pragma once

#include "buffer/buffer_strategy.hpp"
#include <string>

namespace streamingcore {
namespace buffer {

/**
 * Buffering policy handed to the media pipeline: a strategy, how many
 * seconds of content to keep ahead of playback, and why.
 *
 * Immutable value snapshot. A new one is produced on every recomputation.
 */
class BufferConfiguration {
public:
    BufferConfiguration(BufferStrategy strategy, double preferredForwardBufferSeconds,
                        std::string reason);

    /// 2 s, "Memory critical - minimal buffering"
    static BufferConfiguration minimal();
    /// 5 s, "Limited resources - conservative buffering"
    static BufferConfiguration conservative();
    /// 10 s, "Normal conditions - balanced buffering"
    static BufferConfiguration balanced();
    /// 30 s, "Optimal conditions - aggressive buffering"
    static BufferConfiguration aggressive();

    /// Canonical preset for a strategy
    static BufferConfiguration forStrategy(BufferStrategy strategy);

    /**
     * Preset duration for a strategy, with a reason stating that the network
     * was the limiting input
     */
    static BufferConfiguration networkLimited(BufferStrategy strategy);

    static double forwardBufferSeconds(BufferStrategy strategy);

    BufferStrategy strategy() const { return strategy_; }
    double preferredForwardBufferSeconds() const { return preferredForwardBufferSeconds_; }
    const std::string& reason() const { return reason_; }

    std::string toString() const;

    bool operator==(const BufferConfiguration& other) const;
    bool operator!=(const BufferConfiguration& other) const { return !(*this == other); }

private:
    BufferStrategy strategy_;
    double preferredForwardBufferSeconds_;
    std::string reason_;
};

} // namespace buffer
} // namespace streamingcore
