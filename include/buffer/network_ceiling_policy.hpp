#pragma once

#include "buffer/buffer_strategy.hpp"
#include "network/network_quality.hpp"
#include <map>

namespace streamingcore {
namespace buffer {

/**
 * Most generous buffering strategy each network quality allows.
 *
 * Defaults: offline and poor -> minimal, fair -> conservative,
 * good -> balanced, excellent -> aggressive. Any level can be overridden
 * from configuration.
 */
class NetworkCeilingPolicy {
public:
    NetworkCeilingPolicy();

    static NetworkCeilingPolicy defaults() { return NetworkCeilingPolicy(); }

    BufferStrategy ceilingFor(network::NetworkQuality quality) const;
    void setCeiling(network::NetworkQuality quality, BufferStrategy ceiling);

    bool operator==(const NetworkCeilingPolicy& other) const { return ceilings_ == other.ceilings_; }
    bool operator!=(const NetworkCeilingPolicy& other) const { return !(*this == other); }

private:
    std::map<network::NetworkQuality, BufferStrategy> ceilings_;
};

} // namespace buffer
} // namespace streamingcore
