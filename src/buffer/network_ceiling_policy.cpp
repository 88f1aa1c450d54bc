#include "buffer/network_ceiling_policy.hpp"

namespace streamingcore {
namespace buffer {

NetworkCeilingPolicy::NetworkCeilingPolicy() {
    ceilings_[network::NetworkQuality::OFFLINE] = BufferStrategy::MINIMAL;
    ceilings_[network::NetworkQuality::POOR] = BufferStrategy::MINIMAL;
    ceilings_[network::NetworkQuality::FAIR] = BufferStrategy::CONSERVATIVE;
    ceilings_[network::NetworkQuality::GOOD] = BufferStrategy::BALANCED;
    ceilings_[network::NetworkQuality::EXCELLENT] = BufferStrategy::AGGRESSIVE;
}

BufferStrategy NetworkCeilingPolicy::ceilingFor(network::NetworkQuality quality) const {
    auto it = ceilings_.find(quality);
    return it != ceilings_.end() ? it->second : BufferStrategy::BALANCED;
}

void NetworkCeilingPolicy::setCeiling(network::NetworkQuality quality, BufferStrategy ceiling) {
    ceilings_[quality] = ceiling;
}

} // namespace buffer
} // namespace streamingcore
