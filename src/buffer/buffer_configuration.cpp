#include "buffer/buffer_configuration.hpp"
#include <sstream>
#include <utility>

namespace streamingcore {
namespace buffer {

BufferConfiguration::BufferConfiguration(BufferStrategy strategy,
                                         double preferredForwardBufferSeconds,
                                         std::string reason)
    : strategy_(strategy)
    , preferredForwardBufferSeconds_(preferredForwardBufferSeconds)
    , reason_(std::move(reason)) {
}

BufferConfiguration BufferConfiguration::minimal() {
    return BufferConfiguration(BufferStrategy::MINIMAL, 2.0,
                               "Memory critical - minimal buffering");
}

BufferConfiguration BufferConfiguration::conservative() {
    return BufferConfiguration(BufferStrategy::CONSERVATIVE, 5.0,
                               "Limited resources - conservative buffering");
}

BufferConfiguration BufferConfiguration::balanced() {
    return BufferConfiguration(BufferStrategy::BALANCED, 10.0,
                               "Normal conditions - balanced buffering");
}

BufferConfiguration BufferConfiguration::aggressive() {
    return BufferConfiguration(BufferStrategy::AGGRESSIVE, 30.0,
                               "Optimal conditions - aggressive buffering");
}

BufferConfiguration BufferConfiguration::forStrategy(BufferStrategy strategy) {
    switch (strategy) {
        case BufferStrategy::MINIMAL: return minimal();
        case BufferStrategy::CONSERVATIVE: return conservative();
        case BufferStrategy::BALANCED: return balanced();
        case BufferStrategy::AGGRESSIVE: return aggressive();
    }
    return balanced();
}

BufferConfiguration BufferConfiguration::networkLimited(BufferStrategy strategy) {
    // The network ceiling only binds below AGGRESSIVE
    if (strategy == BufferStrategy::AGGRESSIVE) {
        return aggressive();
    }
    return BufferConfiguration(strategy, forwardBufferSeconds(strategy),
                               std::string("Network limited - ") + strategyName(strategy) +
                               " buffering");
}

double BufferConfiguration::forwardBufferSeconds(BufferStrategy strategy) {
    switch (strategy) {
        case BufferStrategy::MINIMAL: return 2.0;
        case BufferStrategy::CONSERVATIVE: return 5.0;
        case BufferStrategy::BALANCED: return 10.0;
        case BufferStrategy::AGGRESSIVE: return 30.0;
    }
    return 10.0;
}

std::string BufferConfiguration::toString() const {
    std::ostringstream oss;
    oss << strategyName(strategy_) << " (" << preferredForwardBufferSeconds_ << "s): " << reason_;
    return oss.str();
}

bool BufferConfiguration::operator==(const BufferConfiguration& other) const {
    return strategy_ == other.strategy_ &&
           preferredForwardBufferSeconds_ == other.preferredForwardBufferSeconds_ &&
           reason_ == other.reason_;
}

} // namespace buffer
} // namespace streamingcore
