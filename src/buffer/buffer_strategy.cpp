#include "buffer/buffer_strategy.hpp"
#include <algorithm>
#include <cctype>

namespace streamingcore {
namespace buffer {

const char* strategyName(BufferStrategy strategy) {
    switch (strategy) {
        case BufferStrategy::MINIMAL: return "minimal";
        case BufferStrategy::CONSERVATIVE: return "conservative";
        case BufferStrategy::BALANCED: return "balanced";
        case BufferStrategy::AGGRESSIVE: return "aggressive";
    }
    return "balanced";
}

const char* strategyDescription(BufferStrategy strategy) {
    switch (strategy) {
        case BufferStrategy::MINIMAL:
            return "Minimal buffering for low memory conditions";
        case BufferStrategy::CONSERVATIVE:
            return "Conservative buffering for limited resources";
        case BufferStrategy::BALANCED:
            return "Balanced buffering for normal conditions";
        case BufferStrategy::AGGRESSIVE:
            return "Aggressive buffering for optimal conditions";
    }
    return "";
}

std::optional<BufferStrategy> parseStrategy(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "minimal") return BufferStrategy::MINIMAL;
    if (lower == "conservative") return BufferStrategy::CONSERVATIVE;
    if (lower == "balanced") return BufferStrategy::BALANCED;
    if (lower == "aggressive") return BufferStrategy::AGGRESSIVE;
    return std::nullopt;
}

} // namespace buffer
} // namespace streamingcore
