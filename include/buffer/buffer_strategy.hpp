#pragma once

#include <optional>
#include <string>

namespace streamingcore {
namespace buffer {

/**
 * Discrete buffering policies, ordered from least to most forward content.
 * Strategies compare by rank, so the most constrained of two ceilings is
 * simply the smaller one.
 */
enum class BufferStrategy {
    MINIMAL = 0,
    CONSERVATIVE = 1,
    BALANCED = 2,
    AGGRESSIVE = 3
};

const char* strategyName(BufferStrategy strategy);

/// Human-readable summary of what the strategy prefetches
const char* strategyDescription(BufferStrategy strategy);

/**
 * Parse "minimal", "conservative", "balanced" or "aggressive",
 * case-insensitive.
 */
std::optional<BufferStrategy> parseStrategy(const std::string& name);

inline BufferStrategy minStrategy(BufferStrategy a, BufferStrategy b) {
    return static_cast<int>(a) <= static_cast<int>(b) ? a : b;
}

} // namespace buffer
} // namespace streamingcore
