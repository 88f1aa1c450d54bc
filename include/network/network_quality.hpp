#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace streamingcore {
namespace network {

/**
 * Network quality classification, ordered from worst to best
 */
enum class NetworkQuality {
    OFFLINE = 0,   // No connectivity
    POOR = 1,      // >= 200ms latency, >= 20ms jitter or >= 2% loss
    FAIR = 2,      // < 200ms latency, < 20ms jitter, < 2% loss
    GOOD = 3,      // < 100ms latency, < 10ms jitter, < 0.5% loss
    EXCELLENT = 4  // < 50ms latency, < 5ms jitter, < 0.1% loss
};

const char* networkQualityName(NetworkQuality quality);

/**
 * Parse "offline", "poor", "fair" (or "moderate"), "good", "excellent",
 * case-insensitive.
 */
std::optional<NetworkQuality> parseNetworkQuality(const std::string& name);

/**
 * Network condition metrics
 */
struct NetworkMetrics {
    float latencyMs;           // Round-trip time
    float jitterMs;            // Latency variation
    float packetLossRate;      // Packet loss percentage (0-100)
    float bandwidthKbps;       // Available bandwidth in Kbps
    float throughputKbps;      // Current throughput in Kbps
    bool reachable;            // False when the network is down
    std::chrono::steady_clock::time_point timestamp;

    NetworkMetrics()
        : latencyMs(0.0f), jitterMs(0.0f), packetLossRate(0.0f)
        , bandwidthKbps(0.0f), throughputKbps(0.0f), reachable(true)
        , timestamp(std::chrono::steady_clock::now()) {}
};

} // namespace network
} // namespace streamingcore
