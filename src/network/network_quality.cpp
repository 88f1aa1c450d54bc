#include "network/network_quality.hpp"
#include <algorithm>
#include <cctype>

namespace streamingcore {
namespace network {

const char* networkQualityName(NetworkQuality quality) {
    switch (quality) {
        case NetworkQuality::OFFLINE: return "offline";
        case NetworkQuality::POOR: return "poor";
        case NetworkQuality::FAIR: return "fair";
        case NetworkQuality::GOOD: return "good";
        case NetworkQuality::EXCELLENT: return "excellent";
    }
    return "good";
}

std::optional<NetworkQuality> parseNetworkQuality(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "offline") return NetworkQuality::OFFLINE;
    if (lower == "poor") return NetworkQuality::POOR;
    if (lower == "fair" || lower == "moderate") return NetworkQuality::FAIR;
    if (lower == "good") return NetworkQuality::GOOD;
    if (lower == "excellent") return NetworkQuality::EXCELLENT;
    return std::nullopt;
}

} // namespace network
} // namespace streamingcore
