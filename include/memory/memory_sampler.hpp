#pragma once

#include "memory/memory_state.hpp"
#include <optional>
#include <string>

namespace streamingcore {
namespace memory {

/**
 * Source of raw memory measurements. Returns nullopt (or throws) when the
 * platform cannot provide a reading right now.
 */
class MemorySampler {
public:
    virtual ~MemorySampler() = default;
    virtual std::optional<RawMemorySample> sample() = 0;
};

/**
 * Device-wide memory sampler backed by the operating system.
 * Linux/Android: /proc/meminfo (MemAvailable), sysinfo() as fallback.
 * macOS/iOS: host VM statistics.
 */
class SystemMemorySampler : public MemorySampler {
public:
    SystemMemorySampler();
    explicit SystemMemorySampler(std::string meminfoPath);

    std::optional<RawMemorySample> sample() override;

private:
    std::optional<RawMemorySample> readMeminfo() const;

    std::string meminfoPath_;
};

} // namespace memory
} // namespace streamingcore
