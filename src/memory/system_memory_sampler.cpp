#include "memory/memory_sampler.hpp"
#include "utils/error_handler.hpp"
#include "utils/logging.hpp"
#include <cerrno>
#include <cstring>
#include <cstdio>
#include <fstream>
#include <utility>

// Platform-specific includes for system memory
#if defined(__APPLE__)
#include <mach/mach.h>
#include <sys/sysctl.h>
#include <sys/types.h>
#elif defined(__linux__)
#include <sys/sysinfo.h>
#include <unistd.h>
#endif

namespace streamingcore {
namespace memory {

SystemMemorySampler::SystemMemorySampler()
    : meminfoPath_("/proc/meminfo") {
}

SystemMemorySampler::SystemMemorySampler(std::string meminfoPath)
    : meminfoPath_(std::move(meminfoPath)) {
}

std::optional<RawMemorySample> SystemMemorySampler::sample() {
#if defined(__APPLE__)
    vm_size_t pageSize;
    vm_statistics64_data_t vmStat;
    mach_msg_type_number_t hostSize = HOST_VM_INFO64_COUNT;

    if (host_page_size(mach_host_self(), &pageSize) != KERN_SUCCESS ||
        host_statistics64(mach_host_self(), HOST_VM_INFO64,
                          reinterpret_cast<host_info64_t>(&vmStat), &hostSize) != KERN_SUCCESS) {
        throw utils::SamplingException("host_statistics64 failed", utils::ErrorCategory::MEMORY_MONITORING,
                                       "SystemMemorySampler");
    }

    int64_t totalBytes = 0;
    size_t size = sizeof(totalBytes);
    if (sysctlbyname("hw.memsize", &totalBytes, &size, nullptr, 0) != 0 || totalBytes <= 0) {
        return std::nullopt;
    }

    uint64_t available = static_cast<uint64_t>(vmStat.free_count + vmStat.inactive_count) * pageSize;
    uint64_t used = static_cast<uint64_t>(vmStat.active_count + vmStat.wire_count) * pageSize;
    return RawMemorySample(available, static_cast<uint64_t>(totalBytes), used);

#elif defined(__linux__)
    if (auto fromMeminfo = readMeminfo()) {
        return fromMeminfo;
    }

    // Older kernels without MemAvailable
    struct sysinfo memInfo;
    if (sysinfo(&memInfo) != 0) {
        throw utils::SamplingException(std::string("sysinfo failed: ") + std::strerror(errno),
                                       utils::ErrorCategory::MEMORY_MONITORING, "SystemMemorySampler");
    }
    uint64_t unit = memInfo.mem_unit > 0 ? memInfo.mem_unit : 1;
    uint64_t total = static_cast<uint64_t>(memInfo.totalram) * unit;
    uint64_t available = static_cast<uint64_t>(memInfo.freeram + memInfo.bufferram) * unit;
    uint64_t used = total > available ? total - available : 0;
    return RawMemorySample(available, total, used);

#else
    return readMeminfo();
#endif
}

std::optional<RawMemorySample> SystemMemorySampler::readMeminfo() const {
    std::ifstream file(meminfoPath_);
    if (!file.is_open()) {
        return std::nullopt;
    }

    uint64_t totalKb = 0;
    uint64_t availableKb = 0;
    bool haveTotal = false;
    bool haveAvailable = false;

    std::string line;
    while (std::getline(file, line)) {
        unsigned long long value = 0;
        if (std::sscanf(line.c_str(), "MemTotal: %llu kB", &value) == 1) {
            totalKb = value;
            haveTotal = true;
        } else if (std::sscanf(line.c_str(), "MemAvailable: %llu kB", &value) == 1) {
            availableKb = value;
            haveAvailable = true;
        }
    }

    if (!haveTotal || !haveAvailable) {
        utils::Logger::debug("meminfo at " + meminfoPath_ + " lacks MemTotal/MemAvailable");
        return std::nullopt;
    }

    uint64_t total = totalKb * 1024;
    uint64_t available = availableKb * 1024;
    uint64_t used = total > available ? total - available : 0;
    return RawMemorySample(available, total, used);
}

} // namespace memory
} // namespace streamingcore
