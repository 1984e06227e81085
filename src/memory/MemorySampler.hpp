#pragma once

#include "memory/MemoryTypes.hpp"

#include <optional>
#include <string>

namespace tether {

/// Source of raw memory readings.  Returns nullopt when nothing could be
/// read; the monitor then skips the tick.
class MemorySampler {
public:
    virtual ~MemorySampler() = default;
    virtual std::optional<RawMemorySample> sample() = 0;
};

/// Linux sampler: system totals from /proc/meminfo (MemTotal,
/// MemAvailable), process resident set from /proc/self/status (VmRSS).
/// Paths are injectable for tests.
class ProcMemorySampler : public MemorySampler {
public:
    ProcMemorySampler(std::string meminfoPath = "/proc/meminfo",
                      std::string statusPath = "/proc/self/status");

    std::optional<RawMemorySample> sample() override;

    /// Value of a "Key:   1234 kB" line, in bytes.
    static std::optional<uint64_t> readKbField(const std::string& content, const std::string& key);

private:
    std::string m_meminfoPath;
    std::string m_statusPath;
};

} // namespace tether
