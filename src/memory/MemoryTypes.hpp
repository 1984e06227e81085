#pragma once

#include "core/Clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace tether {

enum class PressureLevel {
    Normal,
    Warning,
    Critical,
    Emergency
};

const char* pressureLevelToString(PressureLevel level);

/// Upper bounds of the pressure bands, as used/total ratios.  A ratio up
/// to `normal` is Normal, up to `warning` is Warning, up to `critical` is
/// Critical, and anything above is Emergency.
///
/// `emergency` never changes classification: it is the Emergency band's
/// nominal ceiling, checked by isValid() and reported by toJson() only.
struct PressureThresholds {
    double normal = 0.60;
    double warning = 0.75;
    double critical = 0.90;
    double emergency = 0.95;

    /// Strictly ascending and inside (0, 1].
    bool isValid() const;
    nlohmann::json toJson() const;
};

/// Monotonic in `ratio`: a higher ratio never yields a lower level.
PressureLevel classifyPressure(double ratio, const PressureThresholds& thresholds);

/// What a MemorySampler reads, in bytes.
struct RawMemorySample {
    uint64_t totalMemory = 0;
    uint64_t usedMemory = 0;
    uint64_t freeMemory = 0;
    uint64_t appMemoryUsage = 0;
};

/// One processed sample.  Immutable once produced.
struct MemoryStatistics {
    uint64_t totalMemory = 0;
    uint64_t usedMemory = 0;
    uint64_t freeMemory = 0;
    uint64_t appMemoryUsage = 0;
    PressureLevel pressureLevel = PressureLevel::Normal;
    TimePoint timestamp{};

    /// usedMemory / totalMemory, 0 when total is unknown.
    double usageRatio() const;
    nlohmann::json toJson() const;
};

struct TrackedAllocation {
    std::string objectId;
    TimePoint allocatedAt{};
    uint64_t sizeBytes = 0;
    std::string originInfo;

    nlohmann::json toJson() const;
};

/// Summary returned by MemoryMonitor::report().
struct MemoryReport {
    std::optional<MemoryStatistics> current;
    PressureLevel level = PressureLevel::Normal;
    uint64_t cleanupCount = 0;
    std::optional<TimePoint> lastCleanup;
    size_t historySize = 0;
    size_t trackedAllocations = 0;
    uint64_t trackedBytes = 0;
    bool leakDetectionEnabled = true;

    nlohmann::json toJson() const;
};

/// "512 B", "1.5 KB", "2.25 GB".
std::string formatBytes(uint64_t bytes);

/// Event names published on the EventBus by the memory monitor.
namespace memory_events {
constexpr const char* kWarningLevelChanged = "memory.warning_level_changed";
constexpr const char* kUsageSpike          = "memory.usage_spike";
constexpr const char* kPossibleLeak        = "memory.possible_leak";
constexpr const char* kCleanupTriggered    = "memory.cleanup_triggered";
constexpr const char* kCleanupCompleted    = "memory.cleanup_completed";
} // namespace memory_events

} // namespace tether
