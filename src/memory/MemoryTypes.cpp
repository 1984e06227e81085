#include "memory/MemoryTypes.hpp"

#include <cstdio>

namespace tether {

const char* pressureLevelToString(PressureLevel level) {
    switch (level) {
        case PressureLevel::Normal:    return "Normal";
        case PressureLevel::Warning:   return "Warning";
        case PressureLevel::Critical:  return "Critical";
        case PressureLevel::Emergency: return "Emergency";
    }
    return "Unknown";
}

bool PressureThresholds::isValid() const {
    return normal > 0.0 && normal < warning && warning < critical
        && critical < emergency && emergency <= 1.0;
}

nlohmann::json PressureThresholds::toJson() const {
    return {
        {"normal", normal},
        {"warning", warning},
        {"critical", critical},
        {"emergency", emergency}
    };
}

PressureLevel classifyPressure(double ratio, const PressureThresholds& thresholds) {
    if (ratio <= thresholds.normal)   return PressureLevel::Normal;
    if (ratio <= thresholds.warning)  return PressureLevel::Warning;
    if (ratio <= thresholds.critical) return PressureLevel::Critical;
    return PressureLevel::Emergency;
}

double MemoryStatistics::usageRatio() const {
    if (totalMemory == 0) return 0.0;
    return static_cast<double>(usedMemory) / static_cast<double>(totalMemory);
}

nlohmann::json MemoryStatistics::toJson() const {
    return {
        {"totalMemory", totalMemory},
        {"usedMemory", usedMemory},
        {"freeMemory", freeMemory},
        {"appMemoryUsage", appMemoryUsage},
        {"usageRatio", usageRatio()},
        {"pressureLevel", pressureLevelToString(pressureLevel)},
        {"timestamp", toEpochMillis(timestamp)}
    };
}

nlohmann::json TrackedAllocation::toJson() const {
    return {
        {"objectId", objectId},
        {"allocatedAt", toEpochMillis(allocatedAt)},
        {"sizeBytes", sizeBytes},
        {"originInfo", originInfo}
    };
}

nlohmann::json MemoryReport::toJson() const {
    nlohmann::json j = {
        {"level", pressureLevelToString(level)},
        {"cleanupCount", cleanupCount},
        {"historySize", historySize},
        {"trackedAllocations", trackedAllocations},
        {"trackedBytes", trackedBytes},
        {"leakDetectionEnabled", leakDetectionEnabled}
    };
    j["current"] = current ? current->toJson() : nlohmann::json();
    j["lastCleanup"] = lastCleanup ? nlohmann::json(toEpochMillis(*lastCleanup)) : nlohmann::json();
    return j;
}

std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes < 1024) {
        return std::to_string(bytes) + " B";
    }

    double value = static_cast<double>(bytes);
    size_t unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.2f", value);
    std::string text(buffer);
    // "1.50" -> "1.5", "2.00" -> "2"
    while (!text.empty() && text.back() == '0') text.pop_back();
    if (!text.empty() && text.back() == '.') text.pop_back();
    return text + " " + units[unit];
}

} // namespace tether
