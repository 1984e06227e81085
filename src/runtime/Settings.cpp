#include "runtime/Settings.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"

namespace tether {

Settings Settings::fromConfig(const Config& config) {
    Settings s;

    s.logFile = config.getString("logging.file", s.logFile);
    s.logLevel = config.getString("logging.level", s.logLevel);

    // Registry
    s.registry.maxDisposalPasses = config.getInt("registry.max_disposal_passes",
                                                 s.registry.maxDisposalPasses);
    s.registry.hookSoftTimeoutSeconds = config.getDouble("registry.soft_timeout_seconds",
                                                         s.registry.hookSoftTimeoutSeconds);
    s.registry.idleEvictionSeconds = config.getDouble("registry.idle_eviction_seconds",
                                                      s.registry.idleEvictionSeconds);
    int maxEvictions = config.getInt("registry.max_evictions_per_cleanup",
                                     static_cast<int>(s.registry.maxEvictionsPerPass));
    if (maxEvictions >= 0) s.registry.maxEvictionsPerPass = static_cast<size_t>(maxEvictions);
    int64_t maxMemory = config.getInt64("registry.max_estimated_memory_bytes",
                                        static_cast<int64_t>(s.registry.maxEstimatedMemoryBytes));
    if (maxMemory >= 0) s.registry.maxEstimatedMemoryBytes = static_cast<uint64_t>(maxMemory);

    // Memory monitor
    auto& m = s.memory;
    m.sampleIntervalSeconds = config.getDouble("memory.sample_interval_seconds", m.sampleIntervalSeconds);
    int historyLimit = config.getInt("memory.history_limit", static_cast<int>(m.historyLimit));
    if (historyLimit > 0) m.historyLimit = static_cast<size_t>(historyLimit);
    m.cleanupCooldownSeconds = config.getDouble("memory.cleanup_cooldown_seconds", m.cleanupCooldownSeconds);
    m.spikeRatio = config.getDouble("memory.spike_ratio", m.spikeRatio);
    m.emergencyExtraPasses = config.getInt("memory.emergency_extra_passes", m.emergencyExtraPasses);
    m.emergencyPauseMs = config.getInt("memory.emergency_pause_ms", m.emergencyPauseMs);

    PressureThresholds thresholds;
    thresholds.normal = config.getDouble("memory.thresholds.normal", m.thresholds.normal);
    thresholds.warning = config.getDouble("memory.thresholds.warning", m.thresholds.warning);
    thresholds.critical = config.getDouble("memory.thresholds.critical", m.thresholds.critical);
    thresholds.emergency = config.getDouble("memory.thresholds.emergency", m.thresholds.emergency);
    if (thresholds.isValid()) {
        m.thresholds = thresholds;
    } else {
        LOG_WARN("memory.thresholds must be ascending within (0, 1], keeping defaults");
    }

    m.leakDetectionEnabled = config.getBool("memory.leak.enabled", m.leakDetectionEnabled);
    m.leak.thresholdSeconds = config.getDouble("memory.leak.threshold_seconds", m.leak.thresholdSeconds);
    int maxTracked = config.getInt("memory.leak.max_tracked", static_cast<int>(m.leak.maxTracked));
    if (maxTracked > 0) m.leak.maxTracked = static_cast<size_t>(maxTracked);
    m.leakSweepIntervalSeconds = config.getDouble("memory.leak.sweep_interval_seconds",
                                                  m.leakSweepIntervalSeconds);
    m.tempDirectory = config.getString("memory.temp_directory", m.tempDirectory);

    // Lifecycle
    if (config.hasKey("lifecycle.critical_kinds")) {
        std::vector<ResourceKind> kinds;
        for (const auto& name : config.getStringList("lifecycle.critical_kinds")) {
            if (auto kind = parseResourceKind(name)) {
                kinds.push_back(*kind);
            } else {
                LOG_WARN("Unknown resource kind '{}' in lifecycle.critical_kinds", name);
            }
        }
        s.lifecycle.criticalKinds = std::move(kinds);
    }
    s.lifecycle.transitionSoftTimeoutSeconds = config.getDouble(
        "lifecycle.transition_soft_timeout_seconds", s.lifecycle.transitionSoftTimeoutSeconds);
    s.snapshotPath = config.getString("lifecycle.snapshot_path", s.snapshotPath);

    // Main loop
    s.loopIntervalMs = config.getInt("runtime.loop_interval_ms", s.loopIntervalMs);
    if (s.loopIntervalMs < 1) s.loopIntervalMs = 1;
    s.suspendGapSeconds = config.getDouble("runtime.suspend_gap_seconds", s.suspendGapSeconds);

    return s;
}

} // namespace tether
