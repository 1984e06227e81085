#pragma once

#include "lifecycle/LifecycleCoordinator.hpp"
#include "memory/MemoryMonitor.hpp"
#include "resource/ResourceRegistry.hpp"

#include <string>

namespace tether {

class Config;

/// Typed runtime tuning read from a Config.  Missing or mistyped keys keep
/// the built-in defaults.
///
///   logging.file, logging.level
///   registry.max_disposal_passes, registry.soft_timeout_seconds,
///   registry.idle_eviction_seconds, registry.max_evictions_per_cleanup,
///   registry.max_estimated_memory_bytes
///   memory.sample_interval_seconds, memory.history_limit,
///   memory.cleanup_cooldown_seconds, memory.spike_ratio,
///   memory.emergency_extra_passes, memory.emergency_pause_ms,
///   memory.thresholds.{normal,warning,critical,emergency},
///   memory.leak.{enabled,threshold_seconds,max_tracked,sweep_interval_seconds},
///   memory.temp_directory
///   lifecycle.critical_kinds, lifecycle.snapshot_path,
///   lifecycle.transition_soft_timeout_seconds
///   runtime.loop_interval_ms, runtime.suspend_gap_seconds
struct Settings {
    std::string logFile;
    std::string logLevel = "info";

    RegistryConfig registry;
    MemoryMonitorConfig memory;
    LifecycleConfig lifecycle;

    std::string snapshotPath;          // empty: snapshots kept in memory
    int loopIntervalMs = 250;
    double suspendGapSeconds = 30.0;   // loop gap treated as a system suspend

    static Settings fromConfig(const Config& config);
};

} // namespace tether
