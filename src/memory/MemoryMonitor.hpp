#pragma once

#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "memory/LeakDetector.hpp"
#include "memory/MemorySampler.hpp"
#include "memory/MemoryTypes.hpp"
#include "memory/TempFileSweeper.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace tether {

struct MemoryMonitorConfig {
    double sampleIntervalSeconds = 5.0;
    size_t historyLimit = 100;
    double cleanupCooldownSeconds = 30.0;
    double spikeRatio = 0.20;          // app usage growth between samples
    int emergencyExtraPasses = 3;
    int emergencyPauseMs = 100;
    PressureThresholds thresholds;

    bool leakDetectionEnabled = true;
    LeakDetectorConfig leak;
    double leakSweepIntervalSeconds = 60.0;

    std::string tempDirectory;         // empty: no transient-file sweep
};

/// Outcome of one cleanup pass.
struct CleanupResult {
    bool ran = false;
    std::string reason;
    uint64_t before = 0;               // app usage, bytes
    uint64_t after = 0;
    uint64_t bytesFreed = 0;
    size_t cachesReleased = 0;
    size_t resourcesEvicted = 0;
    size_t filesRemoved = 0;
    size_t stepFailures = 0;
};

using CacheReleaser = std::function<void()>;
using CacheReleaserId = uint64_t;

/// Disposes idle resources; returns how many went away.
using IdleEvictionHook = std::function<size_t()>;

/// Returns false when tracked resources are over their memory budget.
using BudgetCheck = std::function<bool()>;

/// Final say on soft (Warning-level) cleanups.
using CleanupApprover = std::function<bool(PressureLevel)>;

/// Samples memory on a timer, classifies pressure, drives cleanup and
/// watches tracked allocations for leaks.
///
/// Notifications go to the EventBus (may be null) under the names in
/// memory_events.  Cleanup runs four steps in order: cache releasers, the
/// idle eviction hook, the transient-file sweep, then the reclaim hook
/// (malloc_trim by default).  A failing step is logged and the rest still
/// run.  Only one cleanup runs at a time; overlapping requests are skipped.
class MemoryMonitor {
public:
    MemoryMonitor(MemoryMonitorConfig config,
                  std::unique_ptr<MemorySampler> sampler,
                  std::shared_ptr<Clock> clock = nullptr,
                  EventBus* eventBus = nullptr);
    ~MemoryMonitor();

    MemoryMonitor(const MemoryMonitor&) = delete;
    MemoryMonitor& operator=(const MemoryMonitor&) = delete;

    // --- Background threads ---

    /// Start the sampler thread and, when enabled, the leak sweep thread.
    void start();

    /// Stop and join both threads.  Idempotent.
    void stop();
    bool isRunning() const { return m_running.load(); }

    // --- Sampling ---

    /// Read the sampler once and process the reading.
    std::optional<MemoryStatistics> sampleNow();

    /// Classify a reading, record it, and apply the level-change, spike
    /// and budget policies.  Serialized with other calls.
    MemoryStatistics processSample(const RawMemorySample& raw);

    // --- Cleanup ---

    /// Soft cleanup: skipped inside the cooldown window or when the
    /// approver declines.  Returns true if a cleanup ran.
    bool requestCleanup(const std::string& reason);

    /// Cleanup regardless of cooldown and approver.
    CleanupResult forceCleanup(const std::string& reason);

    CacheReleaserId addCacheReleaser(const std::string& name, CacheReleaser releaser);
    bool removeCacheReleaser(CacheReleaserId id);

    void setIdleEvictionHook(IdleEvictionHook hook);
    /// Consulted after every sample; a failed check requests a cleanup.
    void setBudgetCheck(BudgetCheck check);
    void setCleanupApprover(CleanupApprover approver);

    /// Replace the memory-reclamation step (tests).
    void setReclaimHook(std::function<void()> hook);

    // --- Leak detection ---

    void trackAllocation(const std::string& objectId, uint64_t sizeBytes,
                         const std::string& originInfo = "");
    bool untrackAllocation(const std::string& objectId);

    /// Publish a PossibleLeak for every entry past the threshold.
    /// Returns the number reported.
    size_t sweepLeaks();

    LeakDetector& leakDetector() { return m_leaks; }

    // --- Queries ---

    PressureLevel currentLevel() const;
    std::optional<MemoryStatistics> latest() const;
    std::vector<MemoryStatistics> history() const;
    uint64_t cleanupCount() const;
    std::optional<TimePoint> lastCleanupTime() const;
    bool isCleanupInProgress() const { return m_cleanupInProgress.load(); }

    MemoryReport report() const;
    nlohmann::json exportState() const;

    const MemoryMonitorConfig& config() const { return m_config; }

private:
    CleanupResult runCleanup(const std::string& reason, bool respectCooldown);
    void runEmergencyCleanup();

    /// Current app usage straight from the sampler, without processing.
    uint64_t measureAppUsage();

    /// Sleep that returns early (false) when stop() is called.
    bool pauseFor(std::chrono::milliseconds duration);

    void samplerLoop();
    void leakSweepLoop();
    void publish(const char* eventName, const EventData& data);

    MemoryMonitorConfig m_config;
    std::unique_ptr<MemorySampler> m_sampler;
    std::shared_ptr<Clock> m_clock;
    EventBus* m_eventBus = nullptr;

    LeakDetector m_leaks;
    TempFileSweeper m_sweeper;

    std::mutex m_samplerMutex;
    std::mutex m_processMutex;

    mutable std::mutex m_stateMutex;
    std::optional<MemoryStatistics> m_latest;
    PressureLevel m_level = PressureLevel::Normal;
    std::deque<MemoryStatistics> m_history;
    uint64_t m_cleanupCount = 0;
    std::optional<TimePoint> m_lastCleanup;

    struct NamedReleaser {
        CacheReleaserId id;
        std::string name;
        CacheReleaser releaser;
    };
    mutable std::mutex m_hooksMutex;
    std::vector<NamedReleaser> m_cacheReleasers;
    CacheReleaserId m_nextReleaserId = 1;
    IdleEvictionHook m_idleEviction;
    BudgetCheck m_budgetCheck;
    CleanupApprover m_approver;
    std::function<void()> m_reclaim;

    std::atomic<bool> m_cleanupInProgress{false};

    std::atomic<bool> m_running{false};
    std::mutex m_threadMutex;
    std::condition_variable m_threadCv;
    bool m_stopping = false;
    std::thread m_samplerThread;
    std::thread m_leakThread;
};

} // namespace tether
