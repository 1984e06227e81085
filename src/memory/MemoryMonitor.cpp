#include "memory/MemoryMonitor.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

#ifdef __GLIBC__
#include <malloc.h>
#endif

namespace tether {

namespace {

void reclaimHeap() {
#ifdef __GLIBC__
    malloc_trim(0);
#endif
}

/// Clears the in-progress flag when a cleanup pass ends.
struct CleanupFlagReset {
    std::atomic<bool>& flag;
    ~CleanupFlagReset() { flag.store(false); }
};

} // namespace

MemoryMonitor::MemoryMonitor(MemoryMonitorConfig config,
                             std::unique_ptr<MemorySampler> sampler,
                             std::shared_ptr<Clock> clock,
                             EventBus* eventBus)
    : m_config(std::move(config))
    , m_sampler(std::move(sampler))
    , m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , m_eventBus(eventBus)
    , m_leaks(m_config.leak, m_clock)
    , m_sweeper(m_config.tempDirectory)
    , m_reclaim(reclaimHeap) {
    if (!m_config.thresholds.isValid()) {
        LOG_WARN("Memory thresholds are not strictly ascending, using defaults");
        m_config.thresholds = PressureThresholds{};
    }
    if (m_config.historyLimit == 0) m_config.historyLimit = 1;
}

MemoryMonitor::~MemoryMonitor() {
    stop();
}

// --- Background threads -------------------------------------------------

void MemoryMonitor::start() {
    if (m_running.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lock(m_threadMutex);
        m_stopping = false;
    }

    m_samplerThread = std::thread([this] { samplerLoop(); });
    if (m_config.leakDetectionEnabled) {
        m_leakThread = std::thread([this] { leakSweepLoop(); });
    }
    LOG_INFO("Memory monitor started (every {:.1f}s, leak sweep {})",
             m_config.sampleIntervalSeconds,
             m_config.leakDetectionEnabled ? "on" : "off");
}

void MemoryMonitor::stop() {
    if (!m_running.exchange(false)) return;
    {
        std::lock_guard<std::mutex> lock(m_threadMutex);
        m_stopping = true;
    }
    m_threadCv.notify_all();

    for (auto* thread : {&m_samplerThread, &m_leakThread}) {
        if (!thread->joinable()) continue;
        if (thread->get_id() == std::this_thread::get_id()) {
            thread->detach();
        } else {
            thread->join();
        }
    }
    LOG_INFO("Memory monitor stopped");
}

bool MemoryMonitor::pauseFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(m_threadMutex);
    return !m_threadCv.wait_for(lock, duration, [this] { return m_stopping; });
}

void MemoryMonitor::samplerLoop() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(m_config.sampleIntervalSeconds));
    do {
        sampleNow();
    } while (pauseFor(interval));
}

void MemoryMonitor::leakSweepLoop() {
    const auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::duration<double>(m_config.leakSweepIntervalSeconds));
    while (pauseFor(interval)) {
        sweepLeaks();
    }
}

// --- Sampling -----------------------------------------------------------

std::optional<MemoryStatistics> MemoryMonitor::sampleNow() {
    std::optional<RawMemorySample> raw;
    {
        std::lock_guard<std::mutex> lock(m_samplerMutex);
        if (m_sampler) raw = m_sampler->sample();
    }
    if (!raw) {
        LOG_DEBUG("Memory sample unavailable, skipping tick");
        return std::nullopt;
    }
    return processSample(*raw);
}

MemoryStatistics MemoryMonitor::processSample(const RawMemorySample& raw) {
    std::lock_guard<std::mutex> processLock(m_processMutex);

    MemoryStatistics stats;
    stats.totalMemory = raw.totalMemory;
    stats.usedMemory = raw.usedMemory;
    stats.freeMemory = raw.freeMemory;
    stats.appMemoryUsage = raw.appMemoryUsage;
    stats.pressureLevel = classifyPressure(stats.usageRatio(), m_config.thresholds);
    stats.timestamp = m_clock->now();

    std::optional<MemoryStatistics> previous;
    PressureLevel previousLevel;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        previous = m_latest;
        previousLevel = m_level;
        m_latest = stats;
        m_level = stats.pressureLevel;
        m_history.push_back(stats);
        while (m_history.size() > m_config.historyLimit) m_history.pop_front();
    }

    const PressureLevel level = stats.pressureLevel;
    if (level != previousLevel) {
        LOG_INFO("Memory pressure {} -> {} ({:.1f}% used)",
                 pressureLevelToString(previousLevel), pressureLevelToString(level),
                 stats.usageRatio() * 100.0);
        publish(memory_events::kWarningLevelChanged, EventData()
            .setString("old", pressureLevelToString(previousLevel))
            .setString("new", pressureLevelToString(level))
            .setDouble("ratio", stats.usageRatio()));

        switch (level) {
            case PressureLevel::Normal:
                break;
            case PressureLevel::Warning:
                requestCleanup("pressure warning");
                break;
            case PressureLevel::Critical:
                forceCleanup("pressure critical");
                break;
            case PressureLevel::Emergency:
                runEmergencyCleanup();
                break;
        }
    }

    if (previous && previous->appMemoryUsage > 0) {
        const double grown = static_cast<double>(previous->appMemoryUsage) * (1.0 + m_config.spikeRatio);
        if (static_cast<double>(stats.appMemoryUsage) > grown) {
            LOG_WARN("Memory usage spike: {} -> {}",
                     formatBytes(previous->appMemoryUsage), formatBytes(stats.appMemoryUsage));
            publish(memory_events::kUsageSpike, EventData()
                .setInt("previous", static_cast<int64_t>(previous->appMemoryUsage))
                .setInt("current", static_cast<int64_t>(stats.appMemoryUsage)));
            if (level >= PressureLevel::Warning) {
                requestCleanup("usage spike");
            }
        }
    }

    BudgetCheck budgetCheck;
    {
        std::lock_guard<std::mutex> lock(m_hooksMutex);
        budgetCheck = m_budgetCheck;
    }
    if (budgetCheck) {
        bool withinBudget = true;
        try {
            withinBudget = budgetCheck();
        } catch (const std::exception& e) {
            LOG_WARN("Resource budget check threw: {}", e.what());
        } catch (...) {
            LOG_WARN("Resource budget check threw an unknown exception");
        }
        if (!withinBudget) requestCleanup("resource memory budget");
    }

    return stats;
}

// --- Cleanup ------------------------------------------------------------

bool MemoryMonitor::requestCleanup(const std::string& reason) {
    CleanupApprover approver;
    {
        std::lock_guard<std::mutex> lock(m_hooksMutex);
        approver = m_approver;
    }
    if (approver) {
        bool approved = false;
        try {
            approved = approver(currentLevel());
        } catch (const std::exception& e) {
            LOG_WARN("Cleanup approver threw: {}", e.what());
        } catch (...) {
            LOG_WARN("Cleanup approver threw an unknown exception");
        }
        if (!approved) {
            LOG_DEBUG("Cleanup '{}' declined by approver", reason);
            return false;
        }
    }
    return runCleanup(reason, true).ran;
}

CleanupResult MemoryMonitor::forceCleanup(const std::string& reason) {
    return runCleanup(reason, false);
}

void MemoryMonitor::runEmergencyCleanup() {
    LOG_CRITICAL("Memory pressure EMERGENCY, running up to {} cleanup passes",
                 1 + std::max(0, m_config.emergencyExtraPasses));
    forceCleanup("pressure emergency");

    for (int pass = 1; pass <= m_config.emergencyExtraPasses; ++pass) {
        if (m_config.emergencyPauseMs > 0
            && !pauseFor(std::chrono::milliseconds(m_config.emergencyPauseMs))) {
            break;
        }
        forceCleanup("emergency pass " + std::to_string(pass));
    }

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_history.clear();
}

CleanupResult MemoryMonitor::runCleanup(const std::string& reason, bool respectCooldown) {
    CleanupResult result;
    result.reason = reason;

    bool expected = false;
    if (!m_cleanupInProgress.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("Cleanup '{}' skipped, another cleanup is running", reason);
        return result;
    }
    CleanupFlagReset reset{m_cleanupInProgress};

    if (respectCooldown) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (m_lastCleanup
            && secondsBetween(*m_lastCleanup, m_clock->now()) < m_config.cleanupCooldownSeconds) {
            LOG_DEBUG("Cleanup '{}' skipped, inside the {:.0f}s cooldown",
                      reason, m_config.cleanupCooldownSeconds);
            return result;
        }
    }

    result.ran = true;
    result.before = measureAppUsage();
    LOG_INFO("Memory cleanup started ({})", reason);
    publish(memory_events::kCleanupTriggered, EventData().setString("reason", reason));

    std::vector<NamedReleaser> releasers;
    IdleEvictionHook idleEviction;
    std::function<void()> reclaim;
    {
        std::lock_guard<std::mutex> lock(m_hooksMutex);
        releasers = m_cacheReleasers;
        idleEviction = m_idleEviction;
        reclaim = m_reclaim;
    }

    // 1. Caches
    for (const auto& entry : releasers) {
        try {
            entry.releaser();
            ++result.cachesReleased;
        } catch (const std::exception& e) {
            ++result.stepFailures;
            LOG_WARN("Cache releaser '{}' failed: {}", entry.name, e.what());
        } catch (...) {
            ++result.stepFailures;
            LOG_WARN("Cache releaser '{}' failed with an unknown exception", entry.name);
        }
    }

    // 2. Idle resources
    if (idleEviction) {
        try {
            result.resourcesEvicted = idleEviction();
        } catch (const std::exception& e) {
            ++result.stepFailures;
            LOG_WARN("Idle resource eviction failed: {}", e.what());
        } catch (...) {
            ++result.stepFailures;
            LOG_WARN("Idle resource eviction failed with an unknown exception");
        }
    }

    // 3. Transient files
    SweepResult swept = m_sweeper.sweep();
    result.filesRemoved = swept.filesRemoved;
    result.stepFailures += swept.failures;

    // 4. Heap
    if (reclaim) {
        try {
            reclaim();
        } catch (const std::exception& e) {
            ++result.stepFailures;
            LOG_WARN("Memory reclamation failed: {}", e.what());
        } catch (...) {
            ++result.stepFailures;
            LOG_WARN("Memory reclamation failed with an unknown exception");
        }
    }

    result.after = measureAppUsage();
    result.bytesFreed = result.before > result.after ? result.before - result.after : 0;

    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        ++m_cleanupCount;
        m_lastCleanup = m_clock->now();
    }

    LOG_INFO("Memory cleanup ({}) finished: freed {}, {} evicted, {} file(s), {} failure(s)",
             reason, formatBytes(result.bytesFreed), result.resourcesEvicted,
             result.filesRemoved, result.stepFailures);
    publish(memory_events::kCleanupCompleted, EventData()
        .setString("reason", reason)
        .setInt("bytesFreed", static_cast<int64_t>(result.bytesFreed))
        .setInt("evicted", static_cast<int64_t>(result.resourcesEvicted))
        .setInt("filesRemoved", static_cast<int64_t>(result.filesRemoved))
        .setInt("failures", static_cast<int64_t>(result.stepFailures)));
    return result;
}

uint64_t MemoryMonitor::measureAppUsage() {
    {
        std::lock_guard<std::mutex> lock(m_samplerMutex);
        if (m_sampler) {
            if (auto raw = m_sampler->sample()) return raw->appMemoryUsage;
        }
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_latest ? m_latest->appMemoryUsage : 0;
}

CacheReleaserId MemoryMonitor::addCacheReleaser(const std::string& name, CacheReleaser releaser) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    CacheReleaserId id = m_nextReleaserId++;
    m_cacheReleasers.push_back({id, name, std::move(releaser)});
    return id;
}

bool MemoryMonitor::removeCacheReleaser(CacheReleaserId id) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    for (auto it = m_cacheReleasers.begin(); it != m_cacheReleasers.end(); ++it) {
        if (it->id == id) {
            m_cacheReleasers.erase(it);
            return true;
        }
    }
    return false;
}

void MemoryMonitor::setIdleEvictionHook(IdleEvictionHook hook) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    m_idleEviction = std::move(hook);
}

void MemoryMonitor::setBudgetCheck(BudgetCheck check) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    m_budgetCheck = std::move(check);
}

void MemoryMonitor::setCleanupApprover(CleanupApprover approver) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    m_approver = std::move(approver);
}

void MemoryMonitor::setReclaimHook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(m_hooksMutex);
    m_reclaim = std::move(hook);
}

// --- Leak detection -----------------------------------------------------

void MemoryMonitor::trackAllocation(const std::string& objectId, uint64_t sizeBytes,
                                    const std::string& originInfo) {
    if (!m_config.leakDetectionEnabled) return;
    m_leaks.track(objectId, sizeBytes, originInfo);
}

bool MemoryMonitor::untrackAllocation(const std::string& objectId) {
    return m_leaks.untrack(objectId);
}

size_t MemoryMonitor::sweepLeaks() {
    if (!m_config.leakDetectionEnabled) return 0;

    const TimePoint now = m_clock->now();
    auto leaks = m_leaks.suspectedLeaks();
    for (const auto& leak : leaks) {
        const double age = secondsBetween(leak.allocatedAt, now);
        LOG_WARN("Possible leak: '{}' ({}) tracked for {:.0f}s{}{}",
                 leak.objectId, formatBytes(leak.sizeBytes), age,
                 leak.originInfo.empty() ? "" : " from ", leak.originInfo);
        publish(memory_events::kPossibleLeak, EventData()
            .setString("id", leak.objectId)
            .setInt("size", static_cast<int64_t>(leak.sizeBytes))
            .setDouble("ageSeconds", age)
            .setString("origin", leak.originInfo));
    }
    return leaks.size();
}

// --- Queries ------------------------------------------------------------

PressureLevel MemoryMonitor::currentLevel() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_level;
}

std::optional<MemoryStatistics> MemoryMonitor::latest() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_latest;
}

std::vector<MemoryStatistics> MemoryMonitor::history() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return {m_history.begin(), m_history.end()};
}

uint64_t MemoryMonitor::cleanupCount() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_cleanupCount;
}

std::optional<TimePoint> MemoryMonitor::lastCleanupTime() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastCleanup;
}

MemoryReport MemoryMonitor::report() const {
    MemoryReport report;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        report.current = m_latest;
        report.level = m_level;
        report.cleanupCount = m_cleanupCount;
        report.lastCleanup = m_lastCleanup;
        report.historySize = m_history.size();
    }
    report.trackedAllocations = m_leaks.count();
    report.trackedBytes = m_leaks.totalBytes();
    report.leakDetectionEnabled = m_config.leakDetectionEnabled;
    return report;
}

nlohmann::json MemoryMonitor::exportState() const {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& stats : this->history()) history.push_back(stats.toJson());

    nlohmann::json tracked = nlohmann::json::array();
    for (const auto& entry : m_leaks.tracked()) tracked.push_back(entry.toJson());

    return {
        {"running", isRunning()},
        {"thresholds", m_config.thresholds.toJson()},
        {"report", report().toJson()},
        {"history", history},
        {"trackedAllocations", tracked}
    };
}

void MemoryMonitor::publish(const char* eventName, const EventData& data) {
    if (m_eventBus) m_eventBus->emit(eventName, data);
}

} // namespace tether
