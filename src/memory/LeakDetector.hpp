#pragma once

#include "core/Clock.hpp"
#include "memory/MemoryTypes.hpp"

#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

struct LeakDetectorConfig {
    double thresholdSeconds = 300.0;
    size_t maxTracked = 1000;
};

/// Opt-in table of long-lived allocations.  Entries older than the
/// threshold are reported as suspected leaks; nothing here frees memory.
/// When the table is full the oldest entry is dropped.  Thread-safe.
class LeakDetector {
public:
    explicit LeakDetector(LeakDetectorConfig config = {},
                          std::shared_ptr<Clock> clock = nullptr);

    /// Start tracking `objectId`.  Tracking an id again restarts its age.
    void track(const std::string& objectId, uint64_t sizeBytes,
               const std::string& originInfo = "");

    /// Returns false if the id was not tracked.
    bool untrack(const std::string& objectId);

    bool isTracked(const std::string& objectId) const;
    size_t count() const;
    uint64_t totalBytes() const;

    /// Entries that were dropped to make room, since construction.
    uint64_t evictedCount() const;

    /// Tracked entries older than the threshold, oldest first.
    std::vector<TrackedAllocation> suspectedLeaks() const;

    /// Every tracked entry, oldest first.
    std::vector<TrackedAllocation> tracked() const;

    void clear();

    const LeakDetectorConfig& config() const { return m_config; }

private:
    LeakDetectorConfig m_config;
    std::shared_ptr<Clock> m_clock;

    mutable std::mutex m_mutex;
    std::list<TrackedAllocation> m_entries; // oldest at front
    std::unordered_map<std::string, std::list<TrackedAllocation>::iterator> m_index;
    uint64_t m_totalBytes = 0;
    uint64_t m_evicted = 0;
};

} // namespace tether
