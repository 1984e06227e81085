#include "memory/LeakDetector.hpp"
#include "core/Log.hpp"

#include <iterator>

namespace tether {

LeakDetector::LeakDetector(LeakDetectorConfig config, std::shared_ptr<Clock> clock)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (m_config.maxTracked == 0) m_config.maxTracked = 1;
}

void LeakDetector::track(const std::string& objectId, uint64_t sizeBytes,
                         const std::string& originInfo) {
    std::lock_guard<std::mutex> lock(m_mutex);

    auto existing = m_index.find(objectId);
    if (existing != m_index.end()) {
        m_totalBytes -= existing->second->sizeBytes;
        m_entries.erase(existing->second);
        m_index.erase(existing);
    }

    while (m_entries.size() >= m_config.maxTracked) {
        const auto& oldest = m_entries.front();
        LOG_DEBUG("Leak table full, dropping oldest entry '{}'", oldest.objectId);
        m_totalBytes -= oldest.sizeBytes;
        m_index.erase(oldest.objectId);
        m_entries.pop_front();
        ++m_evicted;
    }

    m_entries.push_back({objectId, m_clock->now(), sizeBytes, originInfo});
    m_index[objectId] = std::prev(m_entries.end());
    m_totalBytes += sizeBytes;
}

bool LeakDetector::untrack(const std::string& objectId) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_index.find(objectId);
    if (it == m_index.end()) return false;
    m_totalBytes -= it->second->sizeBytes;
    m_entries.erase(it->second);
    m_index.erase(it);
    return true;
}

bool LeakDetector::isTracked(const std::string& objectId) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index.count(objectId) > 0;
}

size_t LeakDetector::count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_entries.size();
}

uint64_t LeakDetector::totalBytes() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_totalBytes;
}

uint64_t LeakDetector::evictedCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_evicted;
}

std::vector<TrackedAllocation> LeakDetector::suspectedLeaks() const {
    std::vector<TrackedAllocation> out;
    const TimePoint now = m_clock->now();
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& entry : m_entries) {
        if (secondsBetween(entry.allocatedAt, now) > m_config.thresholdSeconds) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<TrackedAllocation> LeakDetector::tracked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_entries.begin(), m_entries.end()};
}

void LeakDetector::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_entries.clear();
    m_index.clear();
    m_totalBytes = 0;
}

} // namespace tether
