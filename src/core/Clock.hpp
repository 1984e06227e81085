#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

namespace tether {

using TimePoint = std::chrono::system_clock::time_point;
using Seconds   = std::chrono::duration<double>;

/// Source of wall-clock time for cooldowns, idle windows and leak ages.
/// Injected into the registry and the monitor so tests can move time
/// forward without sleeping.
class Clock {
public:
    virtual ~Clock() = default;
    virtual TimePoint now() const = 0;
};

/// The real system clock.
class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/// A clock that only moves when told to.  Thread-safe: the monitor's
/// background threads may read it while a test advances it.
class ManualClock : public Clock {
public:
    ManualClock() : m_now(std::chrono::system_clock::now()) {}
    explicit ManualClock(TimePoint start) : m_now(start) {}

    TimePoint now() const override {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_now;
    }

    void advance(Seconds delta) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now += std::chrono::duration_cast<TimePoint::duration>(delta);
    }

    void set(TimePoint t) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_now = t;
    }

private:
    mutable std::mutex m_mutex;
    TimePoint m_now;
};

/// Milliseconds since the Unix epoch (snapshot and JSON export format).
inline int64_t toEpochMillis(TimePoint t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline TimePoint fromEpochMillis(int64_t ms) {
    return TimePoint(std::chrono::duration_cast<TimePoint::duration>(std::chrono::milliseconds(ms)));
}

/// Elapsed seconds from `earlier` to `later` (negative if clocks moved back).
inline double secondsBetween(TimePoint earlier, TimePoint later) {
    return std::chrono::duration_cast<Seconds>(later - earlier).count();
}

} // namespace tether
