#pragma once

#include "memory/MemorySampler.hpp"
#include "resource/ResourceManageable.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace tether::test {

/// Ordered log of "<hook>:<id>" entries shared by several fake resources.
class HookRecorder {
public:
    void record(const std::string& entry) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.push_back(entry);
    }

    std::vector<std::string> entries() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_entries;
    }

    /// Position of `entry`, or -1 if it was never recorded.
    int indexOf(const std::string& entry) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_entries.size(); ++i) {
            if (m_entries[i] == entry) return static_cast<int>(i);
        }
        return -1;
    }

    size_t count(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        size_t n = 0;
        for (const auto& e : m_entries) {
            if (e.compare(0, prefix.size(), prefix) == 0) ++n;
        }
        return n;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_entries.clear();
    }

private:
    mutable std::mutex m_mutex;
    std::vector<std::string> m_entries;
};

/// Which hooks of a FakeResource throw.  Shared so a test can flip a
/// failure after handing the resource to the registry.
struct FailurePlan {
    std::atomic<bool> initialize{false};
    std::atomic<bool> activate{false};
    std::atomic<bool> deactivate{false};
    std::atomic<bool> dispose{false};
};

class FakeResource : public ResourceManageable {
public:
    FakeResource(std::string id, ResourceKind kind,
                 std::shared_ptr<HookRecorder> recorder = nullptr,
                 std::shared_ptr<FailurePlan> failures = nullptr,
                 uint64_t memoryBytes = 0)
        : m_id(std::move(id))
        , m_kind(kind)
        , m_recorder(recorder ? std::move(recorder) : std::make_shared<HookRecorder>())
        , m_failures(failures ? std::move(failures) : std::make_shared<FailurePlan>())
        , m_memoryBytes(memoryBytes) {}

    std::string resourceId() const override { return m_id; }
    ResourceKind resourceKind() const override { return m_kind; }

    void initialize() override { hook("initialize", m_failures->initialize); }
    void activate() override { hook("activate", m_failures->activate); }
    void deactivate() override { hook("deactivate", m_failures->deactivate); }
    void dispose() override { hook("dispose", m_failures->dispose); }

    ResourceInfo describeSelf() const override {
        ResourceInfo info;
        info.id = m_id;
        info.kind = m_kind;
        info.description = "fake " + m_id;
        info.estimatedMemoryBytes = m_memoryBytes;
        return info;
    }

private:
    void hook(const char* name, const std::atomic<bool>& fail) {
        m_recorder->record(std::string(name) + ":" + m_id);
        if (fail) {
            throw std::runtime_error(std::string(name) + " failed for " + m_id);
        }
    }

    std::string m_id;
    ResourceKind m_kind;
    std::shared_ptr<HookRecorder> m_recorder;
    std::shared_ptr<FailurePlan> m_failures;
    uint64_t m_memoryBytes;
};

inline std::unique_ptr<FakeResource> makeFake(const std::string& id,
                                              ResourceKind kind,
                                              std::shared_ptr<HookRecorder> recorder = nullptr,
                                              std::shared_ptr<FailurePlan> failures = nullptr) {
    return std::make_unique<FakeResource>(id, kind, std::move(recorder), std::move(failures));
}

/// Sampler whose reading the test sets directly.  Shared state so the test
/// keeps control after the monitor takes ownership of the sampler.
class AdjustableSampler : public MemorySampler {
public:
    struct State {
        std::mutex mutex;
        RawMemorySample sample{1000, 500, 500, 100};
        bool fail = false;
        size_t reads = 0;
    };

    explicit AdjustableSampler(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    std::optional<RawMemorySample> sample() override {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        ++m_state->reads;
        if (m_state->fail) return std::nullopt;
        return m_state->sample;
    }

    static void setRatio(State& state, double ratio, uint64_t appBytes = 100) {
        std::lock_guard<std::mutex> lock(state.mutex);
        state.sample = rawAtRatio(ratio, appBytes);
    }

    /// A 1000-byte machine with `ratio` of it in use.
    static RawMemorySample rawAtRatio(double ratio, uint64_t appBytes = 100) {
        RawMemorySample raw;
        raw.totalMemory = 1000;
        raw.usedMemory = static_cast<uint64_t>(ratio * 1000.0 + 0.5);
        raw.freeMemory = raw.totalMemory - raw.usedMemory;
        raw.appMemoryUsage = appBytes;
        return raw;
    }

private:
    std::shared_ptr<State> m_state;
};

} // namespace tether::test
