#pragma once

#include "core/Clock.hpp"
#include "core/Status.hpp"
#include "resource/DependencyGraph.hpp"
#include "resource/ResourceManageable.hpp"
#include "resource/ResourceTypes.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <future>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

struct RegistryConfig {
    int maxDisposalPasses = 100;          // work-list pops per dispose() call
    double hookSoftTimeoutSeconds = 30.0; // <= 0 disables slow-hook logging
    double idleEvictionSeconds = 300.0;
    size_t maxEvictionsPerPass = 50;
    uint64_t maxEstimatedMemoryBytes = 200ull * 1024 * 1024;  // 0 disables the budget
};

/// Called after every state change, outside the registry lock.
using StateChangeCallback =
    std::function<void(const std::string& id, ResourceState from, ResourceState to)>;

/// Owns every managed resource, their dependency graph and their state
/// machines.
///
/// One reader/writer lock guards the resource map, the graph and the
/// per-resource state fields.  Queries take it shared; mutations take it
/// exclusive; hooks run with it released.  Overlapping lifecycle calls
/// (initialize/activate/deactivate/dispose) for the *same* id from several
/// threads are not serialized beyond that lock: callers must not issue them.
///
/// A resource whose hook is running is never picked for idle eviction,
/// disposal or unregistration, and a second hook on it is refused.
///
/// Every operation returns a Status; nothing throws, whatever a hook throws.
class ResourceRegistry {
public:
    explicit ResourceRegistry(RegistryConfig config = {},
                              std::shared_ptr<Clock> clock = nullptr);
    ~ResourceRegistry();

    ResourceRegistry(const ResourceRegistry&) = delete;
    ResourceRegistry& operator=(const ResourceRegistry&) = delete;

    // --- Registration ---

    /// Take ownership of `resource`, which depends on `dependencies`.
    /// Fails AlreadyRegistered, DependencyNotMet (listing the missing ids)
    /// or CircularDependency; the graph is untouched on failure.
    Status registerResource(std::unique_ptr<ResourceManageable> resource,
                            const std::vector<std::string>& dependencies = {});

    /// Drop a resource without running any hook.  Refused while other
    /// resources depend on it or while a hook is in flight.
    Status unregisterResource(const std::string& id);

    Status addDependency(const std::string& id, const std::string& dependencyId);
    Status removeDependency(const std::string& id, const std::string& dependencyId);

    // --- Lifecycle ---

    /// Uninitialized -> Ready, initializing missing dependencies first.
    Status initialize(const std::string& id);

    /// Ready -> Active.  Dependencies need only be initialized.
    Status activate(const std::string& id);

    /// Active -> Ready.
    Status deactivate(const std::string& id);

    /// Dispose `id` and, before it, everything that depends on it.
    /// Iterative and bounded by RegistryConfig::maxDisposalPasses.
    Status dispose(const std::string& id);

    /// initialize()/dispose() on their own thread.  The registry must
    /// outlive the returned futures.
    std::future<Status> initializeAsync(const std::string& id);
    std::future<Status> disposeAsync(const std::string& id);

    /// Refresh lastAccessedAt without a state change.
    Status touch(const std::string& id);

    // --- Queries (safe concurrently with any mutation) ---

    std::optional<ResourceInfo> get(const std::string& id) const;
    std::vector<ResourceInfo> list() const;
    std::vector<ResourceInfo> listByKind(ResourceKind kind) const;
    std::vector<ResourceInfo> listByState(ResourceState state) const;

    /// One-line human-readable summary, refreshed from describeSelf().
    std::optional<std::string> describe(const std::string& id) const;

    bool contains(const std::string& id) const;
    size_t count() const;
    std::vector<std::string> dependenciesOf(const std::string& id) const;
    std::vector<std::string> dependentsOf(const std::string& id) const;

    /// Registered ids, dependencies before dependents.
    std::vector<std::string> initializationOrder() const;

    RegistryStatistics statistics() const;
    HealthReport healthCheck() const;

    /// False (and a warning) when the summed estimatedMemoryBytes exceeds
    /// maxEstimatedMemoryBytes.
    bool checkMemoryBudget() const;
    nlohmann::json exportState() const;

    // --- Idle eviction ---

    /// Resources that are not Active, have no hook running, have no dependents
    /// and were last accessed at least `windowSeconds` ago.  Oldest first,
    /// at most `limit`.
    std::vector<std::string> idleCandidates(double windowSeconds, size_t limit) const;
    std::vector<std::string> idleCandidates() const;

    /// Dispose idleCandidates(). Returns how many were disposed.
    size_t disposeIdle(double windowSeconds, size_t limit);
    size_t disposeIdle();

    void setStateObserver(StateChangeCallback callback);

    const RegistryConfig& config() const { return m_config; }
    const Clock& clock() const { return *m_clock; }

private:
    struct Entry {
        std::shared_ptr<ResourceManageable> resource;
        ResourceInfo info;
        /// Set by beginTransition(), cleared by setState().  Covers
        /// activate/deactivate, whose state does not move until the hook ends.
        bool hookRunning = false;
    };

    /// A hook is running or the state is a transient one.
    static bool isBusy(const Entry& entry);

    /// `path` is the chain of ids currently being initialized above `id`.
    Status initializeInternal(const std::string& id, std::vector<std::string> path);
    Status disposeOne(const std::string& id);

    /// Move `id` to `to` if it is currently in one of `allowed` (`to` may
    /// equal the current state) and no other hook is running on it.  On
    /// success marks the entry busy and hands out the resource and the
    /// previous state.
    Status beginTransition(const std::string& id, const char* operation,
                           std::initializer_list<ResourceState> allowed,
                           ResourceState to,
                           std::shared_ptr<ResourceManageable>& resourceOut,
                           ResourceState& fromOut);

    /// Unconditional state write (if still registered) plus notification.
    void setState(const std::string& id, ResourceState to, bool touch);

    /// Run a hook, logging it as slow each time the soft timeout elapses.
    /// Rethrows whatever the hook threw.
    void runHook(const std::string& id, const char* hookName,
                 const std::function<void()>& hook) const;

    void notifyStateChange(const std::string& id, ResourceState from, ResourceState to) const;

    /// Fold describeSelf() into `info` (description, memory estimate,
    /// metadata).  Call without the lock held.
    static void refreshFromResource(const ResourceManageable& resource, ResourceInfo& info);

    RegistryConfig m_config;
    std::shared_ptr<Clock> m_clock;

    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, Entry> m_entries;
    DependencyGraph m_graph;

    mutable std::mutex m_observerMutex;
    StateChangeCallback m_stateObserver;
};

} // namespace tether
