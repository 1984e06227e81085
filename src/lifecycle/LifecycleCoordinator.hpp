#pragma once

#include "core/Clock.hpp"
#include "core/EventBus.hpp"
#include "core/SerialExecutor.hpp"
#include "lifecycle/LifecycleTypes.hpp"
#include "lifecycle/ServiceLifecycle.hpp"
#include "lifecycle/SnapshotStore.hpp"
#include "resource/ResourceTypes.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

class ResourceRegistry;
class MemoryMonitor;

struct LifecycleConfig {
    std::vector<ResourceKind> criticalKinds = {
        ResourceKind::Audio, ResourceKind::Recognition, ResourceKind::System
    };
    double transitionSoftTimeoutSeconds = 30.0;
};

/// Maps lifecycle signals onto ordered registry operations and notifies
/// registered services.
///
/// Every event, whether observed from the OS or triggered by hand, goes
/// through triggerEvent(), which queues it on one serial worker: two
/// transitions never run at the same time.  Within a transition each step
/// is isolated; a failing step is logged and counted and the remaining
/// steps still run.
///
/// The coordinator installs the monitor's idle-eviction hook and its
/// resource budget check.  Eviction and
/// orchestration share one lock; eviction is skipped while another thread
/// is in the middle of a transition.
///
/// The registry and the monitor must outlive the coordinator.
class LifecycleCoordinator {
public:
    LifecycleCoordinator(LifecycleConfig config,
                         ResourceRegistry& registry,
                         MemoryMonitor& monitor,
                         std::shared_ptr<SnapshotStore> store = nullptr,
                         std::shared_ptr<Clock> clock = nullptr,
                         EventBus* eventBus = nullptr);
    ~LifecycleCoordinator();

    LifecycleCoordinator(const LifecycleCoordinator&) = delete;
    LifecycleCoordinator& operator=(const LifecycleCoordinator&) = delete;

    // --- Events ---

    /// Queue an event.  The future resolves once its transition finished.
    std::future<TransitionReport> triggerEvent(LifecycleEvent event);

    /// Record the reason and queue FatalError (-> Error phase).
    std::future<TransitionReport> reportFatalError(const std::string& reason);

    /// Block until every event queued so far has been handled.
    void waitIdle();

    // --- Services ---

    /// Start notifying `service` under `identifier`, replacing any service
    /// already registered under it.  Once launched, the service receives
    /// onLaunched() immediately on the calling thread; registration and a
    /// launch transition never interleave, so it is notified exactly once.
    /// Returns false for a null service, an empty identifier, or while
    /// terminating.
    bool registerService(const std::string& identifier,
                         std::shared_ptr<ServiceLifecycle> service);
    bool unregisterService(const std::string& identifier);
    bool isServiceRegistered(const std::string& identifier) const;
    /// Sorted.
    std::vector<std::string> registeredServiceNames() const;
    size_t serviceCount() const;

    // --- Memory ---

    /// Dispose idle resources under the orchestration lock.  Returns 0
    /// without waiting if another thread is mid-transition.
    size_t evictIdleResources();

    // --- Queries ---

    LifecyclePhase currentPhase() const;
    bool isTransitioning() const { return m_transitioning.load(); }
    bool isCriticalKind(ResourceKind kind) const;

    LifecycleStatistics statistics() const;
    std::optional<RuntimeSnapshot> lastLoadedSnapshot() const;
    std::optional<std::string> fatalErrorReason() const;
    nlohmann::json exportState() const;

    /// Snapshot of the current runtime state (what persistence writes).
    RuntimeSnapshot buildSnapshot() const;

    const LifecycleConfig& config() const { return m_config; }

private:
    using StepFn = std::function<void(std::vector<std::string>& failures)>;

    TransitionReport processEvent(LifecycleEvent event);
    void runStep(TransitionReport& report, const char* name, const StepFn& step);

    // Orchestrations, keyed by phase pair
    void orchestrateLaunch(TransitionReport& report);
    void orchestrateBackground(TransitionReport& report);
    void orchestrateForeground(TransitionReport& report);
    void orchestrateSleep(TransitionReport& report);
    void orchestrateWake(TransitionReport& report);
    void orchestrateTerminate(TransitionReport& report);
    void orchestrateError(TransitionReport& report);
    void orchestrateLowMemory(TransitionReport& report);

    struct ServiceEntry {
        std::string identifier;
        std::shared_ptr<ServiceLifecycle> service;
    };

    std::vector<ServiceEntry> serviceSnapshot() const;
    void notifyServices(LifecycleEvent event, const std::vector<ServiceEntry>& services,
                        TransitionReport& report);
    void unregisterAllServices();

    bool persistSnapshot();
    bool reloadSnapshot();

    void setPhase(LifecyclePhase phase);
    void publish(const char* eventName, const EventData& data);

    LifecycleConfig m_config;
    ResourceRegistry& m_registry;
    MemoryMonitor& m_monitor;
    std::shared_ptr<SnapshotStore> m_store;
    std::shared_ptr<Clock> m_clock;
    EventBus* m_eventBus = nullptr;

    std::recursive_mutex m_orchestrationMutex;
    std::atomic<bool> m_transitioning{false};

    mutable std::mutex m_stateMutex;
    LifecyclePhase m_phase = LifecyclePhase::Launching;
    std::optional<TimePoint> m_lastEventAt;
    uint64_t m_transitionCount = 0;
    uint64_t m_failureCount = 0;
    uint64_t m_ignoredEvents = 0;
    std::optional<RuntimeSnapshot> m_loadedSnapshot;
    std::optional<std::string> m_fatalReason;

    // Lock order: m_servicesMutex before m_stateMutex.
    mutable std::mutex m_servicesMutex;
    std::vector<ServiceEntry> m_services;  // registration order

    SerialExecutor m_executor{"lifecycle"};
};

} // namespace tether
