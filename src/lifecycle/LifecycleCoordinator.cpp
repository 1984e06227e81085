#include "lifecycle/LifecycleCoordinator.hpp"
#include "core/Log.hpp"
#include "memory/MemoryMonitor.hpp"
#include "resource/ResourceRegistry.hpp"

#include <algorithm>
#include <chrono>
#include <exception>

namespace tether {

namespace {

std::string joinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ",";
        out += ids[i];
    }
    return out;
}

/// Callbacks for "will" events run before the orchestration, the rest after.
bool notifiesBeforeOrchestration(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::WillEnterForeground:
        case LifecycleEvent::WillSleep:
        case LifecycleEvent::WillTerminate:
        case LifecycleEvent::LowMemory:
            return true;
        default:
            return false;
    }
}

/// Returns false for events without a service callback.
bool deliver(ServiceLifecycle& service, LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::DidFinishLaunching:  service.onLaunched(); return true;
        case LifecycleEvent::WillEnterForeground: service.onWillForeground(); return true;
        case LifecycleEvent::DidEnterBackground:  service.onDidBackground(); return true;
        case LifecycleEvent::WillSleep:           service.onSleep(); return true;
        case LifecycleEvent::DidWake:             service.onWake(); return true;
        case LifecycleEvent::WillTerminate:       service.onWillTerminate(); return true;
        case LifecycleEvent::LowMemory:           service.onLowMemory(); return true;
        case LifecycleEvent::FatalError:          return false;
    }
    return false;
}

/// Clears the transitioning flag when processEvent() returns.
struct TransitioningFlag {
    std::atomic<bool>& flag;
    explicit TransitioningFlag(std::atomic<bool>& f) : flag(f) { flag.store(true); }
    ~TransitioningFlag() { flag.store(false); }
};

} // namespace

LifecycleCoordinator::LifecycleCoordinator(LifecycleConfig config,
                                           ResourceRegistry& registry,
                                           MemoryMonitor& monitor,
                                           std::shared_ptr<SnapshotStore> store,
                                           std::shared_ptr<Clock> clock,
                                           EventBus* eventBus)
    : m_config(std::move(config))
    , m_registry(registry)
    , m_monitor(monitor)
    , m_store(std::move(store))
    , m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>())
    , m_eventBus(eventBus) {
    m_monitor.setIdleEvictionHook([this]() { return evictIdleResources(); });
    m_monitor.setBudgetCheck([this]() { return m_registry.checkMemoryBudget(); });
}

LifecycleCoordinator::~LifecycleCoordinator() {
    m_monitor.setIdleEvictionHook(nullptr);
    m_monitor.setBudgetCheck(nullptr);
    m_executor.stop();
}

// --- Events -------------------------------------------------------------

std::future<TransitionReport> LifecycleCoordinator::triggerEvent(LifecycleEvent event) {
    LOG_DEBUG("Lifecycle event {} queued", lifecycleEventToString(event));
    return m_executor.post([this, event]() { return processEvent(event); });
}

std::future<TransitionReport> LifecycleCoordinator::reportFatalError(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_fatalReason = reason;
    }
    LOG_CRITICAL("Fatal runtime error reported: {}", reason);
    return triggerEvent(LifecycleEvent::FatalError);
}

void LifecycleCoordinator::waitIdle() {
    if (m_executor.isWorkerThread()) return;
    auto done = m_executor.post([]() {});
    if (done.valid()) {
        try {
            done.get();
        } catch (const std::future_error& e) {
            LOG_DEBUG("waitIdle: executor stopped ({})", e.what());
        }
    }
}

TransitionReport LifecycleCoordinator::processEvent(LifecycleEvent event) {
    std::lock_guard<std::recursive_mutex> lock(m_orchestrationMutex);
    TransitioningFlag transitioning(m_transitioning);
    const auto start = std::chrono::steady_clock::now();

    TransitionReport report;
    report.event = event;
    report.from = currentPhase();
    report.to = report.from;
    {
        std::lock_guard<std::mutex> stateLock(m_stateMutex);
        m_lastEventAt = m_clock->now();
    }

    auto target = targetPhase(event);
    if (target) report.to = *target;

    const bool legal = target ? isLegalTransition(report.from, report.to)
                              : report.from != LifecyclePhase::Terminating;
    if (!legal) {
        report.legal = false;
        LOG_WARN("Unexpected lifecycle event {} in phase {}, ignored",
                 lifecycleEventToString(event), lifecyclePhaseToString(report.from));
        std::lock_guard<std::mutex> stateLock(m_stateMutex);
        ++m_ignoredEvents;
        return report;
    }

    if (target) {
        LOG_INFO("Lifecycle {} -> {} ({})", lifecyclePhaseToString(report.from),
                 lifecyclePhaseToString(report.to), lifecycleEventToString(event));
    } else {
        LOG_INFO("Lifecycle event {} in phase {}", lifecycleEventToString(event),
                 lifecyclePhaseToString(report.from));
    }

    const bool notifyFirst = notifiesBeforeOrchestration(event);
    if (notifyFirst) notifyServices(event, serviceSnapshot(), report);

    if (!target) {
        orchestrateLowMemory(report);
    } else if (report.to == LifecyclePhase::Terminating) {
        orchestrateTerminate(report);
    } else if (report.to == LifecyclePhase::Error) {
        orchestrateError(report);
    } else if (report.from == LifecyclePhase::Launching) {
        orchestrateLaunch(report);
    } else if (report.to == LifecyclePhase::Background) {
        orchestrateBackground(report);
    } else if (report.to == LifecyclePhase::Sleeping) {
        orchestrateSleep(report);
    } else if (report.from == LifecyclePhase::Background) {
        orchestrateForeground(report);
    } else if (report.from == LifecyclePhase::Sleeping) {
        orchestrateWake(report);
    }

    // The phase change and the list of services to notify are taken
    // together, so registerService() lands on exactly one side of them.
    std::vector<ServiceEntry> services;
    {
        std::lock_guard<std::mutex> servicesLock(m_servicesMutex);
        if (target) setPhase(report.to);
        if (!notifyFirst) services = m_services;
    }
    if (target) report.phaseChanged = report.from != report.to;

    if (!notifyFirst) notifyServices(event, services, report);

    report.durationSeconds = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();
    if (m_config.transitionSoftTimeoutSeconds > 0.0
        && report.durationSeconds > m_config.transitionSoftTimeoutSeconds) {
        LOG_WARN("Lifecycle event {} was slow: {:.1f}s (soft limit {:.0f}s)",
                 lifecycleEventToString(event), report.durationSeconds,
                 m_config.transitionSoftTimeoutSeconds);
    }

    {
        std::lock_guard<std::mutex> stateLock(m_stateMutex);
        if (report.phaseChanged) ++m_transitionCount;
        m_failureCount += report.stepFailures.size() + report.serviceFailures;
    }

    if (report.phaseChanged) {
        publish(lifecycle_events::kPhaseChanged, EventData()
            .setString("from", lifecyclePhaseToString(report.from))
            .setString("to", lifecyclePhaseToString(report.to))
            .setString("event", lifecycleEventToString(event)));
    }
    if (!report.ok()) {
        LOG_WARN("Lifecycle event {} finished with {} step failure(s), {} service failure(s)",
                 lifecycleEventToString(event), report.stepFailures.size(), report.serviceFailures);
        publish(lifecycle_events::kTransitionFailed, EventData()
            .setString("event", lifecycleEventToString(event))
            .setInt("stepFailures", static_cast<int64_t>(report.stepFailures.size()))
            .setInt("serviceFailures", static_cast<int64_t>(report.serviceFailures)));
    }
    return report;
}

void LifecycleCoordinator::runStep(TransitionReport& report, const char* name, const StepFn& step) {
    ++report.stepsRun;
    std::vector<std::string> failures;
    try {
        step(failures);
    } catch (const std::exception& e) {
        failures.push_back(e.what());
    } catch (...) {
        failures.push_back("unknown exception");
    }
    for (const auto& failure : failures) {
        LOG_ERROR("Lifecycle step '{}': {}", name, failure);
        report.stepFailures.push_back(std::string(name) + ": " + failure);
    }
}

// --- Orchestrations -----------------------------------------------------

void LifecycleCoordinator::orchestrateLaunch(TransitionReport& report) {
    runStep(report, "initialize resources", [this](std::vector<std::string>& failures) {
        for (const auto& id : m_registry.initializationOrder()) {
            auto info = m_registry.get(id);
            if (!info || info->state != ResourceState::Uninitialized) continue;
            Status status = m_registry.initialize(id);
            if (!status) failures.push_back(status.message());
        }
    });

    runStep(report, "validate critical kinds", [this](std::vector<std::string>&) {
        for (auto kind : m_config.criticalKinds) {
            auto infos = m_registry.listByKind(kind);
            bool usable = std::any_of(infos.begin(), infos.end(),
                [](const ResourceInfo& info) { return isUsable(info.state); });
            if (!usable) {
                LOG_WARN("No Ready or Active resource of critical kind {}", resourceKindToString(kind));
            }
        }
    });
}

void LifecycleCoordinator::orchestrateBackground(TransitionReport& report) {
    runStep(report, "deactivate non-critical resources", [this](std::vector<std::string>& failures) {
        for (const auto& info : m_registry.listByState(ResourceState::Active)) {
            if (isCriticalKind(info.kind)) continue;
            Status status = m_registry.deactivate(info.id);
            if (!status) failures.push_back(status.message());
        }
    });

    runStep(report, "soft memory cleanup", [this](std::vector<std::string>&) {
        m_monitor.requestCleanup("entering background");
    });

    runStep(report, "persist snapshot", [this](std::vector<std::string>& failures) {
        if (!persistSnapshot()) failures.push_back("snapshot was not saved");
    });
}

void LifecycleCoordinator::orchestrateForeground(TransitionReport& report) {
    runStep(report, "activate critical resources", [this](std::vector<std::string>& failures) {
        for (const auto& info : m_registry.listByState(ResourceState::Ready)) {
            if (!isCriticalKind(info.kind)) continue;
            Status status = m_registry.activate(info.id);
            if (!status) failures.push_back(status.message());
        }
    });

    runStep(report, "reload snapshot", [this](std::vector<std::string>& failures) {
        if (!reloadSnapshot()) failures.push_back("snapshot could not be reloaded");
    });
}

void LifecycleCoordinator::orchestrateSleep(TransitionReport& report) {
    runStep(report, "pause active resources", [this](std::vector<std::string>& failures) {
        for (const auto& info : m_registry.listByState(ResourceState::Active)) {
            Status status = m_registry.deactivate(info.id);
            if (!status) failures.push_back(status.message());
        }
    });
}

void LifecycleCoordinator::orchestrateWake(TransitionReport& report) {
    runStep(report, "restore critical resources", [this](std::vector<std::string>& failures) {
        for (const auto& id : m_registry.initializationOrder()) {
            auto info = m_registry.get(id);
            if (!info || !isCriticalKind(info->kind)) continue;

            if (info->state == ResourceState::Uninitialized) {
                Status status = m_registry.initialize(id);
                if (!status) {
                    failures.push_back(status.message());
                    continue;
                }
            }
            info = m_registry.get(id);
            if (info && info->state == ResourceState::Ready) {
                Status status = m_registry.activate(id);
                if (!status) failures.push_back(status.message());
            }
        }
    });
}

void LifecycleCoordinator::orchestrateTerminate(TransitionReport& report) {
    runStep(report, "persist final state", [this](std::vector<std::string>& failures) {
        if (!persistSnapshot()) failures.push_back("final snapshot was not saved");
    });

    runStep(report, "dispose all resources", [this](std::vector<std::string>& failures) {
        auto order = m_registry.initializationOrder();
        for (auto it = order.rbegin(); it != order.rend(); ++it) {
            if (!m_registry.contains(*it)) continue;
            Status status = m_registry.dispose(*it);
            if (!status) failures.push_back(status.message());
        }
        if (m_registry.count() > 0) {
            LOG_WARN("{} resource(s) could not be disposed", m_registry.count());
        }
    });

    runStep(report, "stop memory monitor", [this](std::vector<std::string>&) {
        m_monitor.stop();
    });

    runStep(report, "unregister services", [this](std::vector<std::string>&) {
        unregisterAllServices();
    });
}

void LifecycleCoordinator::orchestrateError(TransitionReport& report) {
    runStep(report, "persist snapshot", [this](std::vector<std::string>& failures) {
        if (!persistSnapshot()) failures.push_back("snapshot was not saved");
    });
}

void LifecycleCoordinator::orchestrateLowMemory(TransitionReport& report) {
    runStep(report, "forced memory cleanup", [this](std::vector<std::string>& failures) {
        CleanupResult result = m_monitor.forceCleanup("low memory event");
        if (!result.ran) {
            LOG_DEBUG("Low-memory cleanup skipped, a cleanup is already running");
        } else if (result.stepFailures > 0) {
            failures.push_back(std::to_string(result.stepFailures) + " cleanup step(s) failed");
        }
    });
}

// --- Services -----------------------------------------------------------

bool LifecycleCoordinator::registerService(const std::string& identifier,
                                           std::shared_ptr<ServiceLifecycle> service) {
    if (!service || identifier.empty()) return false;

    LifecyclePhase phase;
    {
        std::lock_guard<std::mutex> lock(m_servicesMutex);
        phase = currentPhase();
        if (phase == LifecyclePhase::Terminating) {
            LOG_WARN("Service '{}' not registered: runtime is terminating", identifier);
            return false;
        }
        auto it = std::find_if(m_services.begin(), m_services.end(),
            [&](const ServiceEntry& entry) { return entry.identifier == identifier; });
        if (it != m_services.end()) {
            LOG_WARN("Service '{}' already registered, replacing it", identifier);
            it->service = service;
        } else {
            m_services.push_back({identifier, service});
        }
    }
    LOG_INFO("Lifecycle service '{}' registered", identifier);

    if (phase != LifecyclePhase::Launching && phase != LifecyclePhase::Error) {
        try {
            service->onLaunched();
        } catch (const std::exception& e) {
            LOG_ERROR("Service '{}' failed in onLaunched: {}", identifier, e.what());
        } catch (...) {
            LOG_ERROR("Service '{}' failed in onLaunched with an unknown exception", identifier);
        }
    }
    return true;
}

bool LifecycleCoordinator::unregisterService(const std::string& identifier) {
    std::lock_guard<std::mutex> lock(m_servicesMutex);
    auto it = std::find_if(m_services.begin(), m_services.end(),
        [&](const ServiceEntry& entry) { return entry.identifier == identifier; });
    if (it == m_services.end()) {
        LOG_WARN("Service '{}' is not registered", identifier);
        return false;
    }
    m_services.erase(it);
    LOG_INFO("Lifecycle service '{}' unregistered", identifier);
    return true;
}

bool LifecycleCoordinator::isServiceRegistered(const std::string& identifier) const {
    std::lock_guard<std::mutex> lock(m_servicesMutex);
    return std::any_of(m_services.begin(), m_services.end(),
        [&](const ServiceEntry& entry) { return entry.identifier == identifier; });
}

std::vector<std::string> LifecycleCoordinator::registeredServiceNames() const {
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lock(m_servicesMutex);
        for (const auto& entry : m_services) names.push_back(entry.identifier);
    }
    std::sort(names.begin(), names.end());
    return names;
}

size_t LifecycleCoordinator::serviceCount() const {
    std::lock_guard<std::mutex> lock(m_servicesMutex);
    return m_services.size();
}

std::vector<LifecycleCoordinator::ServiceEntry> LifecycleCoordinator::serviceSnapshot() const {
    std::lock_guard<std::mutex> lock(m_servicesMutex);
    return m_services;
}

void LifecycleCoordinator::notifyServices(LifecycleEvent event,
                                          const std::vector<ServiceEntry>& services,
                                          TransitionReport& report) {
    for (const auto& entry : services) {
        try {
            if (!deliver(*entry.service, event)) return;
        } catch (const std::exception& e) {
            ++report.serviceFailures;
            LOG_ERROR("Service '{}' failed handling {}: {}", entry.identifier,
                      lifecycleEventToString(event), e.what());
        } catch (...) {
            ++report.serviceFailures;
            LOG_ERROR("Service '{}' failed handling {} with an unknown exception",
                      entry.identifier, lifecycleEventToString(event));
        }
    }
}

void LifecycleCoordinator::unregisterAllServices() {
    std::lock_guard<std::mutex> lock(m_servicesMutex);
    if (!m_services.empty()) {
        LOG_INFO("Unregistering {} lifecycle service(s)", m_services.size());
    }
    m_services.clear();
}

// --- Memory -------------------------------------------------------------

size_t LifecycleCoordinator::evictIdleResources() {
    std::unique_lock<std::recursive_mutex> lock(m_orchestrationMutex, std::try_to_lock);
    if (!lock.owns_lock()) {
        LOG_DEBUG("Idle eviction skipped, a lifecycle transition is running");
        return 0;
    }
    if (currentPhase() == LifecyclePhase::Terminating) return 0;
    return m_registry.disposeIdle();
}

// --- Snapshots ----------------------------------------------------------

RuntimeSnapshot LifecycleCoordinator::buildSnapshot() const {
    RuntimeSnapshot snapshot;
    snapshot.phase = lifecyclePhaseToString(currentPhase());
    snapshot.savedAt = toEpochMillis(m_clock->now());

    auto stats = m_registry.statistics();
    snapshot.resourceCount = static_cast<int64_t>(stats.totalCount);
    snapshot.activeCount = static_cast<int64_t>(stats.countOf(ResourceState::Active));
    snapshot.readyCount = static_cast<int64_t>(stats.countOf(ResourceState::Ready));
    snapshot.errorCount = static_cast<int64_t>(stats.countOf(ResourceState::Error));

    std::vector<std::string> ids;
    std::vector<std::string> activeIds;
    for (const auto& info : m_registry.list()) {
        ids.push_back(info.id);
        if (info.state == ResourceState::Active) activeIds.push_back(info.id);
    }
    snapshot.resourceIds = joinIds(ids);
    snapshot.activeIds = joinIds(activeIds);

    auto memory = m_monitor.report();
    snapshot.cleanupCount = static_cast<int64_t>(memory.cleanupCount);
    snapshot.pressureLevel = pressureLevelToString(memory.level);
    snapshot.appMemoryUsage = memory.current
        ? static_cast<int64_t>(memory.current->appMemoryUsage) : 0;

    std::lock_guard<std::mutex> lock(m_stateMutex);
    snapshot.transitionCount = static_cast<int64_t>(m_transitionCount);
    return snapshot;
}

bool LifecycleCoordinator::persistSnapshot() {
    if (!m_store) return true;
    RuntimeSnapshot snapshot = buildSnapshot();
    if (!m_store->save(snapshot.toJson())) return false;
    LOG_DEBUG("Snapshot persisted ({} resources)", snapshot.resourceCount);
    return true;
}

bool LifecycleCoordinator::reloadSnapshot() {
    if (!m_store) return true;
    auto data = m_store->load();
    if (!data) {
        LOG_DEBUG("No persisted snapshot to reload");
        return true;
    }

    RuntimeSnapshot snapshot = RuntimeSnapshot::fromJson(*data);
    if (snapshot.schemaVersion > RuntimeSnapshot::kSchemaVersion) {
        LOG_WARN("Snapshot schema {} is newer than {}, reading known keys only",
                 snapshot.schemaVersion, RuntimeSnapshot::kSchemaVersion);
    }
    LOG_INFO("Snapshot reloaded (saved in phase {}, {} resources)",
             snapshot.phase, snapshot.resourceCount);

    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_loadedSnapshot = std::move(snapshot);
    return true;
}

// --- Queries ------------------------------------------------------------

LifecyclePhase LifecycleCoordinator::currentPhase() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_phase;
}

bool LifecycleCoordinator::isCriticalKind(ResourceKind kind) const {
    return std::find(m_config.criticalKinds.begin(), m_config.criticalKinds.end(), kind)
        != m_config.criticalKinds.end();
}

LifecycleStatistics LifecycleCoordinator::statistics() const {
    LifecycleStatistics stats;
    stats.transitioning = isTransitioning();
    stats.serviceCount = serviceCount();

    std::lock_guard<std::mutex> lock(m_stateMutex);
    stats.phase = m_phase;
    stats.lastEventAt = m_lastEventAt;
    stats.transitionCount = m_transitionCount;
    stats.failureCount = m_failureCount;
    stats.ignoredEvents = m_ignoredEvents;
    return stats;
}

std::optional<RuntimeSnapshot> LifecycleCoordinator::lastLoadedSnapshot() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_loadedSnapshot;
}

std::optional<std::string> LifecycleCoordinator::fatalErrorReason() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_fatalReason;
}

nlohmann::json LifecycleCoordinator::exportState() const {
    nlohmann::json kinds = nlohmann::json::array();
    for (auto kind : m_config.criticalKinds) kinds.push_back(resourceKindToString(kind));

    nlohmann::json services = nlohmann::json::array();
    for (const auto& name : registeredServiceNames()) services.push_back(name);

    nlohmann::json j = {
        {"statistics", statistics().toJson()},
        {"criticalKinds", kinds},
        {"services", services}
    };
    auto loaded = lastLoadedSnapshot();
    j["lastLoadedSnapshot"] = loaded ? loaded->toJson() : nlohmann::json();
    auto reason = fatalErrorReason();
    j["fatalError"] = reason ? nlohmann::json(*reason) : nlohmann::json();
    return j;
}

void LifecycleCoordinator::setPhase(LifecyclePhase phase) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_phase = phase;
}

void LifecycleCoordinator::publish(const char* eventName, const EventData& data) {
    if (m_eventBus) m_eventBus->emit(eventName, data);
}

} // namespace tether
