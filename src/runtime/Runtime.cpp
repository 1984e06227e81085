#include "runtime/Runtime.hpp"
#include "core/Log.hpp"
#include "lifecycle/SignalBridge.hpp"

#include <chrono>
#include <filesystem>
#include <future>
#include <thread>

namespace tether {

Runtime::~Runtime() {
    shutdown();
}

bool Runtime::init(const std::string& configPath) {
    Config config;
    bool loaded = config.loadFromFile(configPath);
    const std::string loadError = config.lastError();

    // "tether.json" -> "tether.local.json", machine-specific overrides
    namespace fs = std::filesystem;
    fs::path base(configPath);
    fs::path localFile = base.parent_path()
        / (base.stem().string() + ".local" + base.extension().string());
    m_localConfigPath = localFile.string();
    bool merged = config.mergeFromFile(m_localConfigPath);

    Settings settings = Settings::fromConfig(config);
    Log::init(settings.logFile, settings.logLevel);

    if (loaded) {
        LOG_INFO("Configuration loaded from '{}'", configPath);
    } else {
        LOG_WARN("Could not load config ({}), using defaults", loadError);
    }
    if (merged) {
        LOG_INFO("Local config merged from '{}'", m_localConfigPath);
    }

    return init(config);
}

bool Runtime::init(const Config& config, std::unique_ptr<MemorySampler> sampler,
                   std::shared_ptr<Clock> clock, bool installSignalHandlers) {
    if (m_initialized) {
        LOG_WARN("Runtime already initialized");
        return false;
    }

    m_shutDown = false;
    m_config = config;
    m_settings = Settings::fromConfig(m_config);
    LOG_INFO("Tether runtime v{} starting...", kRuntimeVersion);

    build(std::move(sampler), std::move(clock));

    if (installSignalHandlers) {
        SignalBridge::install();
        m_signalsInstalled = true;
    }

    m_initialized = true;
    LOG_INFO("Runtime initialized ({} critical kind(s), snapshots {})",
             m_settings.lifecycle.criticalKinds.size(),
             m_settings.snapshotPath.empty() ? "in memory" : m_settings.snapshotPath);
    return true;
}

void Runtime::build(std::unique_ptr<MemorySampler> sampler, std::shared_ptr<Clock> clock) {
    m_clock = clock ? std::move(clock) : std::make_shared<SystemClock>();
    if (!sampler) sampler = std::make_unique<ProcMemorySampler>();

    if (m_settings.snapshotPath.empty()) {
        m_store = std::make_shared<InMemorySnapshotStore>();
    } else {
        m_store = std::make_shared<JsonFileSnapshotStore>(m_settings.snapshotPath);
    }

    m_registry = std::make_unique<ResourceRegistry>(m_settings.registry, m_clock);
    m_monitor = std::make_unique<MemoryMonitor>(m_settings.memory, std::move(sampler),
                                                m_clock, &m_eventBus);
    m_coordinator = std::make_unique<LifecycleCoordinator>(
        m_settings.lifecycle, *m_registry, *m_monitor, m_store, m_clock, &m_eventBus);

    m_registry->setStateObserver([this](const std::string& id, ResourceState from, ResourceState to) {
        m_eventBus.emit("resource.state_changed", EventData()
            .setString("id", id)
            .setString("from", resourceStateToString(from))
            .setString("to", resourceStateToString(to)));
    });
}

void Runtime::run() {
    if (!m_initialized) {
        LOG_ERROR("Runtime::run() called before init()");
        return;
    }

    LOG_INFO("Entering main loop");
    m_running = true;
    m_monitor->start();
    m_coordinator->triggerEvent(LifecycleEvent::DidFinishLaunching).wait();

    m_lastTick = m_clock->now();
    const auto interval = std::chrono::milliseconds(m_settings.loopIntervalMs);

    while (m_running) {
        dispatchSignals();
        checkForSuspend();

        if (m_coordinator->currentPhase() == LifecyclePhase::Terminating) {
            break;
        }
        std::this_thread::sleep_for(interval);
    }

    m_running = false;
    LOG_INFO("Main loop exited");
}

void Runtime::requestShutdown() {
    if (!m_initialized) return;
    m_coordinator->triggerEvent(LifecycleEvent::WillTerminate);
}

void Runtime::shutdown() {
    if (!m_initialized || m_shutDown) return;
    m_shutDown = true;
    LOG_INFO("Shutting down...");

    if (m_coordinator->currentPhase() != LifecyclePhase::Terminating) {
        auto report = m_coordinator->triggerEvent(LifecycleEvent::WillTerminate).get();
        if (!report.ok()) {
            LOG_WARN("Termination finished with {} failure(s)",
                     report.stepFailures.size() + report.serviceFailures);
        }
    }
    m_coordinator->waitIdle();
    m_monitor->stop();

    if (m_signalsInstalled) {
        SignalBridge::uninstall();
        m_signalsInstalled = false;
    }

    // Coordinator first: it holds references to the registry and monitor.
    m_coordinator.reset();
    m_monitor.reset();
    m_registry.reset();
    m_initialized = false;

    LOG_INFO("Shutdown complete");
}

nlohmann::json Runtime::exportState() const {
    if (!m_initialized) return nlohmann::json::object();
    return {
        {"version", kRuntimeVersion},
        {"registry", m_registry->exportState()},
        {"memory", m_monitor->exportState()},
        {"lifecycle", m_coordinator->exportState()}
    };
}

void Runtime::dispatchSignals() {
    for (auto event : SignalBridge::poll()) {
        LOG_INFO("Signal received, triggering {}", lifecycleEventToString(event));
        m_coordinator->triggerEvent(event).wait();
    }
}

void Runtime::checkForSuspend() {
    // A long gap between two loop iterations means the process was frozen
    // (system sleep).  Refresh memory statistics right away and tell
    // subscribers how long we were gone.
    const TimePoint now = m_clock->now();
    const double gap = secondsBetween(m_lastTick, now);
    m_lastTick = now;

    if (m_settings.suspendGapSeconds > 0.0 && gap > m_settings.suspendGapSeconds) {
        LOG_INFO("Resumed after a {:.0f}s suspend", gap);
        m_monitor->sampleNow();
        m_eventBus.emit("runtime.resumed", EventData().setDouble("gapSeconds", gap));
    }
}

} // namespace tether
