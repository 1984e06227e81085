#pragma once

#include "core/Clock.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "lifecycle/LifecycleCoordinator.hpp"
#include "lifecycle/SnapshotStore.hpp"
#include "memory/MemoryMonitor.hpp"
#include "memory/MemorySampler.hpp"
#include "resource/ResourceRegistry.hpp"
#include "runtime/Settings.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <memory>
#include <string>

namespace tether {

constexpr const char* kRuntimeVersion = "1.0.0";

/// Composition root: reads the configuration, owns and wires the registry,
/// the memory monitor and the lifecycle coordinator, and runs the main
/// loop that feeds OS signals into the coordinator.
class Runtime {
public:
    Runtime() = default;
    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /// Load `configPath` plus its `.local` overlay, start logging and build
    /// the components.  A missing config file is not fatal: defaults apply.
    bool init(const std::string& configPath);

    /// Build the components from an already loaded config.  `sampler` and
    /// `clock` default to the /proc sampler and the system clock.
    bool init(const Config& config,
              std::unique_ptr<MemorySampler> sampler = nullptr,
              std::shared_ptr<Clock> clock = nullptr,
              bool installSignalHandlers = true);

    /// Launch (DidFinishLaunching), start the monitor, then loop until the
    /// coordinator reaches Terminating.
    void run();

    /// Queue WillTerminate; run() returns once it has been handled.
    void requestShutdown();

    /// Terminate if that has not happened yet, stop the monitor and
    /// restore signal handlers.  Idempotent.
    void shutdown();

    bool isInitialized() const { return m_initialized; }

    ResourceRegistry& registry() { return *m_registry; }
    MemoryMonitor& monitor() { return *m_monitor; }
    LifecycleCoordinator& coordinator() { return *m_coordinator; }
    EventBus& eventBus() { return m_eventBus; }
    const Settings& settings() const { return m_settings; }
    const Config& config() const { return m_config; }

    /// Registry, memory and lifecycle state in one document.
    nlohmann::json exportState() const;

private:
    void build(std::unique_ptr<MemorySampler> sampler, std::shared_ptr<Clock> clock);
    void dispatchSignals();
    void checkForSuspend();

    Config m_config;
    Settings m_settings;
    std::string m_localConfigPath;

    EventBus m_eventBus;
    std::shared_ptr<Clock> m_clock;
    std::shared_ptr<SnapshotStore> m_store;
    std::unique_ptr<ResourceRegistry> m_registry;
    std::unique_ptr<MemoryMonitor> m_monitor;
    std::unique_ptr<LifecycleCoordinator> m_coordinator;

    bool m_initialized = false;
    bool m_signalsInstalled = false;
    bool m_shutDown = false;
    std::atomic<bool> m_running{false};
    TimePoint m_lastTick{};
};

} // namespace tether
