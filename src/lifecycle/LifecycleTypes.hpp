#pragma once

#include "core/Clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/// Coarse application run state.  Terminating is absorbing; Error only
/// leads to Terminating.
enum class LifecyclePhase {
    Launching,
    Active,
    Background,
    Sleeping,
    Terminating,
    Error
};

/// External lifecycle signals, organic (OS) or manually triggered.
enum class LifecycleEvent {
    DidFinishLaunching,
    WillEnterForeground,
    DidEnterBackground,
    WillSleep,
    DidWake,
    WillTerminate,
    LowMemory,
    FatalError
};

const char* lifecyclePhaseToString(LifecyclePhase phase);
std::optional<LifecyclePhase> parseLifecyclePhase(const std::string& name);

const char* lifecycleEventToString(LifecycleEvent event);
std::optional<LifecycleEvent> parseLifecycleEvent(const std::string& name);

/// Phase an event asks for; nullopt for LowMemory (no phase change).
std::optional<LifecyclePhase> targetPhase(LifecycleEvent event);

/// Launching->Active, Active<->Background, Active<->Sleeping, any
/// non-terminal phase -> Error, anything but Terminating -> Terminating.
bool isLegalTransition(LifecyclePhase from, LifecyclePhase to);

/// What one triggerEvent() did.
struct TransitionReport {
    LifecycleEvent event = LifecycleEvent::LowMemory;
    LifecyclePhase from = LifecyclePhase::Launching;
    LifecyclePhase to = LifecyclePhase::Launching;
    bool legal = true;
    bool phaseChanged = false;
    size_t stepsRun = 0;
    std::vector<std::string> stepFailures;
    size_t serviceFailures = 0;
    double durationSeconds = 0.0;

    /// Legal and nothing failed.
    bool ok() const { return legal && stepFailures.empty() && serviceFailures == 0; }
    nlohmann::json toJson() const;
};

struct LifecycleStatistics {
    LifecyclePhase phase = LifecyclePhase::Launching;
    bool transitioning = false;
    std::optional<TimePoint> lastEventAt;
    size_t serviceCount = 0;
    uint64_t transitionCount = 0;
    uint64_t failureCount = 0;
    uint64_t ignoredEvents = 0;

    nlohmann::json toJson() const;
};

/// Event names published on the EventBus by the coordinator.
namespace lifecycle_events {
constexpr const char* kPhaseChanged     = "lifecycle.phase_changed";
constexpr const char* kTransitionFailed = "lifecycle.transition_failed";
} // namespace lifecycle_events

} // namespace tether
