#include "lifecycle/LifecycleTypes.hpp"

namespace tether {

const char* lifecyclePhaseToString(LifecyclePhase phase) {
    switch (phase) {
        case LifecyclePhase::Launching:   return "Launching";
        case LifecyclePhase::Active:      return "Active";
        case LifecyclePhase::Background:  return "Background";
        case LifecyclePhase::Sleeping:    return "Sleeping";
        case LifecyclePhase::Terminating: return "Terminating";
        case LifecyclePhase::Error:       return "Error";
    }
    return "Unknown";
}

std::optional<LifecyclePhase> parseLifecyclePhase(const std::string& name) {
    static const LifecyclePhase phases[] = {
        LifecyclePhase::Launching, LifecyclePhase::Active, LifecyclePhase::Background,
        LifecyclePhase::Sleeping, LifecyclePhase::Terminating, LifecyclePhase::Error
    };
    for (auto phase : phases) {
        if (name == lifecyclePhaseToString(phase)) return phase;
    }
    return std::nullopt;
}

const char* lifecycleEventToString(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::DidFinishLaunching:  return "DidFinishLaunching";
        case LifecycleEvent::WillEnterForeground: return "WillEnterForeground";
        case LifecycleEvent::DidEnterBackground:  return "DidEnterBackground";
        case LifecycleEvent::WillSleep:           return "WillSleep";
        case LifecycleEvent::DidWake:             return "DidWake";
        case LifecycleEvent::WillTerminate:       return "WillTerminate";
        case LifecycleEvent::LowMemory:           return "LowMemory";
        case LifecycleEvent::FatalError:          return "FatalError";
    }
    return "Unknown";
}

std::optional<LifecycleEvent> parseLifecycleEvent(const std::string& name) {
    static const LifecycleEvent events[] = {
        LifecycleEvent::DidFinishLaunching, LifecycleEvent::WillEnterForeground,
        LifecycleEvent::DidEnterBackground, LifecycleEvent::WillSleep,
        LifecycleEvent::DidWake, LifecycleEvent::WillTerminate,
        LifecycleEvent::LowMemory, LifecycleEvent::FatalError
    };
    for (auto event : events) {
        if (name == lifecycleEventToString(event)) return event;
    }
    return std::nullopt;
}

std::optional<LifecyclePhase> targetPhase(LifecycleEvent event) {
    switch (event) {
        case LifecycleEvent::DidFinishLaunching:  return LifecyclePhase::Active;
        case LifecycleEvent::WillEnterForeground: return LifecyclePhase::Active;
        case LifecycleEvent::DidEnterBackground:  return LifecyclePhase::Background;
        case LifecycleEvent::WillSleep:           return LifecyclePhase::Sleeping;
        case LifecycleEvent::DidWake:             return LifecyclePhase::Active;
        case LifecycleEvent::WillTerminate:       return LifecyclePhase::Terminating;
        case LifecycleEvent::FatalError:          return LifecyclePhase::Error;
        case LifecycleEvent::LowMemory:           return std::nullopt;
    }
    return std::nullopt;
}

bool isLegalTransition(LifecyclePhase from, LifecyclePhase to) {
    if (from == LifecyclePhase::Terminating) return false;
    if (to == LifecyclePhase::Terminating) return true;
    if (from == LifecyclePhase::Error) return false;
    if (to == LifecyclePhase::Error) return true;

    switch (from) {
        case LifecyclePhase::Launching:
            return to == LifecyclePhase::Active;
        case LifecyclePhase::Active:
            return to == LifecyclePhase::Background || to == LifecyclePhase::Sleeping;
        case LifecyclePhase::Background:
        case LifecyclePhase::Sleeping:
            return to == LifecyclePhase::Active;
        default:
            return false;
    }
}

nlohmann::json TransitionReport::toJson() const {
    return {
        {"event", lifecycleEventToString(event)},
        {"from", lifecyclePhaseToString(from)},
        {"to", lifecyclePhaseToString(to)},
        {"legal", legal},
        {"phaseChanged", phaseChanged},
        {"stepsRun", stepsRun},
        {"stepFailures", stepFailures},
        {"serviceFailures", serviceFailures},
        {"durationSeconds", durationSeconds}
    };
}

nlohmann::json LifecycleStatistics::toJson() const {
    nlohmann::json j = {
        {"phase", lifecyclePhaseToString(phase)},
        {"transitioning", transitioning},
        {"serviceCount", serviceCount},
        {"transitionCount", transitionCount},
        {"failureCount", failureCount},
        {"ignoredEvents", ignoredEvents}
    };
    j["lastEventAt"] = lastEventAt ? nlohmann::json(toEpochMillis(*lastEventAt)) : nlohmann::json();
    return j;
}

} // namespace tether
