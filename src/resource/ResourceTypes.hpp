#pragma once

#include "core/Clock.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/// What a managed resource is, coarsely.  Drives the lifecycle policy
/// (critical kinds stay up in the background, the rest are paused).
enum class ResourceKind {
    Audio,
    Recognition,
    File,
    Network,
    Timer,
    Observer,
    Memory,
    UI,
    System
};

/// Per-resource state machine:
///   Uninitialized -> Initializing -> Ready <-> Active -> Disposing -> Disposed
/// Error is reachable from Initializing, Active (hook failure) and Disposing.
enum class ResourceState {
    Uninitialized,
    Initializing,
    Ready,
    Active,
    Disposing,
    Disposed,
    Error
};

const char* resourceKindToString(ResourceKind kind);
std::optional<ResourceKind> parseResourceKind(const std::string& name);
const std::vector<ResourceKind>& allResourceKinds();

const char* resourceStateToString(ResourceState state);
std::optional<ResourceState> parseResourceState(const std::string& name);

/// A hook is running (Initializing or Disposing).
inline bool isInFlight(ResourceState state) {
    return state == ResourceState::Initializing || state == ResourceState::Disposing;
}

/// Ready or Active.
inline bool isUsable(ResourceState state) {
    return state == ResourceState::Ready || state == ResourceState::Active;
}

/// Read-only view of a managed resource.  The registry owns `state` and the
/// timestamps; description, memory estimate and metadata come from the
/// resource's describeSelf().
struct ResourceInfo {
    std::string id;
    ResourceKind kind = ResourceKind::System;
    ResourceState state = ResourceState::Uninitialized;
    std::string description;
    TimePoint createdAt{};
    TimePoint lastAccessedAt{};
    uint64_t estimatedMemoryBytes = 0;
    nlohmann::json metadata = nlohmann::json::object();

    nlohmann::json toJson() const;
};

/// Aggregate registry counts.
struct RegistryStatistics {
    size_t totalCount = 0;
    std::map<ResourceKind, size_t> byKind;
    std::map<ResourceState, size_t> byState;
    uint64_t totalEstimatedMemory = 0;

    size_t countOf(ResourceState state) const;
    size_t countOf(ResourceKind kind) const;
    nlohmann::json toJson() const;
};

/// Result of ResourceRegistry::healthCheck().
struct HealthReport {
    size_t healthyCount = 0;    // Ready or Active
    size_t unhealthyCount = 0;  // Error
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    double score = 1.0;

    /// Score of at least 0.8 and no resource in Error.
    bool isHealthy() const { return score >= 0.8 && errors.empty(); }
    nlohmann::json toJson() const;
};

} // namespace tether
