#include "resource/ResourceTypes.hpp"

namespace tether {

const char* resourceKindToString(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Audio:       return "Audio";
        case ResourceKind::Recognition: return "Recognition";
        case ResourceKind::File:        return "File";
        case ResourceKind::Network:     return "Network";
        case ResourceKind::Timer:       return "Timer";
        case ResourceKind::Observer:    return "Observer";
        case ResourceKind::Memory:      return "Memory";
        case ResourceKind::UI:          return "UI";
        case ResourceKind::System:      return "System";
    }
    return "Unknown";
}

const std::vector<ResourceKind>& allResourceKinds() {
    static const std::vector<ResourceKind> kinds = {
        ResourceKind::Audio, ResourceKind::Recognition, ResourceKind::File,
        ResourceKind::Network, ResourceKind::Timer, ResourceKind::Observer,
        ResourceKind::Memory, ResourceKind::UI, ResourceKind::System
    };
    return kinds;
}

std::optional<ResourceKind> parseResourceKind(const std::string& name) {
    for (auto kind : allResourceKinds()) {
        if (name == resourceKindToString(kind)) return kind;
    }
    return std::nullopt;
}

const char* resourceStateToString(ResourceState state) {
    switch (state) {
        case ResourceState::Uninitialized: return "Uninitialized";
        case ResourceState::Initializing:  return "Initializing";
        case ResourceState::Ready:         return "Ready";
        case ResourceState::Active:        return "Active";
        case ResourceState::Disposing:     return "Disposing";
        case ResourceState::Disposed:      return "Disposed";
        case ResourceState::Error:         return "Error";
    }
    return "Unknown";
}

std::optional<ResourceState> parseResourceState(const std::string& name) {
    static const ResourceState states[] = {
        ResourceState::Uninitialized, ResourceState::Initializing, ResourceState::Ready,
        ResourceState::Active, ResourceState::Disposing, ResourceState::Disposed,
        ResourceState::Error
    };
    for (auto state : states) {
        if (name == resourceStateToString(state)) return state;
    }
    return std::nullopt;
}

nlohmann::json ResourceInfo::toJson() const {
    return {
        {"id", id},
        {"kind", resourceKindToString(kind)},
        {"state", resourceStateToString(state)},
        {"description", description},
        {"createdAt", toEpochMillis(createdAt)},
        {"lastAccessedAt", toEpochMillis(lastAccessedAt)},
        {"estimatedMemoryBytes", estimatedMemoryBytes},
        {"metadata", metadata}
    };
}

size_t RegistryStatistics::countOf(ResourceState state) const {
    auto it = byState.find(state);
    return it != byState.end() ? it->second : 0;
}

size_t RegistryStatistics::countOf(ResourceKind kind) const {
    auto it = byKind.find(kind);
    return it != byKind.end() ? it->second : 0;
}

nlohmann::json RegistryStatistics::toJson() const {
    nlohmann::json kinds = nlohmann::json::object();
    for (const auto& [kind, n] : byKind) kinds[resourceKindToString(kind)] = n;
    nlohmann::json states = nlohmann::json::object();
    for (const auto& [state, n] : byState) states[resourceStateToString(state)] = n;

    return {
        {"totalCount", totalCount},
        {"byKind", kinds},
        {"byState", states},
        {"totalEstimatedMemory", totalEstimatedMemory}
    };
}

nlohmann::json HealthReport::toJson() const {
    return {
        {"healthy", isHealthy()},
        {"score", score},
        {"healthyCount", healthyCount},
        {"unhealthyCount", unhealthyCount},
        {"warnings", warnings},
        {"errors", errors}
    };
}

} // namespace tether
