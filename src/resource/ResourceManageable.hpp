#pragma once

#include "resource/ResourceTypes.hpp"

#include <string>

namespace tether {

/// Implemented by every long-lived service the registry manages (audio
/// capture, recognizer wrappers, file watchers, timers, ...).
///
/// Hooks report failure by throwing a std::exception; the registry catches
/// it, moves the resource to Error and returns a typed Status.  Hooks are
/// invoked without any registry lock held and may block; a hook that runs
/// past the soft timeout is logged as slow but never cancelled.
class ResourceManageable {
public:
    virtual ~ResourceManageable() = default;

    /// Unique, stable identifier.
    virtual std::string resourceId() const = 0;
    virtual ResourceKind resourceKind() const = 0;

    /// Acquire whatever the resource needs.  Dependencies are Ready first.
    virtual void initialize() = 0;

    virtual void activate() {}
    virtual void deactivate() {}

    /// Release everything.  Dependents are already gone.
    virtual void dispose() = 0;

    /// Description, memory estimate and metadata.  Called at registration
    /// and whenever the registry describes the resource.
    virtual ResourceInfo describeSelf() const {
        ResourceInfo info;
        info.id = resourceId();
        info.kind = resourceKind();
        return info;
    }
};

} // namespace tether
