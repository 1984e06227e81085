#pragma once

namespace tether {

/// Direct lifecycle callbacks for services that want them, independent of
/// resource orchestration.  All callbacks default to no-ops; a callback
/// that throws is logged and does not stop the others.
class ServiceLifecycle {
public:
    virtual ~ServiceLifecycle() = default;

    virtual void onLaunched() {}
    virtual void onWillForeground() {}
    virtual void onDidBackground() {}
    virtual void onWillTerminate() {}
    virtual void onLowMemory() {}
    virtual void onSleep() {}
    virtual void onWake() {}
};

} // namespace tether
