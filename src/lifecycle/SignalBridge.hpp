#pragma once

#include "lifecycle/LifecycleTypes.hpp"

#include <atomic>
#include <vector>

namespace tether {

/// Turns POSIX signals into lifecycle events: SIGTERM and SIGINT ask for
/// WillTerminate, SIGUSR1 for LowMemory.  The handler only sets flags;
/// the main loop calls poll() and feeds the events to the coordinator.
class SignalBridge {
public:
    /// Install the handlers. Idempotent.
    static void install();

    /// Restore the default handlers.
    static void uninstall();

    static bool isInstalled();

    /// Events raised since the last poll, at most one of each, terminate
    /// first.  Clears the pending flags.
    static std::vector<LifecycleEvent> poll();

    /// True if a termination signal is pending (does not clear it).
    static bool terminationRequested();

private:
    static void signalHandler(int signum);

    static std::atomic<bool> s_terminate;
    static std::atomic<bool> s_lowMemory;
    static std::atomic<bool> s_installed;
};

} // namespace tether
