#include "lifecycle/SignalBridge.hpp"
#include "core/Log.hpp"

#include <csignal>

namespace tether {

std::atomic<bool> SignalBridge::s_terminate{false};
std::atomic<bool> SignalBridge::s_lowMemory{false};
std::atomic<bool> SignalBridge::s_installed{false};

void SignalBridge::signalHandler(int signum) {
    // Signal-safe: only set atomic flags. Logging and orchestration
    // happen in the main loop when it polls.
    if (signum == SIGUSR1) {
        s_lowMemory.store(true, std::memory_order_relaxed);
    } else {
        s_terminate.store(true, std::memory_order_relaxed);
    }
}

void SignalBridge::install() {
    if (s_installed.exchange(true)) return;
    std::signal(SIGTERM, SignalBridge::signalHandler);
    std::signal(SIGINT, SignalBridge::signalHandler);
    std::signal(SIGUSR1, SignalBridge::signalHandler);
    LOG_INFO("Signal handlers installed (SIGTERM, SIGINT, SIGUSR1)");
}

void SignalBridge::uninstall() {
    if (!s_installed.exchange(false)) return;
    std::signal(SIGTERM, SIG_DFL);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGUSR1, SIG_DFL);
}

bool SignalBridge::isInstalled() {
    return s_installed.load();
}

std::vector<LifecycleEvent> SignalBridge::poll() {
    std::vector<LifecycleEvent> events;
    if (s_terminate.exchange(false, std::memory_order_relaxed)) {
        events.push_back(LifecycleEvent::WillTerminate);
    }
    if (s_lowMemory.exchange(false, std::memory_order_relaxed)) {
        events.push_back(LifecycleEvent::LowMemory);
    }
    return events;
}

bool SignalBridge::terminationRequested() {
    return s_terminate.load(std::memory_order_relaxed);
}

} // namespace tether
