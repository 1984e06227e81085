#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

/// Event payload: typed key-value pairs.
class EventData {
public:
    EventData() = default;

    EventData& setString(const std::string& key, const std::string& value) { m_strings[key] = value; return *this; }
    EventData& setInt(const std::string& key, int64_t value) { m_ints[key] = value; return *this; }
    EventData& setDouble(const std::string& key, double value) { m_doubles[key] = value; return *this; }
    EventData& setBool(const std::string& key, bool value) { m_bools[key] = value; return *this; }

    std::string getString(const std::string& key, const std::string& def = "") const {
        auto it = m_strings.find(key);
        return it != m_strings.end() ? it->second : def;
    }
    int64_t getInt(const std::string& key, int64_t def = 0) const {
        auto it = m_ints.find(key);
        return it != m_ints.end() ? it->second : def;
    }
    double getDouble(const std::string& key, double def = 0.0) const {
        auto it = m_doubles.find(key);
        return it != m_doubles.end() ? it->second : def;
    }
    bool getBool(const std::string& key, bool def = false) const {
        auto it = m_bools.find(key);
        return it != m_bools.end() ? it->second : def;
    }

    bool hasString(const std::string& key) const { return m_strings.count(key) > 0; }
    bool hasInt(const std::string& key) const { return m_ints.count(key) > 0; }
    bool hasDouble(const std::string& key) const { return m_doubles.count(key) > 0; }
    bool hasBool(const std::string& key) const { return m_bools.count(key) > 0; }

    /// Flatten into a JSON object (diagnostic dumps).
    nlohmann::json toJson() const;

private:
    std::unordered_map<std::string, std::string> m_strings;
    std::unordered_map<std::string, int64_t> m_ints;
    std::unordered_map<std::string, double> m_doubles;
    std::unordered_map<std::string, bool> m_bools;
};

/// Handler ID for unsubscribing
using EventHandlerId = uint64_t;

using EventHandler = std::function<void(const EventData&)>;

/// In-process notification bus.  Producers (memory monitor, lifecycle
/// coordinator) publish named events; diagnostics and consuming services
/// subscribe.  Safe to use from the monitor's background threads: handlers
/// are invoked outside the bus lock, on the emitting thread.
class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    /// Subscribe to an event. Lower priority = called first.
    /// Returns a handler ID for later unsubscription.
    EventHandlerId on(const std::string& eventName, EventHandler handler, int priority = 0);

    /// Unsubscribe a handler by ID
    bool off(EventHandlerId id);

    /// Unsubscribe all handlers for an event
    void offAll(const std::string& eventName);

    /// Emit an event, calling all handlers in priority order.  A handler
    /// that throws is logged and skipped; the remaining handlers still run.
    /// Returns the number of handlers that completed.
    size_t emit(const std::string& eventName, const EventData& data = {});

    /// Get the number of handlers for an event
    size_t handlerCount(const std::string& eventName) const;

    /// Clear all handlers
    void clear();

private:
    struct HandlerEntry {
        EventHandlerId id;
        int priority;
        EventHandler callback;
    };

    mutable std::mutex m_mutex;
    std::unordered_map<std::string, std::vector<HandlerEntry>> m_handlers;
    EventHandlerId m_nextId = 1;
};

} // namespace tether
