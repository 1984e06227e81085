#include "core/EventBus.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <exception>

namespace tether {

nlohmann::json EventData::toJson() const {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& [key, value] : m_strings) out[key] = value;
    for (const auto& [key, value] : m_ints)    out[key] = value;
    for (const auto& [key, value] : m_doubles) out[key] = value;
    for (const auto& [key, value] : m_bools)   out[key] = value;
    return out;
}

EventHandlerId EventBus::on(const std::string& eventName, EventHandler handler, int priority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    EventHandlerId id = m_nextId++;
    auto& handlers = m_handlers[eventName];
    handlers.push_back({id, priority, std::move(handler)});
    std::stable_sort(handlers.begin(), handlers.end(),
        [](const HandlerEntry& a, const HandlerEntry& b) {
            return a.priority < b.priority;
        });
    return id;
}

bool EventBus::off(EventHandlerId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& [name, handlers] : m_handlers) {
        auto it = std::find_if(handlers.begin(), handlers.end(),
            [id](const HandlerEntry& entry) { return entry.id == id; });
        if (it != handlers.end()) {
            handlers.erase(it);
            return true;
        }
    }
    return false;
}

void EventBus::offAll(const std::string& eventName) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.erase(eventName);
}

size_t EventBus::emit(const std::string& eventName, const EventData& data) {
    // Copy handlers to allow subscription changes (and re-entrant emits)
    // from inside a handler.
    std::vector<HandlerEntry> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handlers.find(eventName);
        if (it == m_handlers.end()) return 0;
        handlers = it->second;
    }

    size_t delivered = 0;
    for (const auto& handler : handlers) {
        try {
            handler.callback(data);
            ++delivered;
        } catch (const std::exception& e) {
            LOG_ERROR("EventBus: handler {} for '{}' threw: {}", handler.id, eventName, e.what());
        } catch (...) {
            LOG_ERROR("EventBus: handler {} for '{}' threw an unknown exception", handler.id, eventName);
        }
    }
    return delivered;
}

size_t EventBus::handlerCount(const std::string& eventName) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_handlers.find(eventName);
    return it != m_handlers.end() ? it->second.size() : 0;
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_handlers.clear();
}

} // namespace tether
