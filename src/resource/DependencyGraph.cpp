#include "resource/DependencyGraph.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>

namespace tether {

bool DependencyGraph::addNode(const std::string& id) {
    if (contains(id)) return false;
    m_dependencies[id];
    m_dependents[id];
    return true;
}

void DependencyGraph::removeNode(const std::string& id) {
    auto depIt = m_dependencies.find(id);
    if (depIt == m_dependencies.end()) return;

    for (const auto& dep : depIt->second) {
        auto it = m_dependents.find(dep);
        if (it != m_dependents.end()) it->second.erase(id);
    }
    auto revIt = m_dependents.find(id);
    if (revIt != m_dependents.end()) {
        for (const auto& dependent : revIt->second) {
            auto it = m_dependencies.find(dependent);
            if (it != m_dependencies.end()) it->second.erase(id);
        }
        m_dependents.erase(revIt);
    }
    m_dependencies.erase(depIt);
}

bool DependencyGraph::contains(const std::string& id) const {
    return m_dependencies.count(id) > 0;
}

bool DependencyGraph::addEdge(const std::string& from, const std::string& to) {
    if (!contains(from) || !contains(to)) return false;
    if (!m_dependencies[from].insert(to).second) return false;
    m_dependents[to].insert(from);
    return true;
}

bool DependencyGraph::removeEdge(const std::string& from, const std::string& to) {
    auto it = m_dependencies.find(from);
    if (it == m_dependencies.end() || it->second.erase(to) == 0) return false;
    m_dependents[to].erase(from);
    return true;
}

bool DependencyGraph::hasEdge(const std::string& from, const std::string& to) const {
    auto it = m_dependencies.find(from);
    return it != m_dependencies.end() && it->second.count(to) > 0;
}

std::vector<std::string> DependencyGraph::dependenciesOf(const std::string& id) const {
    auto it = m_dependencies.find(id);
    if (it == m_dependencies.end()) return {};
    return {it->second.begin(), it->second.end()};
}

std::vector<std::string> DependencyGraph::dependentsOf(const std::string& id) const {
    auto it = m_dependents.find(id);
    if (it == m_dependents.end()) return {};
    return {it->second.begin(), it->second.end()};
}

bool DependencyGraph::hasDependents(const std::string& id) const {
    auto it = m_dependents.find(id);
    return it != m_dependents.end() && !it->second.empty();
}

bool DependencyGraph::wouldCreateCycle(const std::string& id,
                                       const std::vector<std::string>& deps) const {
    std::unordered_set<std::string> visited;
    std::vector<std::string> stack;

    for (const auto& start : deps) {
        if (start == id) return true;
        stack.push_back(start);

        while (!stack.empty()) {
            std::string current = std::move(stack.back());
            stack.pop_back();
            if (current == id) return true;
            if (!visited.insert(current).second) continue;

            auto it = m_dependencies.find(current);
            if (it == m_dependencies.end()) continue;
            for (const auto& next : it->second) {
                if (!visited.count(next)) stack.push_back(next);
            }
        }
    }
    return false;
}

std::vector<std::string> DependencyGraph::topologicalOrder() const {
    // Kahn's algorithm over remaining dependency counts; the ordered set
    // keeps the output deterministic.
    std::map<std::string, size_t> remaining;
    std::set<std::string> ready;
    for (const auto& [id, deps] : m_dependencies) {
        remaining[id] = deps.size();
        if (deps.empty()) ready.insert(id);
    }

    std::vector<std::string> order;
    order.reserve(m_dependencies.size());
    while (!ready.empty()) {
        std::string id = *ready.begin();
        ready.erase(ready.begin());
        order.push_back(id);
        remaining.erase(id);

        auto it = m_dependents.find(id);
        if (it == m_dependents.end()) continue;
        for (const auto& dependent : it->second) {
            auto rem = remaining.find(dependent);
            if (rem != remaining.end() && --rem->second == 0) {
                ready.insert(dependent);
            }
        }
    }

    for (const auto& [id, count] : remaining) {
        order.push_back(id);
    }
    return order;
}

size_t DependencyGraph::edgeCount() const {
    size_t total = 0;
    for (const auto& [id, deps] : m_dependencies) total += deps.size();
    return total;
}

void DependencyGraph::clear() {
    m_dependencies.clear();
    m_dependents.clear();
}

} // namespace tether
