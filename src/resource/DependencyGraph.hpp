#pragma once

#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace tether {

/// Directed graph of resource ids: an edge `from -> to` means `from`
/// depends on `to`.  Kept acyclic by its owner, which checks
/// wouldCreateCycle() before adding edges.  Not thread-safe; the registry
/// guards it with its reader/writer lock.
class DependencyGraph {
public:
    /// Add a node with no edges. Returns false if it already exists.
    bool addNode(const std::string& id);

    /// Remove a node and every edge touching it.
    void removeNode(const std::string& id);

    bool contains(const std::string& id) const;

    /// Add `from -> to`. Both nodes must exist. Returns false otherwise or
    /// if the edge is already present.  Does not check for cycles.
    bool addEdge(const std::string& from, const std::string& to);

    bool removeEdge(const std::string& from, const std::string& to);
    bool hasEdge(const std::string& from, const std::string& to) const;

    /// Direct dependencies of `id`, sorted.
    std::vector<std::string> dependenciesOf(const std::string& id) const;

    /// Direct dependents of `id` (nodes that depend on it), sorted.
    std::vector<std::string> dependentsOf(const std::string& id) const;

    bool hasDependents(const std::string& id) const;

    /// Would giving `id` the dependencies `deps` close a cycle?  Runs an
    /// iterative depth-first search from each dependency along dependency
    /// edges looking for `id`.  A self-dependency is a cycle.
    bool wouldCreateCycle(const std::string& id, const std::vector<std::string>& deps) const;

    /// Every node with its dependencies before it; ties broken by id.
    /// Nodes caught in a cycle (only possible if the invariant was broken)
    /// are appended at the end in id order.
    std::vector<std::string> topologicalOrder() const;

    size_t size() const { return m_dependencies.size(); }
    size_t edgeCount() const;
    void clear();

private:
    std::unordered_map<std::string, std::set<std::string>> m_dependencies;
    std::unordered_map<std::string, std::set<std::string>> m_dependents;
};

} // namespace tether
