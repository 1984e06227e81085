#include "resource/ResourceRegistry.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <chrono>
#include <deque>
#include <exception>
#include <mutex>
#include <unordered_set>

namespace tether {

namespace {

constexpr const char* kUnknownException = "unknown exception";

std::string joinIds(const std::vector<std::string>& ids) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += ", ";
        out += ids[i];
    }
    return out;
}

bool stateAllowed(ResourceState state, std::initializer_list<ResourceState> allowed) {
    return std::find(allowed.begin(), allowed.end(), state) != allowed.end();
}

std::vector<ResourceInfo> sortedById(std::vector<ResourceInfo> infos) {
    std::sort(infos.begin(), infos.end(),
        [](const ResourceInfo& a, const ResourceInfo& b) { return a.id < b.id; });
    return infos;
}

} // namespace

ResourceRegistry::ResourceRegistry(RegistryConfig config, std::shared_ptr<Clock> clock)
    : m_config(config)
    , m_clock(clock ? std::move(clock) : std::make_shared<SystemClock>()) {
    if (m_config.maxDisposalPasses < 1) m_config.maxDisposalPasses = 1;
}

ResourceRegistry::~ResourceRegistry() {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    if (!m_entries.empty()) {
        LOG_DEBUG("Registry destroyed with {} resource(s) never disposed", m_entries.size());
    }
}

// --- Registration -------------------------------------------------------

Status ResourceRegistry::registerResource(std::unique_ptr<ResourceManageable> resource,
                                          const std::vector<std::string>& dependencies) {
    if (!resource) {
        return Status::failure(ErrorCode::InvalidState, "", "null resource");
    }
    const std::string id = resource->resourceId();
    if (id.empty()) {
        return Status::failure(ErrorCode::InvalidState, id, "empty resource id");
    }

    Entry entry;
    entry.resource = std::shared_ptr<ResourceManageable>(std::move(resource));
    entry.info.id = id;
    refreshFromResource(*entry.resource, entry.info);
    entry.info.kind = entry.resource->resourceKind();
    entry.info.state = ResourceState::Uninitialized;
    entry.info.createdAt = m_clock->now();
    entry.info.lastAccessedAt = entry.info.createdAt;

    std::vector<std::string> deps = dependencies;
    std::sort(deps.begin(), deps.end());
    deps.erase(std::unique(deps.begin(), deps.end()), deps.end());

    Status status;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);

        std::vector<std::string> missing;
        for (const auto& dep : deps) {
            if (dep != id && !m_entries.count(dep)) missing.push_back(dep);
        }

        if (m_entries.count(id)) {
            status = Status::failure(ErrorCode::AlreadyRegistered, id);
        } else if (std::find(deps.begin(), deps.end(), id) != deps.end()) {
            status = Status::failure(ErrorCode::CircularDependency, id, "depends on itself", {id});
        } else if (!missing.empty()) {
            status = Status::failure(ErrorCode::DependencyNotMet, id, "", missing);
        } else if (m_graph.wouldCreateCycle(id, deps)) {
            status = Status::failure(ErrorCode::CircularDependency, id, "", deps);
        } else {
            m_graph.addNode(id);
            for (const auto& dep : deps) m_graph.addEdge(id, dep);
            m_entries.emplace(id, std::move(entry));
        }
    }

    if (!status) {
        LOG_WARN("Register failed: {}", status.message());
        return status;
    }
    if (deps.empty()) {
        LOG_INFO("Registered resource '{}'", id);
    } else {
        LOG_INFO("Registered resource '{}' (depends on {})", id, joinIds(deps));
    }
    return status;
}

Status ResourceRegistry::unregisterResource(const std::string& id) {
    Status status;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            status = Status::failure(ErrorCode::NotFound, id);
        } else if (m_graph.hasDependents(id)) {
            status = Status::failure(ErrorCode::InvalidState, id, "still has dependents",
                                     m_graph.dependentsOf(id));
        } else if (isBusy(it->second)) {
            status = Status::failure(ErrorCode::InvalidState, id,
                std::string("hook in flight (") + resourceStateToString(it->second.info.state) + ")");
        } else {
            m_graph.removeNode(id);
            m_entries.erase(it);
        }
    }

    if (!status) {
        LOG_WARN("Unregister failed: {}", status.message());
    } else {
        LOG_INFO("Unregistered resource '{}'", id);
    }
    return status;
}

Status ResourceRegistry::addDependency(const std::string& id, const std::string& dependencyId) {
    Status status;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (!m_entries.count(id)) {
            status = Status::failure(ErrorCode::NotFound, id);
        } else if (!m_entries.count(dependencyId)) {
            status = Status::failure(ErrorCode::DependencyNotMet, id, "", {dependencyId});
        } else if (m_graph.hasEdge(id, dependencyId)) {
            return status;
        } else if (m_graph.wouldCreateCycle(id, {dependencyId})) {
            status = Status::failure(ErrorCode::CircularDependency, id, "", {dependencyId});
        } else {
            m_graph.addEdge(id, dependencyId);
        }
    }

    if (!status) {
        LOG_WARN("Add dependency failed: {}", status.message());
    } else {
        LOG_DEBUG("'{}' now depends on '{}'", id, dependencyId);
    }
    return status;
}

Status ResourceRegistry::removeDependency(const std::string& id, const std::string& dependencyId) {
    Status status;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (!m_entries.count(id)) {
            status = Status::failure(ErrorCode::NotFound, id);
        } else if (!m_graph.removeEdge(id, dependencyId)) {
            status = Status::failure(ErrorCode::NotFound, id, "no such dependency", {dependencyId});
        }
    }

    if (!status) {
        LOG_WARN("Remove dependency failed: {}", status.message());
    } else {
        LOG_DEBUG("'{}' no longer depends on '{}'", id, dependencyId);
    }
    return status;
}

// --- Lifecycle ----------------------------------------------------------

Status ResourceRegistry::initialize(const std::string& id) {
    Status status = initializeInternal(id, {});
    if (!status) {
        LOG_ERROR("Initialize failed: {}", status.message());
    }
    return status;
}

Status ResourceRegistry::initializeInternal(const std::string& id, std::vector<std::string> path) {
    std::vector<std::string> deps;
    ResourceState state;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return Status::failure(ErrorCode::NotFound, id);
        }
        state = it->second.info.state;
        deps = m_graph.dependenciesOf(id);
    }

    if (state != ResourceState::Uninitialized) {
        return Status::failure(ErrorCode::InvalidState, id,
            std::string("cannot initialize from ") + resourceStateToString(state));
    }
    if (std::find(path.begin(), path.end(), id) != path.end()) {
        return Status::failure(ErrorCode::CircularDependency, id, "reached again while initializing", path);
    }
    path.push_back(id);

    for (const auto& dep : deps) {
        std::optional<ResourceState> depState;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            auto it = m_entries.find(dep);
            if (it != m_entries.end()) depState = it->second.info.state;
        }

        if (!depState) {
            return Status::failure(ErrorCode::InitializationFailed, id,
                "dependency '" + dep + "' is no longer registered", {dep});
        }
        if (isUsable(*depState)) continue;
        if (*depState != ResourceState::Uninitialized) {
            return Status::failure(ErrorCode::InitializationFailed, id,
                "dependency '" + dep + "' is " + resourceStateToString(*depState), {dep});
        }

        LOG_DEBUG("Initializing '{}' before its dependent '{}'", dep, id);
        Status depStatus = initializeInternal(dep, path);
        if (!depStatus) {
            return Status::failure(ErrorCode::InitializationFailed, id,
                "dependency '" + dep + "' failed (" + depStatus.message() + ")", {dep});
        }
    }

    std::shared_ptr<ResourceManageable> resource;
    ResourceState from;
    Status status = beginTransition(id, "initialize", {ResourceState::Uninitialized},
                                    ResourceState::Initializing, resource, from);
    if (!status) return status;

    try {
        runHook(id, "initialize", [&resource]() { resource->initialize(); });
    } catch (const std::exception& e) {
        setState(id, ResourceState::Error, false);
        return Status::failure(ErrorCode::InitializationFailed, id, e.what());
    } catch (...) {
        setState(id, ResourceState::Error, false);
        return Status::failure(ErrorCode::InitializationFailed, id, kUnknownException);
    }

    setState(id, ResourceState::Ready, false);
    LOG_INFO("Resource '{}' ready", id);
    return Status::success();
}

Status ResourceRegistry::activate(const std::string& id) {
    std::shared_ptr<ResourceManageable> resource;
    ResourceState from;
    Status status = beginTransition(id, "activate", {ResourceState::Ready},
                                    ResourceState::Ready, resource, from);
    if (!status) {
        LOG_WARN("Activate failed: {}", status.message());
        return status;
    }

    try {
        runHook(id, "activate", [&resource]() { resource->activate(); });
    } catch (const std::exception& e) {
        status = Status::failure(ErrorCode::ActivationFailed, id, e.what());
    } catch (...) {
        status = Status::failure(ErrorCode::ActivationFailed, id, kUnknownException);
    }
    if (!status) {
        setState(id, ResourceState::Error, true);
        LOG_ERROR("Activate failed: {}", status.message());
        return status;
    }

    setState(id, ResourceState::Active, true);
    LOG_DEBUG("Resource '{}' active", id);
    return status;
}

Status ResourceRegistry::deactivate(const std::string& id) {
    std::shared_ptr<ResourceManageable> resource;
    ResourceState from;
    Status status = beginTransition(id, "deactivate", {ResourceState::Active},
                                    ResourceState::Active, resource, from);
    if (!status) {
        LOG_WARN("Deactivate failed: {}", status.message());
        return status;
    }

    try {
        runHook(id, "deactivate", [&resource]() { resource->deactivate(); });
    } catch (const std::exception& e) {
        status = Status::failure(ErrorCode::DeactivationFailed, id, e.what());
    } catch (...) {
        status = Status::failure(ErrorCode::DeactivationFailed, id, kUnknownException);
    }
    if (!status) {
        setState(id, ResourceState::Error, true);
        LOG_ERROR("Deactivate failed: {}", status.message());
        return status;
    }

    setState(id, ResourceState::Ready, true);
    LOG_DEBUG("Resource '{}' deactivated", id);
    return status;
}

Status ResourceRegistry::dispose(const std::string& id) {
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            Status status = Status::failure(ErrorCode::NotFound, id);
            LOG_WARN("Dispose failed: {}", status.message());
            return status;
        }
        if (isBusy(it->second)) {
            Status status = Status::failure(ErrorCode::InvalidState, id,
                std::string("cannot dispose while a hook is running (")
                + resourceStateToString(it->second.info.state) + ")");
            LOG_WARN("Dispose failed: {}", status.message());
            return status;
        }
    }

    // Work-list teardown: a candidate with live dependents is put back
    // behind them.  Each pop of an unprocessed candidate counts as a pass.
    std::deque<std::string> work{id};
    std::unordered_set<std::string> processed;
    int passes = 0;

    while (!work.empty()) {
        std::string candidate = work.front();
        work.pop_front();
        if (processed.count(candidate)) continue;

        if (++passes > m_config.maxDisposalPasses) {
            work.push_front(candidate);
            std::vector<std::string> unresolved;
            for (const auto& pending : work) {
                if (processed.count(pending)) continue;
                if (std::find(unresolved.begin(), unresolved.end(), pending) != unresolved.end()) continue;
                if (contains(pending)) unresolved.push_back(pending);
            }
            Status status = Status::failure(ErrorCode::DisposalDepthExceeded, id,
                "gave up after " + std::to_string(m_config.maxDisposalPasses) + " passes",
                unresolved);
            LOG_ERROR("Dispose aborted: {}", status.message());
            return status;
        }

        std::vector<std::string> dependents;
        bool present = false;
        {
            std::shared_lock<std::shared_mutex> lock(m_mutex);
            present = m_entries.count(candidate) > 0;
            if (present) dependents = m_graph.dependentsOf(candidate);
        }
        if (!present) {
            processed.insert(candidate);
            continue;
        }

        if (!dependents.empty()) {
            LOG_DEBUG("Deferring disposal of '{}' until {} is disposed", candidate, joinIds(dependents));
            work.push_back(candidate);
            for (auto it = dependents.rbegin(); it != dependents.rend(); ++it) {
                work.push_front(*it);
            }
            continue;
        }

        Status status = disposeOne(candidate);
        if (!status) {
            LOG_ERROR("Dispose aborted: {}", status.message());
            return status;
        }
        processed.insert(candidate);
    }

    return Status::success();
}

Status ResourceRegistry::disposeOne(const std::string& id) {
    std::shared_ptr<ResourceManageable> resource;
    ResourceState from;
    Status status = beginTransition(id, "dispose",
        {ResourceState::Uninitialized, ResourceState::Ready, ResourceState::Active, ResourceState::Error},
        ResourceState::Disposing, resource, from);
    if (!status) return status;

    try {
        runHook(id, "dispose", [&resource]() { resource->dispose(); });
    } catch (const std::exception& e) {
        setState(id, ResourceState::Error, false);
        return Status::failure(ErrorCode::DisposalFailed, id, e.what());
    } catch (...) {
        setState(id, ResourceState::Error, false);
        return Status::failure(ErrorCode::DisposalFailed, id, kUnknownException);
    }

    bool removed = false;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it != m_entries.end()) {
            it->second.info.state = ResourceState::Disposed;
            m_graph.removeNode(id);
            m_entries.erase(it);
            removed = true;
        }
    }
    if (removed) {
        notifyStateChange(id, ResourceState::Disposing, ResourceState::Disposed);
    }
    LOG_INFO("Resource '{}' disposed", id);
    return status;
}

std::future<Status> ResourceRegistry::initializeAsync(const std::string& id) {
    return std::async(std::launch::async, [this, id]() { return initialize(id); });
}

std::future<Status> ResourceRegistry::disposeAsync(const std::string& id) {
    return std::async(std::launch::async, [this, id]() { return dispose(id); });
}

Status ResourceRegistry::touch(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) {
        return Status::failure(ErrorCode::NotFound, id);
    }
    it->second.info.lastAccessedAt = m_clock->now();
    return Status::success();
}

// --- Queries ------------------------------------------------------------

std::optional<ResourceInfo> ResourceRegistry::get(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_entries.find(id);
    if (it == m_entries.end()) return std::nullopt;
    return it->second.info;
}

std::vector<ResourceInfo> ResourceRegistry::list() const {
    std::vector<ResourceInfo> out;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        out.reserve(m_entries.size());
        for (const auto& [id, entry] : m_entries) out.push_back(entry.info);
    }
    return sortedById(std::move(out));
}

std::vector<ResourceInfo> ResourceRegistry::listByKind(ResourceKind kind) const {
    std::vector<ResourceInfo> out;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (entry.info.kind == kind) out.push_back(entry.info);
        }
    }
    return sortedById(std::move(out));
}

std::vector<ResourceInfo> ResourceRegistry::listByState(ResourceState state) const {
    std::vector<ResourceInfo> out;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (entry.info.state == state) out.push_back(entry.info);
        }
    }
    return sortedById(std::move(out));
}

std::optional<std::string> ResourceRegistry::describe(const std::string& id) const {
    std::shared_ptr<ResourceManageable> resource;
    ResourceInfo info;
    std::vector<std::string> deps;
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) return std::nullopt;
        resource = it->second.resource;
        info = it->second.info;
        deps = m_graph.dependenciesOf(id);
    }
    refreshFromResource(*resource, info);

    std::string out = info.id + " [" + resourceKindToString(info.kind) + "] "
                    + resourceStateToString(info.state);
    if (!info.description.empty()) out += ": " + info.description;
    if (!deps.empty()) out += " (depends on " + joinIds(deps) + ")";
    if (info.estimatedMemoryBytes > 0) {
        out += " ~" + std::to_string(info.estimatedMemoryBytes) + " bytes";
    }
    return out;
}

bool ResourceRegistry::contains(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.count(id) > 0;
}

size_t ResourceRegistry::count() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_entries.size();
}

std::vector<std::string> ResourceRegistry::dependenciesOf(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_graph.dependenciesOf(id);
}

std::vector<std::string> ResourceRegistry::dependentsOf(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_graph.dependentsOf(id);
}

std::vector<std::string> ResourceRegistry::initializationOrder() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_graph.topologicalOrder();
}

RegistryStatistics ResourceRegistry::statistics() const {
    RegistryStatistics stats;
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    stats.totalCount = m_entries.size();
    for (const auto& [id, entry] : m_entries) {
        stats.byKind[entry.info.kind]++;
        stats.byState[entry.info.state]++;
        stats.totalEstimatedMemory += entry.info.estimatedMemoryBytes;
    }
    return stats;
}

bool ResourceRegistry::checkMemoryBudget() const {
    if (m_config.maxEstimatedMemoryBytes == 0) return true;
    const uint64_t total = statistics().totalEstimatedMemory;
    if (total <= m_config.maxEstimatedMemoryBytes) return true;
    LOG_WARN("Resources estimate {} bytes, over the {} byte budget",
             total, m_config.maxEstimatedMemoryBytes);
    return false;
}

HealthReport ResourceRegistry::healthCheck() const {
    HealthReport report;
    auto infos = list();

    for (const auto& info : infos) {
        if (isUsable(info.state)) {
            report.healthyCount++;
        } else if (info.state == ResourceState::Error) {
            report.unhealthyCount++;
            report.errors.push_back("'" + info.id + "' is in Error");
        } else {
            report.warnings.push_back("'" + info.id + "' is " + resourceStateToString(info.state));
        }
    }

    report.score = infos.empty() ? 1.0
                 : static_cast<double>(report.healthyCount) / static_cast<double>(infos.size());
    return report;
}

nlohmann::json ResourceRegistry::exportState() const {
    nlohmann::json resources = nlohmann::json::array();
    for (const auto& info : list()) {
        auto j = info.toJson();
        j["dependencies"] = dependenciesOf(info.id);
        j["dependents"] = dependentsOf(info.id);
        resources.push_back(std::move(j));
    }

    return {
        {"resources", resources},
        {"initializationOrder", initializationOrder()},
        {"statistics", statistics().toJson()},
        {"health", healthCheck().toJson()},
        {"exportedAt", toEpochMillis(m_clock->now())}
    };
}

// --- Idle eviction ------------------------------------------------------

std::vector<std::string> ResourceRegistry::idleCandidates(double windowSeconds, size_t limit) const {
    std::vector<std::pair<TimePoint, std::string>> idle;
    const TimePoint now = m_clock->now();
    {
        std::shared_lock<std::shared_mutex> lock(m_mutex);
        for (const auto& [id, entry] : m_entries) {
            if (entry.info.state == ResourceState::Active || isBusy(entry)) continue;
            if (m_graph.hasDependents(id)) continue;
            if (secondsBetween(entry.info.lastAccessedAt, now) < windowSeconds) continue;
            idle.emplace_back(entry.info.lastAccessedAt, id);
        }
    }

    std::sort(idle.begin(), idle.end());
    std::vector<std::string> out;
    for (const auto& [when, id] : idle) {
        if (out.size() >= limit) break;
        out.push_back(id);
    }
    return out;
}

std::vector<std::string> ResourceRegistry::idleCandidates() const {
    return idleCandidates(m_config.idleEvictionSeconds, m_config.maxEvictionsPerPass);
}

size_t ResourceRegistry::disposeIdle(double windowSeconds, size_t limit) {
    size_t disposed = 0;
    for (const auto& id : idleCandidates(windowSeconds, limit)) {
        Status status = dispose(id);
        if (status) {
            ++disposed;
        } else {
            LOG_WARN("Idle eviction of '{}' failed: {}", id, status.message());
        }
    }
    if (disposed > 0) {
        LOG_INFO("Evicted {} idle resource(s)", disposed);
    }
    return disposed;
}

size_t ResourceRegistry::disposeIdle() {
    return disposeIdle(m_config.idleEvictionSeconds, m_config.maxEvictionsPerPass);
}

void ResourceRegistry::setStateObserver(StateChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_observerMutex);
    m_stateObserver = std::move(callback);
}

// --- Internals ----------------------------------------------------------

bool ResourceRegistry::isBusy(const Entry& entry) {
    return entry.hookRunning || isInFlight(entry.info.state);
}

Status ResourceRegistry::beginTransition(const std::string& id, const char* operation,
                                         std::initializer_list<ResourceState> allowed,
                                         ResourceState to,
                                         std::shared_ptr<ResourceManageable>& resourceOut,
                                         ResourceState& fromOut) {
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) {
            return Status::failure(ErrorCode::NotFound, id);
        }
        auto& entry = it->second;
        if (entry.hookRunning) {
            return Status::failure(ErrorCode::InvalidState, id,
                std::string("cannot ") + operation + " while another hook is running");
        }
        if (!stateAllowed(entry.info.state, allowed)) {
            return Status::failure(ErrorCode::InvalidState, id,
                std::string("cannot ") + operation + " from " + resourceStateToString(entry.info.state));
        }
        fromOut = entry.info.state;
        entry.info.state = to;
        entry.hookRunning = true;
        resourceOut = entry.resource;
    }
    if (fromOut != to) {
        notifyStateChange(id, fromOut, to);
    }
    return Status::success();
}

void ResourceRegistry::setState(const std::string& id, ResourceState to, bool touch) {
    ResourceState from;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_entries.find(id);
        if (it == m_entries.end()) return;
        from = it->second.info.state;
        it->second.info.state = to;
        it->second.hookRunning = false;
        if (touch) it->second.info.lastAccessedAt = m_clock->now();
    }
    if (from != to) {
        notifyStateChange(id, from, to);
    }
}

void ResourceRegistry::runHook(const std::string& id, const char* hookName,
                               const std::function<void()>& hook) const {
    if (m_config.hookSoftTimeoutSeconds <= 0.0) {
        hook();
        return;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto interval = std::chrono::duration<double>(m_config.hookSoftTimeoutSeconds);
    auto future = std::async(std::launch::async, hook);

    while (future.wait_for(interval) == std::future_status::timeout) {
        const double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start).count();
        LOG_WARN("Resource '{}': {} hook still running after {:.1f}s", id, hookName, elapsed);
    }
    future.get();
}

void ResourceRegistry::notifyStateChange(const std::string& id, ResourceState from,
                                         ResourceState to) const {
    LOG_TRACE("'{}': {} -> {}", id, resourceStateToString(from), resourceStateToString(to));

    StateChangeCallback observer;
    {
        std::lock_guard<std::mutex> lock(m_observerMutex);
        observer = m_stateObserver;
    }
    if (!observer) return;
    try {
        observer(id, from, to);
    } catch (const std::exception& e) {
        LOG_ERROR("State observer threw for '{}': {}", id, e.what());
    } catch (...) {
        LOG_ERROR("State observer threw for '{}': {}", id, kUnknownException);
    }
}

void ResourceRegistry::refreshFromResource(const ResourceManageable& resource, ResourceInfo& info) {
    try {
        ResourceInfo self = resource.describeSelf();
        info.description = std::move(self.description);
        info.estimatedMemoryBytes = self.estimatedMemoryBytes;
        if (self.metadata.is_object()) info.metadata = std::move(self.metadata);
    } catch (const std::exception& e) {
        LOG_WARN("describeSelf() failed for '{}': {}", info.id, e.what());
    } catch (...) {
        LOG_WARN("describeSelf() failed for '{}': {}", info.id, kUnknownException);
    }
}

} // namespace tether
