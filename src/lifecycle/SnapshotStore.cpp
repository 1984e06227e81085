#include "lifecycle/SnapshotStore.hpp"
#include "core/Log.hpp"

#include <filesystem>
#include <fstream>
#include <type_traits>

namespace fs = std::filesystem;

namespace tether {

namespace {

template <typename T>
void readField(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    if constexpr (std::is_same_v<T, std::string>) {
        if (it->is_string()) out = it->template get<std::string>();
    } else {
        if (it->is_number_integer()) out = it->template get<T>();
    }
}

} // namespace

nlohmann::json RuntimeSnapshot::toJson() const {
    return {
        {"schemaVersion", schemaVersion},
        {"phase", phase},
        {"savedAt", savedAt},
        {"resourceCount", resourceCount},
        {"activeCount", activeCount},
        {"readyCount", readyCount},
        {"errorCount", errorCount},
        {"resourceIds", resourceIds},
        {"activeIds", activeIds},
        {"transitionCount", transitionCount},
        {"cleanupCount", cleanupCount},
        {"pressureLevel", pressureLevel},
        {"appMemoryUsage", appMemoryUsage}
    };
}

RuntimeSnapshot RuntimeSnapshot::fromJson(const nlohmann::json& j) {
    RuntimeSnapshot snapshot;
    if (!j.is_object()) return snapshot;

    readField(j, "schemaVersion", snapshot.schemaVersion);
    readField(j, "phase", snapshot.phase);
    readField(j, "savedAt", snapshot.savedAt);
    readField(j, "resourceCount", snapshot.resourceCount);
    readField(j, "activeCount", snapshot.activeCount);
    readField(j, "readyCount", snapshot.readyCount);
    readField(j, "errorCount", snapshot.errorCount);
    readField(j, "resourceIds", snapshot.resourceIds);
    readField(j, "activeIds", snapshot.activeIds);
    readField(j, "transitionCount", snapshot.transitionCount);
    readField(j, "cleanupCount", snapshot.cleanupCount);
    readField(j, "pressureLevel", snapshot.pressureLevel);
    readField(j, "appMemoryUsage", snapshot.appMemoryUsage);
    return snapshot;
}

// --- InMemorySnapshotStore ----------------------------------------------

bool InMemorySnapshotStore::save(const nlohmann::json& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_snapshot = snapshot;
    ++m_saves;
    return true;
}

std::optional<nlohmann::json> InMemorySnapshotStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_snapshot;
}

size_t InMemorySnapshotStore::saveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saves;
}

// --- JsonFileSnapshotStore ----------------------------------------------

JsonFileSnapshotStore::JsonFileSnapshotStore(std::string path)
    : m_path(std::move(path)) {}

bool JsonFileSnapshotStore::save(const nlohmann::json& snapshot) {
    std::lock_guard<std::mutex> lock(m_mutex);

    try {
        fs::path parent = fs::path(m_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    } catch (const std::exception& ex) {
        LOG_ERROR("Snapshot: failed to create directory for '{}': {}", m_path, ex.what());
        return false;
    }

    // Keep the previous save for corruption recovery
    std::error_code ec;
    if (fs::exists(m_path, ec)) {
        fs::copy_file(m_path, backupPath(), fs::copy_options::overwrite_existing, ec);
        if (ec) {
            LOG_WARN("Snapshot: failed to back up '{}': {}", m_path, ec.message());
        }
    }

    try {
        std::ofstream file(m_path);
        if (!file.is_open()) {
            LOG_ERROR("Snapshot: could not open '{}' for writing", m_path);
            return false;
        }
        file << snapshot.dump(2);
        file.close();

        if (file.fail()) {
            LOG_ERROR("Snapshot: write error for '{}'", m_path);
            return false;
        }
    } catch (const std::exception& ex) {
        LOG_ERROR("Snapshot: error saving '{}': {}", m_path, ex.what());
        return false;
    }

    LOG_DEBUG("Snapshot saved to '{}'", m_path);
    return true;
}

std::optional<nlohmann::json> JsonFileSnapshotStore::load() {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    if (!fs::exists(m_path, ec) && !fs::exists(backupPath(), ec)) {
        return std::nullopt;
    }

    if (auto data = readObject(m_path)) return data;

    LOG_WARN("Snapshot: '{}' unreadable, trying backup", m_path);
    if (auto data = readObject(backupPath())) {
        LOG_WARN("Snapshot: loaded from backup (primary file was corrupted)");
        return data;
    }

    LOG_ERROR("Snapshot: backup for '{}' is also unusable", m_path);
    return std::nullopt;
}

std::optional<nlohmann::json> JsonFileSnapshotStore::readObject(const std::string& path) const {
    try {
        std::ifstream file(path);
        if (!file.is_open()) return std::nullopt;

        nlohmann::json data = nlohmann::json::parse(file);
        if (!data.is_object()) {
            LOG_WARN("Snapshot: '{}' is not a JSON object", path);
            return std::nullopt;
        }
        return data;
    } catch (const nlohmann::json::parse_error& ex) {
        LOG_WARN("Snapshot: parse error in '{}': {}", path, ex.what());
        return std::nullopt;
    }
}

} // namespace tether
