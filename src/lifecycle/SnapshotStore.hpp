#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace tether {

/// The persisted runtime summary: a flat object of primitives (counts,
/// ids, timestamps), never resource internals.  Unknown keys are ignored
/// on load and missing or mistyped keys keep their defaults.
struct RuntimeSnapshot {
    static constexpr int kSchemaVersion = 1;

    int schemaVersion = kSchemaVersion;
    std::string phase;
    int64_t savedAt = 0;            // epoch milliseconds
    int64_t resourceCount = 0;
    int64_t activeCount = 0;
    int64_t readyCount = 0;
    int64_t errorCount = 0;
    std::string resourceIds;        // comma-separated
    std::string activeIds;          // comma-separated
    int64_t transitionCount = 0;
    int64_t cleanupCount = 0;
    std::string pressureLevel;
    int64_t appMemoryUsage = 0;

    nlohmann::json toJson() const;
    static RuntimeSnapshot fromJson(const nlohmann::json& j);
};

/// Where snapshots go.  Implementations must not throw.
class SnapshotStore {
public:
    virtual ~SnapshotStore() = default;

    /// Persist a flat JSON object. Returns false on failure.
    virtual bool save(const nlohmann::json& snapshot) = 0;

    /// The last saved snapshot, or nullopt if there is none.
    virtual std::optional<nlohmann::json> load() = 0;
};

/// Keeps the snapshot in memory (tests, or no snapshot path configured).
class InMemorySnapshotStore : public SnapshotStore {
public:
    bool save(const nlohmann::json& snapshot) override;
    std::optional<nlohmann::json> load() override;

    size_t saveCount() const;

private:
    mutable std::mutex m_mutex;
    std::optional<nlohmann::json> m_snapshot;
    size_t m_saves = 0;
};

/// One JSON file plus a `.bak` copy of the previous save.  A corrupt or
/// non-object primary falls back to the backup.
class JsonFileSnapshotStore : public SnapshotStore {
public:
    explicit JsonFileSnapshotStore(std::string path);

    bool save(const nlohmann::json& snapshot) override;
    std::optional<nlohmann::json> load() override;

    const std::string& path() const { return m_path; }
    std::string backupPath() const { return m_path + ".bak"; }

private:
    std::optional<nlohmann::json> readObject(const std::string& path) const;

    std::string m_path;
    std::mutex m_mutex;
};

} // namespace tether
