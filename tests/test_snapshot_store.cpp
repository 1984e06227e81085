#include <gtest/gtest.h>
#include "lifecycle/SnapshotStore.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace tether;
namespace fs = std::filesystem;

// =============================================================================
// RuntimeSnapshot
// =============================================================================

TEST(RuntimeSnapshotTest, JsonIsFlat) {
    RuntimeSnapshot snapshot;
    snapshot.phase = "Background";
    snapshot.resourceCount = 3;
    snapshot.resourceIds = "audio,recognizer,ui";

    auto j = snapshot.toJson();
    EXPECT_EQ(j["schemaVersion"], RuntimeSnapshot::kSchemaVersion);
    EXPECT_EQ(j["phase"], "Background");
    EXPECT_EQ(j["resourceIds"], "audio,recognizer,ui");
    for (const auto& item : j.items()) {
        EXPECT_TRUE(item.value().is_primitive()) << item.key();
    }
}

TEST(RuntimeSnapshotTest, FromJsonRestoresFields) {
    RuntimeSnapshot original;
    original.phase = "Active";
    original.savedAt = 1700000000000;
    original.activeCount = 2;
    original.activeIds = "audio,recognizer";
    original.pressureLevel = "Warning";
    original.appMemoryUsage = 52428800;

    auto restored = RuntimeSnapshot::fromJson(original.toJson());
    EXPECT_EQ(restored.phase, "Active");
    EXPECT_EQ(restored.savedAt, 1700000000000);
    EXPECT_EQ(restored.activeCount, 2);
    EXPECT_EQ(restored.activeIds, "audio,recognizer");
    EXPECT_EQ(restored.pressureLevel, "Warning");
    EXPECT_EQ(restored.appMemoryUsage, 52428800);
}

TEST(RuntimeSnapshotTest, UnknownKeysIgnoredMissingKeysDefault) {
    nlohmann::json j = {
        {"schemaVersion", 2},
        {"phase", "Sleeping"},
        {"futureField", "whatever"},
        {"resourceCount", "not a number"}
    };

    auto snapshot = RuntimeSnapshot::fromJson(j);
    EXPECT_EQ(snapshot.schemaVersion, 2);
    EXPECT_EQ(snapshot.phase, "Sleeping");
    EXPECT_EQ(snapshot.resourceCount, 0);
    EXPECT_EQ(snapshot.cleanupCount, 0);
    EXPECT_TRUE(snapshot.activeIds.empty());
}

TEST(RuntimeSnapshotTest, NonObjectYieldsDefaults) {
    auto snapshot = RuntimeSnapshot::fromJson(nlohmann::json::array({1, 2}));
    EXPECT_EQ(snapshot.schemaVersion, RuntimeSnapshot::kSchemaVersion);
    EXPECT_TRUE(snapshot.phase.empty());
}

// =============================================================================
// InMemorySnapshotStore
// =============================================================================

TEST(InMemorySnapshotStoreTest, SaveAndLoad) {
    InMemorySnapshotStore store;
    EXPECT_FALSE(store.load().has_value());

    ASSERT_TRUE(store.save({{"phase", "Background"}}));
    ASSERT_TRUE(store.save({{"phase", "Terminating"}}));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ((*loaded)["phase"], "Terminating");
    EXPECT_EQ(store.saveCount(), 2u);
}

// =============================================================================
// JsonFileSnapshotStore
// =============================================================================

class JsonFileSnapshotStoreTest : public ::testing::Test {
protected:
    fs::path dir;
    std::string path;

    void SetUp() override {
        dir = fs::temp_directory_path() / "tether_snapshot_test";
        fs::remove_all(dir);
        path = (dir / "state" / "snapshot.json").string();
    }

    void TearDown() override {
        fs::remove_all(dir);
    }
};

TEST_F(JsonFileSnapshotStoreTest, LoadWithoutFile) {
    JsonFileSnapshotStore store(path);
    EXPECT_FALSE(store.load().has_value());
}

TEST_F(JsonFileSnapshotStoreTest, SaveCreatesDirectoriesAndLoads) {
    JsonFileSnapshotStore store(path);
    RuntimeSnapshot snapshot;
    snapshot.phase = "Background";
    snapshot.resourceCount = 4;

    ASSERT_TRUE(store.save(snapshot.toJson()));
    EXPECT_TRUE(fs::exists(path));
    EXPECT_FALSE(fs::exists(store.backupPath()));

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    auto restored = RuntimeSnapshot::fromJson(*loaded);
    EXPECT_EQ(restored.phase, "Background");
    EXPECT_EQ(restored.resourceCount, 4);
}

TEST_F(JsonFileSnapshotStoreTest, SecondSaveKeepsBackup) {
    JsonFileSnapshotStore store(path);
    ASSERT_TRUE(store.save({{"phase", "Background"}}));
    ASSERT_TRUE(store.save({{"phase", "Terminating"}}));

    ASSERT_TRUE(fs::exists(store.backupPath()));
    std::ifstream backup(store.backupPath());
    auto previous = nlohmann::json::parse(backup);
    EXPECT_EQ(previous["phase"], "Background");
}

TEST_F(JsonFileSnapshotStoreTest, CorruptPrimaryFallsBackToBackup) {
    JsonFileSnapshotStore store(path);
    ASSERT_TRUE(store.save({{"phase", "Background"}}));
    ASSERT_TRUE(store.save({{"phase", "Active"}}));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "{ corrupted";
    }

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ((*loaded)["phase"], "Background");
}

TEST_F(JsonFileSnapshotStoreTest, NonObjectPrimaryFallsBackToBackup) {
    JsonFileSnapshotStore store(path);
    ASSERT_TRUE(store.save({{"phase", "Background"}}));
    ASSERT_TRUE(store.save({{"phase", "Active"}}));

    {
        std::ofstream out(path, std::ios::trunc);
        out << "[1, 2, 3]";
    }

    auto loaded = store.load();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ((*loaded)["phase"], "Background");
}

TEST_F(JsonFileSnapshotStoreTest, BothUnusable) {
    JsonFileSnapshotStore store(path);
    fs::create_directories(fs::path(path).parent_path());
    std::ofstream(path) << "garbage";
    std::ofstream(store.backupPath()) << "more garbage";

    EXPECT_FALSE(store.load().has_value());
}

TEST_F(JsonFileSnapshotStoreTest, UnwritableLocationFails) {
    JsonFileSnapshotStore store("/proc/tether/snapshot.json");
    EXPECT_FALSE(store.save({{"phase", "Active"}}));
}
