#include <gtest/gtest.h>
#include "core/Config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using namespace tether;

TEST(ConfigTest, LoadFromValidString) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "test", "value": 42})"));
    EXPECT_EQ(cfg.getString("name"), "test");
    EXPECT_EQ(cfg.getInt("value"), 42);
}

TEST(ConfigTest, LoadFromInvalidString) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromString("{invalid json}"));
}

TEST(ConfigTest, LoadFromMissingFile) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromFile("nonexistent_file.json"));
    EXPECT_NE(cfg.lastError().find("nonexistent_file.json"), std::string::npos);
}

TEST(ConfigTest, LastErrorClearedBySuccess) {
    Config cfg;
    EXPECT_FALSE(cfg.loadFromString("[1, 2"));
    EXPECT_FALSE(cfg.lastError().empty());

    ASSERT_TRUE(cfg.loadFromString("{}"));
    EXPECT_TRUE(cfg.lastError().empty());
}

TEST(ConfigTest, FailedLoadKeepsPreviousData) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kept": 1})"));
    EXPECT_FALSE(cfg.loadFromString("{broken"));
    EXPECT_EQ(cfg.getInt("kept"), 1);
}

TEST(ConfigTest, DotNotation) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({
        "memory": {
            "history_limit": 100,
            "sample_interval_seconds": 2.5,
            "temp_directory": "/tmp/tether",
            "leak": {"enabled": true}
        }
    })"));

    EXPECT_EQ(cfg.getInt("memory.history_limit"), 100);
    EXPECT_DOUBLE_EQ(cfg.getDouble("memory.sample_interval_seconds"), 2.5);
    EXPECT_EQ(cfg.getString("memory.temp_directory"), "/tmp/tether");
    EXPECT_TRUE(cfg.getBool("memory.leak.enabled"));
}

TEST(ConfigTest, DefaultValues) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({})"));

    EXPECT_EQ(cfg.getString("missing", "fallback"), "fallback");
    EXPECT_EQ(cfg.getInt("missing", 99), 99);
    EXPECT_EQ(cfg.getInt64("missing", 1LL << 40), 1LL << 40);
    EXPECT_DOUBLE_EQ(cfg.getDouble("missing", 3.14), 3.14);
    EXPECT_EQ(cfg.getBool("missing", true), true);
}

TEST(ConfigTest, HasKey) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": {"b": 1}})"));

    EXPECT_TRUE(cfg.hasKey("a"));
    EXPECT_TRUE(cfg.hasKey("a.b"));
    EXPECT_FALSE(cfg.hasKey("a.c"));
    EXPECT_FALSE(cfg.hasKey("x"));
    EXPECT_FALSE(cfg.hasKey("a.b.c"));
}

TEST(ConfigTest, TypeMismatchReturnsDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"name": "hello", "count": 5, "ratio": 0.5})"));

    EXPECT_EQ(cfg.getInt("name", -1), -1);
    EXPECT_EQ(cfg.getString("count", "nope"), "nope");
    EXPECT_EQ(cfg.getBool("count", true), true);
    // A floating point value is not an integer
    EXPECT_EQ(cfg.getInt("ratio", 7), 7);
}

TEST(ConfigTest, IntegerReadsAsDouble) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"pi": 3.14159, "whole": 10})"));

    EXPECT_NEAR(cfg.getDouble("pi"), 3.14159, 1e-9);
    EXPECT_DOUBLE_EQ(cfg.getDouble("whole"), 10.0);
}

TEST(ConfigTest, Int64Values) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"bytes": 17179869184})"));
    EXPECT_EQ(cfg.getInt64("bytes"), 17179869184LL);
}

TEST(ConfigTest, DeepNesting) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"a": {"b": {"c": {"d": 42}}}})"));

    EXPECT_EQ(cfg.getInt("a.b.c.d"), 42);
    EXPECT_FALSE(cfg.hasKey("a.b.c.e"));
}

// =============================================================================
// String lists
// =============================================================================

TEST(ConfigTest, StringList) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kinds": ["Audio", "System"]})"));

    auto kinds = cfg.getStringList("kinds");
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[0], "Audio");
    EXPECT_EQ(kinds[1], "System");
}

TEST(ConfigTest, StringListSkipsNonStrings) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kinds": ["Audio", 3, null, "UI"]})"));

    auto kinds = cfg.getStringList("kinds");
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[1], "UI");
}

TEST(ConfigTest, StringListDefaultWhenNotArray) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kinds": "Audio"})"));

    auto kinds = cfg.getStringList("kinds", {"fallback"});
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], "fallback");
    EXPECT_TRUE(cfg.getStringList("missing").empty());
}

TEST(ConfigTest, EmptyStringListIsNotDefault) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"kinds": []})"));
    EXPECT_TRUE(cfg.getStringList("kinds", {"fallback"}).empty());
}

// =============================================================================
// Raw JSON Access
// =============================================================================

TEST(ConfigTest, RawAccess) {
    Config cfg;
    ASSERT_TRUE(cfg.loadFromString(R"({"x": 10})"));

    const auto& raw = cfg.raw();
    EXPECT_TRUE(raw.contains("x"));
    EXPECT_EQ(raw["x"], 10);
}

TEST(ConfigTest, RawEmptyConfig) {
    Config cfg;
    EXPECT_TRUE(cfg.raw().empty());
}

// =============================================================================
// Merging a local overlay
// =============================================================================

class ConfigMergeTest : public ::testing::Test {
protected:
    std::string basePath;
    std::string overlayPath;

    void SetUp() override {
        auto dir = std::filesystem::temp_directory_path();
        basePath = (dir / "tether_test_config.json").string();
        overlayPath = (dir / "tether_test_config.local.json").string();
    }

    void TearDown() override {
        std::remove(basePath.c_str());
        std::remove(overlayPath.c_str());
    }

    static void writeFile(const std::string& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }
};

TEST_F(ConfigMergeTest, OverlayOverridesAndPreserves) {
    writeFile(basePath, R"({"memory": {"history_limit": 100, "spike_ratio": 0.2}, "name": "base"})");
    writeFile(overlayPath, R"({"memory": {"history_limit": 10}})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    ASSERT_TRUE(cfg.mergeFromFile(overlayPath));

    EXPECT_EQ(cfg.getInt("memory.history_limit"), 10);
    EXPECT_DOUBLE_EQ(cfg.getDouble("memory.spike_ratio"), 0.2);
    EXPECT_EQ(cfg.getString("name"), "base");
}

TEST_F(ConfigMergeTest, OverlayAddsNewKeys) {
    writeFile(basePath, R"({"a": 1})");
    writeFile(overlayPath, R"({"b": {"c": true}})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    ASSERT_TRUE(cfg.mergeFromFile(overlayPath));
    EXPECT_EQ(cfg.getInt("a"), 1);
    EXPECT_TRUE(cfg.getBool("b.c"));
}

TEST_F(ConfigMergeTest, NonObjectReplacesObject) {
    writeFile(basePath, R"({"lifecycle": {"critical_kinds": ["Audio"]}})");
    writeFile(overlayPath, R"({"lifecycle": {"critical_kinds": []}})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    ASSERT_TRUE(cfg.mergeFromFile(overlayPath));
    EXPECT_TRUE(cfg.getStringList("lifecycle.critical_kinds").empty());
}

TEST_F(ConfigMergeTest, MissingOverlayLeavesConfigUnchanged) {
    writeFile(basePath, R"({"a": 1})");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    EXPECT_FALSE(cfg.mergeFromFile(overlayPath));
    EXPECT_EQ(cfg.getInt("a"), 1);
}

TEST_F(ConfigMergeTest, InvalidOverlayLeavesConfigUnchanged) {
    writeFile(basePath, R"({"a": 1})");
    writeFile(overlayPath, "{not json");

    Config cfg;
    ASSERT_TRUE(cfg.loadFromFile(basePath));
    EXPECT_FALSE(cfg.mergeFromFile(overlayPath));
    EXPECT_EQ(cfg.getInt("a"), 1);
}
