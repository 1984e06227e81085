#include <gtest/gtest.h>
#include "TestResources.hpp"
#include "core/Log.hpp"
#include "lifecycle/SignalBridge.hpp"
#include "runtime/Runtime.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace tether;
using namespace tether::test;
namespace fs = std::filesystem;

namespace {

/// Polls `condition` for up to two seconds.
template <typename Predicate>
bool waitFor(Predicate condition) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return condition();
}

} // namespace

class RuntimeTest : public ::testing::Test {
protected:
    std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
    std::shared_ptr<AdjustableSampler::State> samplerState = std::make_shared<AdjustableSampler::State>();
    std::unique_ptr<Runtime> runtime = std::make_unique<Runtime>();

    Config testConfig() {
        Config config;
        config.loadFromString(R"({
            "memory": {"sample_interval_seconds": 0.05, "emergency_pause_ms": 0},
            "runtime": {"loop_interval_ms": 2, "suspend_gap_seconds": 30}
        })");
        return config;
    }

    void initRuntime() {
        ASSERT_TRUE(runtime->init(testConfig(), std::make_unique<AdjustableSampler>(samplerState),
                                  clock, false));
    }
};

TEST_F(RuntimeTest, InitBuildsComponents) {
    EXPECT_FALSE(runtime->isInitialized());
    initRuntime();

    EXPECT_TRUE(runtime->isInitialized());
    EXPECT_EQ(runtime->settings().loopIntervalMs, 2);
    EXPECT_EQ(runtime->registry().count(), 0u);
    EXPECT_EQ(runtime->coordinator().currentPhase(), LifecyclePhase::Launching);
    EXPECT_FALSE(runtime->monitor().isRunning());
    EXPECT_FALSE(SignalBridge::isInstalled());
}

TEST_F(RuntimeTest, DoubleInitIsRejected) {
    initRuntime();
    EXPECT_FALSE(runtime->init(testConfig(), nullptr, clock, false));
}

TEST_F(RuntimeTest, RunLaunchesAndShutsDown) {
    initRuntime();
    auto recorder = std::make_shared<HookRecorder>();
    ASSERT_TRUE(runtime->registry().registerResource(
        makeFake("audio", ResourceKind::Audio, recorder)));

    std::thread loop([this] { runtime->run(); });

    ASSERT_TRUE(waitFor([this] {
        return runtime->coordinator().currentPhase() == LifecyclePhase::Active;
    }));
    EXPECT_TRUE(runtime->monitor().isRunning());
    EXPECT_EQ(recorder->count("initialize:audio"), 1u);

    runtime->requestShutdown();
    loop.join();

    EXPECT_EQ(runtime->coordinator().currentPhase(), LifecyclePhase::Terminating);
    EXPECT_EQ(recorder->count("dispose:audio"), 1u);
    EXPECT_FALSE(runtime->monitor().isRunning());

    runtime->shutdown();
    runtime->shutdown();
    EXPECT_FALSE(runtime->isInitialized());
}

TEST_F(RuntimeTest, ClockJumpIsReportedAsResume) {
    initRuntime();
    std::atomic<int> resumes{0};
    std::atomic<double> gap{0.0};
    runtime->eventBus().on("runtime.resumed", [&](const EventData& data) {
        gap = data.getDouble("gapSeconds");
        ++resumes;
    });

    std::thread loop([this] { runtime->run(); });
    ASSERT_TRUE(waitFor([this] {
        return runtime->coordinator().currentPhase() == LifecyclePhase::Active;
    }));
    // Let the loop take its first tick before the jump.
    std::this_thread::sleep_for(std::chrono::milliseconds(50));

    clock->advance(Seconds(60));
    EXPECT_TRUE(waitFor([&] { return resumes.load() == 1; }));
    EXPECT_GE(gap.load(), 60.0);

    runtime->requestShutdown();
    loop.join();
    EXPECT_EQ(resumes.load(), 1);
}

TEST_F(RuntimeTest, StateChangesArePublished) {
    initRuntime();
    std::vector<std::string> changes;
    runtime->eventBus().on("resource.state_changed", [&](const EventData& data) {
        changes.push_back(data.getString("id") + ":" + data.getString("to"));
    });

    ASSERT_TRUE(runtime->registry().registerResource(makeFake("audio", ResourceKind::Audio)));
    ASSERT_TRUE(runtime->registry().initialize("audio"));
    ASSERT_TRUE(runtime->registry().activate("audio"));

    ASSERT_GE(changes.size(), 2u);
    EXPECT_EQ(changes.back(), "audio:Active");
}

TEST_F(RuntimeTest, ExportState) {
    EXPECT_TRUE(runtime->exportState().empty());

    initRuntime();
    auto j = runtime->exportState();
    EXPECT_EQ(j["version"], kRuntimeVersion);
    EXPECT_TRUE(j.contains("registry"));
    EXPECT_TRUE(j.contains("memory"));
    EXPECT_EQ(j["lifecycle"]["statistics"]["phase"], "Launching");
}

TEST_F(RuntimeTest, ShutdownWithoutRunTerminates) {
    initRuntime();
    auto recorder = std::make_shared<HookRecorder>();
    ASSERT_TRUE(runtime->registry().registerResource(
        makeFake("watcher", ResourceKind::File, recorder)));
    ASSERT_TRUE(runtime->registry().initialize("watcher"));

    runtime->shutdown();
    EXPECT_EQ(recorder->count("dispose:watcher"), 1u);
    EXPECT_FALSE(runtime->isInitialized());
}

TEST_F(RuntimeTest, RunBeforeInitReturns) {
    runtime->run();
    EXPECT_FALSE(runtime->isInitialized());
}

// =============================================================================
// Config files
// =============================================================================

class RuntimeConfigFileTest : public ::testing::Test {
protected:
    fs::path dir;

    void SetUp() override {
        dir = fs::temp_directory_path() / "tether_runtime_test";
        fs::remove_all(dir);
        fs::create_directories(dir);
    }

    void TearDown() override {
        Log::shutdown();
        fs::remove_all(dir);
    }

    void write(const std::string& name, const std::string& content) {
        std::ofstream(dir / name) << content;
    }
};

TEST_F(RuntimeConfigFileTest, LocalOverlayIsMerged) {
    write("tether.json", R"({
        "logging": {"level": "warn"},
        "runtime": {"loop_interval_ms": 100},
        "lifecycle": {"critical_kinds": ["Audio"]}
    })");
    write("tether.local.json", R"({"runtime": {"loop_interval_ms": 7}})");

    Runtime runtime;
    ASSERT_TRUE(runtime.init((dir / "tether.json").string()));
    EXPECT_EQ(runtime.settings().loopIntervalMs, 7);
    EXPECT_EQ(runtime.settings().logLevel, "warn");
    EXPECT_EQ(runtime.settings().lifecycle.criticalKinds.size(), 1u);
    EXPECT_TRUE(SignalBridge::isInstalled());

    runtime.shutdown();
    EXPECT_FALSE(SignalBridge::isInstalled());
}

TEST_F(RuntimeConfigFileTest, MissingConfigUsesDefaults) {
    Runtime runtime;
    ASSERT_TRUE(runtime.init((dir / "absent.json").string()));
    EXPECT_EQ(runtime.settings().loopIntervalMs, 250);
    runtime.shutdown();
}

TEST_F(RuntimeConfigFileTest, SnapshotWrittenOnShutdown) {
    const fs::path snapshot = dir / "state" / "snapshot.json";
    write("tether.json", "{\"lifecycle\": {\"snapshot_path\": \"" + snapshot.string() + "\"}}");

    Runtime runtime;
    ASSERT_TRUE(runtime.init((dir / "tether.json").string()));
    runtime.shutdown();

    ASSERT_TRUE(fs::exists(snapshot));
    std::ifstream in(snapshot);
    auto j = nlohmann::json::parse(in);
    EXPECT_EQ(j["phase"], "Launching");
}
