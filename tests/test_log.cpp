#include <gtest/gtest.h>
#include "core/Log.hpp"

#include <filesystem>
#include <fstream>
#include <string>

using namespace tether;

class LogTest : public ::testing::Test {
protected:
    void SetUp() override {
        spdlog::drop_all();
    }

    void TearDown() override {
        spdlog::drop_all();
    }
};

TEST_F(LogTest, LoggersUsableBeforeInit) {
    ASSERT_NE(Log::getRuntimeLogger(), nullptr);
    ASSERT_NE(Log::getServiceLogger(), nullptr);
    EXPECT_NO_THROW(LOG_INFO("logged before init"));
    EXPECT_NO_THROW(SVC_LOG_WARN("service message before init"));
}

TEST_F(LogTest, InitWithDefaults) {
    ASSERT_NO_THROW(Log::init());
    EXPECT_TRUE(Log::isInitialized());
    EXPECT_NE(Log::getRuntimeLogger(), nullptr);
    EXPECT_NE(Log::getServiceLogger(), nullptr);
}

TEST_F(LogTest, InitWithLogLevel) {
    Log::init("", "warn");
    EXPECT_EQ(Log::getRuntimeLogger()->level(), spdlog::level::warn);
    EXPECT_EQ(Log::getServiceLogger()->level(), spdlog::level::warn);
}

TEST_F(LogTest, UnknownLevelFallsBackToInfo) {
    Log::init("", "verbose");
    EXPECT_EQ(Log::getRuntimeLogger()->level(), spdlog::level::info);
}

TEST_F(LogTest, RuntimeAndServiceLoggersAreSeparate) {
    Log::init();
    EXPECT_EQ(Log::getRuntimeLogger()->name(), "RUNTIME");
    EXPECT_EQ(Log::getServiceLogger()->name(), "SERVICE");
}

TEST_F(LogTest, ReinitReplacesRegisteredLoggers) {
    Log::init("", "info");
    ASSERT_NO_THROW(Log::init("", "debug"));
    EXPECT_EQ(Log::getRuntimeLogger()->level(), spdlog::level::debug);
    EXPECT_EQ(spdlog::get("RUNTIME"), Log::getRuntimeLogger());
}

TEST_F(LogTest, AllLogLevels) {
    for (const auto& level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        spdlog::drop_all();
        ASSERT_NO_THROW(Log::init("", level));
    }
}

TEST_F(LogTest, AllMacroLevels) {
    Log::init("", "trace");
    EXPECT_NO_THROW(LOG_TRACE("trace message"));
    EXPECT_NO_THROW(LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(LOG_INFO("info message"));
    EXPECT_NO_THROW(LOG_WARN("warn message"));
    EXPECT_NO_THROW(LOG_ERROR("error message"));
    EXPECT_NO_THROW(LOG_CRITICAL("critical message"));
    EXPECT_NO_THROW(SVC_LOG_TRACE("trace message"));
    EXPECT_NO_THROW(SVC_LOG_DEBUG("debug message"));
    EXPECT_NO_THROW(SVC_LOG_INFO("info message"));
    EXPECT_NO_THROW(SVC_LOG_WARN("warn message"));
    EXPECT_NO_THROW(SVC_LOG_ERROR("error message"));
    EXPECT_NO_THROW(SVC_LOG_CRITICAL("critical message"));
}

TEST_F(LogTest, MacrosWithFormatArgs) {
    Log::init();
    EXPECT_NO_THROW(LOG_INFO("Resource {} moved to {}", "audio.capture", "Ready"));
    EXPECT_NO_THROW(SVC_LOG_INFO("Buffer {} frames", 64000));
}

TEST_F(LogTest, ShutdownSafe) {
    Log::init();
    EXPECT_NO_THROW(Log::shutdown());
    EXPECT_FALSE(Log::isInitialized());
}

TEST_F(LogTest, ShutdownWithoutInitSafe) {
    EXPECT_NO_THROW(Log::shutdown());
}

TEST_F(LogTest, ReinitAfterShutdown) {
    Log::init();
    Log::shutdown();
    spdlog::drop_all();

    ASSERT_NO_THROW(Log::init());
    EXPECT_NE(Log::getRuntimeLogger(), nullptr);
    EXPECT_NE(Log::getServiceLogger(), nullptr);
}

class LogFileTest : public ::testing::Test {
protected:
    std::string logPath;

    void SetUp() override {
        spdlog::drop_all();
        logPath = (std::filesystem::temp_directory_path() / "tether_test_log.txt").string();
        std::filesystem::remove(logPath);
    }

    void TearDown() override {
        spdlog::drop_all();
        std::filesystem::remove(logPath);
    }
};

TEST_F(LogFileTest, FileLogging) {
    Log::init(logPath, "debug");
    LOG_INFO("File log test message");
    Log::getRuntimeLogger()->flush();

    std::ifstream f(logPath);
    ASSERT_TRUE(f.good()) << "Log file should have been created";
    std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    EXPECT_NE(content.find("File log test message"), std::string::npos);
}
