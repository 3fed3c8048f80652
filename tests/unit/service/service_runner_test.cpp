/// @file service_runner_test.cpp
/// @brief Unit tests for config path resolution, RunnerConfig and ShutdownSignal.

#include <gtest/gtest.h>

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>

#include "tadv/foundation/game_logger.hpp"
#include "tadv/service/service_runner.hpp"

using namespace tadv::service;
using namespace std::chrono_literals;
using tadv::foundation::ErrorCode;
using tadv::foundation::GameLogger;
using tadv::foundation::LogCategory;
using tadv::foundation::LogLevel;

namespace {

/// Sets or clears TADV_CONFIG_PATH for one test and restores it afterwards.
class ConfigPathEnv {
public:
    explicit ConfigPathEnv(const char* value) {
        if (const char* old = std::getenv("TADV_CONFIG_PATH")) {
            saved_ = old;
            hadValue_ = true;
        }
        if (value != nullptr) {
            setenv("TADV_CONFIG_PATH", value, 1);
        } else {
            unsetenv("TADV_CONFIG_PATH");
        }
    }

    ~ConfigPathEnv() {
        if (hadValue_) {
            setenv("TADV_CONFIG_PATH", saved_.c_str(), 1);
        } else {
            unsetenv("TADV_CONFIG_PATH");
        }
    }

    ConfigPathEnv(const ConfigPathEnv&) = delete;
    ConfigPathEnv& operator=(const ConfigPathEnv&) = delete;

private:
    std::string saved_;
    bool hadValue_ = false;
};

} // namespace

// ============================================================================
// resolveConfigPath
// ============================================================================

TEST(ResolveConfigPathTest, FlagWithSeparateValue) {
    ConfigPathEnv env("/etc/tadv/from_env.yaml");
    char arg0[] = "turtle_adventure";
    char arg1[] = "--config";
    char arg2[] = "/tmp/level2.yaml";
    char* argv[] = {arg0, arg1, arg2};

    EXPECT_EQ(resolveConfigPath(3, argv, "default.yaml"),
              std::filesystem::path("/tmp/level2.yaml"));
}

TEST(ResolveConfigPathTest, FlagWithEqualsValue) {
    ConfigPathEnv env(nullptr);
    char arg0[] = "turtle_adventure";
    char arg1[] = "--verbose";
    char arg2[] = "--config=/tmp/level3.yaml";
    char* argv[] = {arg0, arg1, arg2};

    EXPECT_EQ(resolveConfigPath(3, argv, "default.yaml"),
              std::filesystem::path("/tmp/level3.yaml"));
}

TEST(ResolveConfigPathTest, EnvironmentBeatsFallback) {
    ConfigPathEnv env("/etc/tadv/from_env.yaml");
    char arg0[] = "turtle_adventure";
    char arg1[] = "--config";
    char* argv[] = {arg0, arg1};

    // A trailing --config without a value is ignored.
    EXPECT_EQ(resolveConfigPath(2, argv, "default.yaml"),
              std::filesystem::path("/etc/tadv/from_env.yaml"));
}

TEST(ResolveConfigPathTest, FallbackWhenNothingElseIsSet) {
    ConfigPathEnv env("");
    char arg0[] = "turtle_adventure";
    char arg1[] = "--config=";
    char* argv[] = {arg0, arg1};

    EXPECT_EQ(resolveConfigPath(2, argv, "config/turtle_adventure.yaml"),
              std::filesystem::path("config/turtle_adventure.yaml"));
}

// ============================================================================
// loadRunnerConfig
// ============================================================================

class RunnerConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() /
               (std::string("tadv_runner_") + info->name());
        std::filesystem::create_directories(dir_);
        savedEnemyLevel_ = GameLogger::instance().getCategoryLevel(LogCategory::Enemy);
    }

    void TearDown() override {
        GameLogger::instance().setCategoryLevel(LogCategory::Enemy, savedEnemyLevel_);
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& body) {
        auto path = dir_ / "runner.yaml";
        std::ofstream out(path);
        out << body;
        return path;
    }

    std::filesystem::path dir_;
    LogLevel savedEnemyLevel_ = LogLevel::Debug;
};

TEST_F(RunnerConfigTest, ReadsHostFrameRateAndClicks) {
    auto path = write(R"(
level: 2
host:
  tick_interval_ms: 25
  frame_rate: 30
demo:
  clicks:
    - [700, 300]
    - [12.5, 40]
)");

    auto loaded = loadRunnerConfig(path);
    ASSERT_TRUE(loaded.hasValue()) << loaded.error().message();
    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.host.session.level, 2u);
    EXPECT_EQ(cfg.host.tickInterval, 25ms);
    EXPECT_EQ(cfg.frameRate, 30u);
    ASSERT_EQ(cfg.clicks.size(), 2u);
    EXPECT_DOUBLE_EQ(cfg.clicks[0].x, 700.0);
    EXPECT_DOUBLE_EQ(cfg.clicks[0].y, 300.0);
    EXPECT_DOUBLE_EQ(cfg.clicks[1].x, 12.5);
}

TEST_F(RunnerConfigTest, EmptyFileGivesDefaults) {
    auto loaded = loadRunnerConfig(write(""));
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(loaded.value().frameRate, 60u);
    EXPECT_EQ(loaded.value().host.tickInterval, 30ms);
    EXPECT_TRUE(loaded.value().clicks.empty());
}

TEST_F(RunnerConfigTest, AppliesLoggingLevels) {
    auto loaded = loadRunnerConfig(write("logging:\n  enemy: error\n"));
    ASSERT_TRUE(loaded.hasValue());
    EXPECT_EQ(GameLogger::instance().getCategoryLevel(LogCategory::Enemy), LogLevel::Error);
}

TEST_F(RunnerConfigTest, UnknownLoggingLevelFails) {
    auto loaded = loadRunnerConfig(write("logging:\n  enemy: loud\n"));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::LoggerLevelUnknown);
}

TEST_F(RunnerConfigTest, ClickMustBeAPair) {
    auto loaded = loadRunnerConfig(write("demo:\n  clicks:\n    - [700, 300]\n    - [5]\n"));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidConfiguration);
    EXPECT_EQ(loaded.error().message(), "demo.clicks[1] must be an [x, y] pair");
}

TEST_F(RunnerConfigTest, ZeroFrameRateFails) {
    auto loaded = loadRunnerConfig(write("host:\n  frame_rate: 0\n"));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidConfiguration);
}

TEST_F(RunnerConfigTest, ZeroTickIntervalFails) {
    auto loaded = loadRunnerConfig(write("host:\n  tick_interval_ms: 0\n"));
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::InvalidConfiguration);
}

TEST_F(RunnerConfigTest, MissingFileFails) {
    auto loaded = loadRunnerConfig(dir_ / "nowhere.yaml");
    ASSERT_TRUE(loaded.hasError());
    EXPECT_EQ(loaded.error().code(), ErrorCode::ConfigLoadFailed);
}

// ============================================================================
// ShutdownSignal
// ============================================================================

TEST(ShutdownSignalTest, LatchesSigterm) {
    ShutdownSignal shutdown;
    EXPECT_FALSE(shutdown.raised());

    ASSERT_EQ(std::raise(SIGTERM), 0);
    EXPECT_TRUE(shutdown.raised());
}

TEST(ShutdownSignalTest, FreshInstanceStartsClear) {
    {
        ShutdownSignal first;
        ASSERT_EQ(std::raise(SIGINT), 0);
        EXPECT_TRUE(first.raised());
    }
    ShutdownSignal second;
    EXPECT_FALSE(second.raised());
}
