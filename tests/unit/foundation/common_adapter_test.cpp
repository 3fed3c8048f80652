#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "tadv/foundation/config_manager.hpp"
#include "tadv/foundation/error_code.hpp"
#include "tadv/foundation/game_error.hpp"
#include "tadv/foundation/game_result.hpp"
#include "tadv/foundation/signal.hpp"
#include "tadv/foundation/types.hpp"

using namespace tadv::foundation;

// --- Errors and results ---

TEST(ErrorCodeTest, RangeNamesTheSubsystem) {
    EXPECT_EQ(errorSubsystem(ErrorCode::Unknown), "General");
    EXPECT_EQ(errorSubsystem(ErrorCode::ConfigTypeMismatch), "Config");
    EXPECT_EQ(errorSubsystem(ErrorCode::LoggerLevelUnknown), "Logger");
    EXPECT_EQ(errorSubsystem(ErrorCode::SessionFinished), "Game");
    EXPECT_EQ(errorSubsystem(ErrorCode::HostAlreadyStarted), "Host");
    EXPECT_EQ(errorSubsystem(static_cast<ErrorCode>(0x0500)), "Unknown");
}

TEST(GameErrorTest, DefaultIsUnknownWithoutContext) {
    GameError err;
    EXPECT_EQ(err.code(), ErrorCode::Unknown);
    EXPECT_TRUE(err.message().empty());
    EXPECT_FALSE(err.hasContext());
    EXPECT_FALSE(err.isSuccess());
}

TEST(GameErrorTest, RejectedValueTravelsAsContext) {
    GameError err(ErrorCode::InvalidConfiguration, "player.speed must be positive", -2.5);
    EXPECT_EQ(err.subsystem(), "Game");
    ASSERT_TRUE(err.hasContext());

    const auto* speed = err.context<double>();
    ASSERT_NE(speed, nullptr);
    EXPECT_DOUBLE_EQ(*speed, -2.5);
    EXPECT_EQ(err.context<float>(), nullptr);
}

TEST(GameResultTest, CarriesEitherValueOrError) {
    auto level = GameResult<uint32_t>::ok(3u);
    ASSERT_TRUE(level);
    EXPECT_EQ(level.value(), 3u);

    auto finished = GameResult<void>::err(
        GameError(ErrorCode::SessionFinished, "tick after game over"));
    ASSERT_FALSE(finished);
    EXPECT_TRUE(finished.hasError());
    EXPECT_EQ(finished.error().code(), ErrorCode::SessionFinished);
    EXPECT_EQ(finished.error().message(), "tick after game over");

    EXPECT_TRUE(GameResult<void>::ok().hasValue());
}

// --- Strong ids ---

TEST(StrongIdTest, ZeroIsNoEntity) {
    EXPECT_FALSE(EntityId().isValid());
    EXPECT_FALSE(EntityId(0).isValid());
    EXPECT_TRUE(EntityId(1).isValid());
    EXPECT_TRUE(EventId(7).isValid());
}

TEST(StrongIdTest, OrdersAndHashesByValue) {
    EXPECT_EQ(EntityId(2), EntityId(2));
    EXPECT_LT(EntityId(2), EntityId(5));

    std::unordered_set<EntityId> caught{EntityId(4), EntityId(9), EntityId(4)};
    EXPECT_EQ(caught.size(), 2u);
    EXPECT_EQ(caught.count(EntityId(9)), 1u);
    EXPECT_EQ(caught.count(EntityId(1)), 0u);
}

// --- Signal ---

TEST(SignalTest, SlotsFireInConnectOrder) {
    Signal<uint32_t> levelStarted;
    std::vector<std::string> seen;
    levelStarted.connect([&](uint32_t level) { seen.push_back("hud" + std::to_string(level)); });
    levelStarted.connect([&](uint32_t level) { seen.push_back("log" + std::to_string(level)); });

    levelStarted.emit(2);
    EXPECT_EQ(seen, (std::vector<std::string>{"hud2", "log2"}));
}

TEST(SignalTest, DisconnectedSlotStaysSilent) {
    Signal<> gameOver;
    int banners = 0;
    auto id = gameOver.connect([&] { ++banners; });
    gameOver.disconnect(id);

    gameOver.emit();
    EXPECT_EQ(banners, 0);
    EXPECT_EQ(gameOver.slotCount(), 0u);
}

TEST(SignalTest, OneShotSlotMayDisconnectWhileFiring) {
    Signal<> gameOver;
    int banners = 0;
    Signal<>::SlotId once = 0;
    once = gameOver.connect([&] {
        ++banners;
        gameOver.disconnect(once);
    });

    gameOver.emit();
    gameOver.emit();
    EXPECT_EQ(banners, 1);
}

// --- ConfigManager ---

class ConfigManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = std::filesystem::temp_directory_path() / (std::string("tadv_cfg_") + info->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& name, const std::string& body) {
        auto path = dir_ / name;
        std::ofstream out(path);
        out << body;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(ConfigManagerTest, NestedMapsBecomeDottedKeys) {
    auto path = write("arena.yaml", R"(
arena:
  width: 640
  height: 480
player:
  speed: 2.5
)");

    ConfigManager config;
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.size(), 3u);
    EXPECT_EQ(config.source(), path.string());
    EXPECT_EQ(config.get<int>("arena.width").value(), 640);
    EXPECT_DOUBLE_EQ(config.get<double>("player.speed").value(), 2.5);
    EXPECT_FALSE(config.hasKey("arena"));
}

TEST_F(ConfigManagerTest, ErrorsNameKeyAndSource) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("level: three", "levels.yaml"));

    auto missing = config.get<int>("arena.width");
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code(), ErrorCode::ConfigKeyNotFound);
    EXPECT_EQ(missing.error().message(), "arena.width is not set in levels.yaml");

    auto mistyped = config.get<uint32_t>("level");
    ASSERT_FALSE(mistyped);
    EXPECT_EQ(mistyped.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_EQ(mistyped.error().message(), "level in levels.yaml has the wrong type: 'three'");
}

TEST_F(ConfigManagerTest, GetOrFallsBackOnMissingOrMistyped) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("level: three\nhome:\n  size: 30\n"));

    EXPECT_EQ(config.getOr<uint32_t>("level", 1u), 1u);
    EXPECT_EQ(config.getOr<uint32_t>("enemies.size", 20u), 20u);
    EXPECT_EQ(config.getOr<uint32_t>("home.size", 20u), 30u);
}

TEST_F(ConfigManagerTest, ReadIntoKeepsDefaultForMissingKey) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("player:\n  speed: 7.5\n"));

    double speed = 5.0;
    double homeSize = 20.0;
    ASSERT_TRUE(config.readInto("player.speed", speed));
    ASSERT_TRUE(config.readInto("home.size", homeSize));
    EXPECT_DOUBLE_EQ(speed, 7.5);
    EXPECT_DOUBLE_EQ(homeSize, 20.0);
}

TEST_F(ConfigManagerTest, ReadIntoLeavesTargetOnTypeMismatch) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("arena:\n  width: [800]\n"));

    double width = 800.0;
    auto result = config.readInto("arena.width", width);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigTypeMismatch);
    EXPECT_NE(result.error().message().find("a sequence"), std::string_view::npos);
    EXPECT_DOUBLE_EQ(width, 800.0);
}

TEST_F(ConfigManagerTest, SequenceLeafReadsWhole) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(R"(
demo:
  clicks:
    - [700, 300]
    - [10.5, 20]
)"));

    auto clicks = config.get<std::vector<std::vector<double>>>("demo.clicks");
    ASSERT_TRUE(clicks);
    ASSERT_EQ(clicks.value().size(), 2u);
    EXPECT_DOUBLE_EQ(clicks.value()[0][1], 300.0);
    EXPECT_DOUBLE_EQ(clicks.value()[1][0], 10.5);
}

TEST_F(ConfigManagerTest, EmptyDocumentIsEmptyConfig) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("", "empty.yaml"));
    EXPECT_EQ(config.size(), 0u);
    EXPECT_EQ(config.source(), "empty.yaml");
}

TEST_F(ConfigManagerTest, MissingFileIsLoadFailure) {
    ConfigManager config;
    auto result = config.load(dir_ / "absent.yaml");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ConfigLoadFailed);
    EXPECT_NE(result.error().message().find("config file not found"), std::string_view::npos);
    EXPECT_TRUE(config.source().empty());
}

TEST_F(ConfigManagerTest, FailedLoadKeepsPreviousContents) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("level: 2", "good.yaml"));

    auto broken = write("broken.yaml", "arena: [800, 600");
    EXPECT_EQ(config.load(broken).error().code(), ErrorCode::ConfigLoadFailed);

    auto scalarTop = config.loadFromString("- 1\n- 2\n", "list.yaml");
    ASSERT_FALSE(scalarTop);
    EXPECT_EQ(scalarTop.error().message(), "list.yaml: top level must be a mapping");

    EXPECT_EQ(config.source(), "good.yaml");
    EXPECT_EQ(config.get<int>("level").value(), 2);
}

TEST_F(ConfigManagerTest, SuccessfulReloadReplacesEverything) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString("level: 1\nplayer:\n  speed: 5\n", "first.yaml"));
    ASSERT_TRUE(config.loadFromString("level: 4\n", "second.yaml"));

    EXPECT_FALSE(config.hasKey("player.speed"));
    EXPECT_EQ(config.get<int>("level").value(), 4);
    EXPECT_EQ(config.source(), "second.yaml");
}
