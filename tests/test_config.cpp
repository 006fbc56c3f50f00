/**
 * @file test_config.cpp
 * @brief 游戏配置读取单元测试
 */

#include <gtest/gtest.h>
#include "game/config.h"
#include "test_helpers.h"

#include <fstream>

using namespace Meadow;
namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir = Testing::MakeTempDir("config"); }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string Write(const std::string& text) {
        fs::path p = dir / "game.json";
        std::ofstream(p) << text;
        return p.string();
    }

    fs::path dir;
};

TEST_F(ConfigTest, DefaultValues) {
    GameConfig cfg;
    EXPECT_EQ(cfg.WindowSize, glm::ivec2(960, 640));
    EXPECT_EQ(cfg.TileSize, 48);
    EXPECT_EQ(cfg.GridSize, glm::ivec2(20, 13));
    EXPECT_FLOAT_EQ(cfg.Actions.MoveSpeed, 120.0f);
    EXPECT_FLOAT_EQ(cfg.Actions.ToolUseTime, 0.35f);
    EXPECT_FLOAT_EQ(cfg.Actions.SwitchCooldown, 0.2f);
    EXPECT_EQ(cfg.RainOneIn, 3u);
    EXPECT_EQ(cfg.Hotbar.size(), 5u);
    EXPECT_EQ(cfg.DefaultSaveSlot, 1u);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    GameConfig cfg;
    cfg.StartingMoney = 3;
    EXPECT_TRUE(LoadGameConfig((dir / "nope.json").string(), cfg));
    EXPECT_EQ(cfg.StartingMoney, 3);
}

TEST_F(ConfigTest, PartialFileOverridesOnlyGivenKeys) {
    auto path = Write(R"({
        "tile_size": 32,
        "starting_money": 50,
        "rain_one_in": 0,
        "actions": { "move_speed": 200, "tool_offsets": { "up": [0, -10] } },
        "crops": [ { "id": "wheat", "frames": 5, "seed_price": 2, "sell_price": 6 } ],
        "auto_harvest": false
    })");

    GameConfig cfg;
    ASSERT_TRUE(LoadGameConfig(path, cfg));
    EXPECT_EQ(cfg.TileSize, 32);
    EXPECT_EQ(cfg.GridSize, glm::ivec2(30, 20));     // 由窗口推导
    EXPECT_EQ(cfg.StartingMoney, 50);
    EXPECT_EQ(cfg.RainOneIn, 0u);
    EXPECT_FLOAT_EQ(cfg.Actions.MoveSpeed, 200.0f);
    EXPECT_FLOAT_EQ(cfg.Actions.ToolUseTime, 0.35f);
    EXPECT_EQ(cfg.Actions.ToolOffsets[(u8)Direction::Up], glm::vec2(0.0f, -10.0f));
    EXPECT_EQ(cfg.Actions.ToolOffsets[(u8)Direction::Down], glm::vec2(0.0f, 50.0f));
    ASSERT_EQ(cfg.Crops.size(), 1u);
    EXPECT_EQ(cfg.Crops[0].ID, "wheat");
    EXPECT_EQ(cfg.Crops[0].MaxStage(), 4u);
    EXPECT_FALSE(cfg.AutoHarvestOnContact);
    EXPECT_EQ(cfg.DataDir, "data");
}

TEST_F(ConfigTest, MalformedFileLeavesConfigUntouched) {
    auto path = Write(R"({ "tile_size": 32, )");
    GameConfig cfg;
    cfg.StartingMoney = 8;
    EXPECT_FALSE(LoadGameConfig(path, cfg));
    EXPECT_EQ(cfg.TileSize, 48);
    EXPECT_EQ(cfg.StartingMoney, 8);
}

TEST_F(ConfigTest, WrongTypeIsRejected) {
    auto path = Write(R"({ "starting_money": "lots" })");
    GameConfig cfg;
    EXPECT_FALSE(LoadGameConfig(path, cfg));
    EXPECT_EQ(cfg.StartingMoney, 0);
}

TEST_F(ConfigTest, NonPositiveTileSizeIsRejected) {
    auto path = Write(R"({ "tile_size": 0 })");
    GameConfig cfg;
    EXPECT_FALSE(LoadGameConfig(path, cfg));
    EXPECT_EQ(cfg.TileSize, 48);
}
