/**
 * @file test_farm_session.cpp
 * @brief 农场会话集成测试
 *
 * 日切流程 (生长/清水/降雨/自动存档)、快照恢复与玩家重定位、接触收获。
 */

#include <gtest/gtest.h>
#include "game/farm_session.h"
#include "test_helpers.h"

#include <fstream>

using namespace Meadow;
namespace fs = std::filesystem;

class FarmSessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = Testing::MakeTempDir("session");
        config.DataDir = dir.string();
        config.RainOneIn = 0;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    /// 直接在土壤上种一株并浇水
    static void PlantWatered(FarmSession& s, i32 x, i32 y, const std::string& type) {
        s.GetSoil().Till(x, y);
        s.GetSoil().Plant(x, y, type);
        s.GetSoil().Water(x, y);
    }

    fs::path dir;
    GameConfig config;
};

// ── 初始状态 ────────────────────────────────────────────────

TEST_F(FarmSessionTest, StartsFromConfig) {
    config.StartingMoney = 15;
    FarmSession session(config, 1);

    auto& p = session.GetPlayer();
    EXPECT_EQ(session.GetDay(), 1);
    EXPECT_EQ(p.Money, 15);
    EXPECT_EQ(p.Seeds.CountItem("corn"), 5u);
    EXPECT_EQ(p.Position, glm::vec2(480.0f, 320.0f));
    EXPECT_EQ(p.SelectedTool, ToolType::Hoe);
    EXPECT_EQ(session.GetSoil().GetWidth(), 20u);
    EXPECT_EQ(session.GetSoil().GetHeight(), 13u);
    EXPECT_EQ(session.GetSoil().CountFlag(TileFlag::Farmable), 20u * 13u);
    EXPECT_EQ(session.GetTrees().CountAlive(), 2u);
}

// ── 日切 ────────────────────────────────────────────────────

TEST_F(FarmSessionTest, SleepAdvancesDayAfterTransition) {
    config.DayTransitionTime = 1.0f;
    FarmSession session(config, 1);

    EXPECT_TRUE(session.Sleep());
    EXPECT_FALSE(session.Sleep());
    session.Update(0.5f, PlayerInput{});
    EXPECT_EQ(session.GetDay(), 1);
    session.Update(0.6f, PlayerInput{});
    EXPECT_EQ(session.GetDay(), 2);
    EXPECT_FALSE(session.GetDayCycle().IsRunning());
}

TEST_F(FarmSessionTest, DayAdvanceGrowsWateredCropsAndClearsWater) {
    FarmSession session(config, 1);
    PlantWatered(session, 2, 2, "corn");
    session.GetSoil().Till(5, 5);
    session.GetSoil().Plant(5, 5, "tomato");    // 没浇水

    session.AdvanceDay();

    auto& soil = session.GetSoil();
    EXPECT_EQ(session.GetDay(), 2);
    EXPECT_EQ(soil.FindCrop(2, 2)->GetStage(), 1u);
    EXPECT_EQ(soil.FindCrop(5, 5)->GetStage(), 0u);
    EXPECT_EQ(soil.CountFlag(TileFlag::Watered), 0u);
    EXPECT_EQ(soil.CountFlag(TileFlag::Tilled), 2u);
    EXPECT_EQ(soil.CountFlag(TileFlag::Planted), 2u);
    EXPECT_FALSE(session.IsRaining());
}

TEST_F(FarmSessionTest, RainyDayWatersAllTilledGround) {
    config.RainOneIn = 1;
    FarmSession session(config, 1);
    session.GetSoil().Till(1, 1);
    session.GetSoil().Till(3, 4);

    session.AdvanceDay();
    EXPECT_TRUE(session.IsRaining());
    EXPECT_EQ(session.GetSoil().CountFlag(TileFlag::Watered), 2u);

    // 下雨天作物不浇水也生长
    session.GetSoil().Plant(1, 1, "corn");
    session.GetSoil().RemoveWater();
    session.AdvanceDay();
    EXPECT_EQ(session.GetSoil().FindCrop(1, 1)->GetStage(), 1u);
}

TEST_F(FarmSessionTest, RollRainUsesInjectedRng) {
    std::mt19937 rng(7);
    EXPECT_FALSE(FarmSession::RollRain(rng, 0));
    EXPECT_TRUE(FarmSession::RollRain(rng, 1));

    int rainy = 0;
    for (int i = 0; i < 3000; i++) rainy += FarmSession::RollRain(rng, 3);
    EXPECT_GT(rainy, 800);
    EXPECT_LT(rainy, 1200);

    std::mt19937 a(42), b(42);
    for (int i = 0; i < 20; i++)
        EXPECT_EQ(FarmSession::RollRain(a, 3), FarmSession::RollRain(b, 3));
}

TEST_F(FarmSessionTest, DayAdvanceAutosaves) {
    FarmSession session(config, 1);
    session.AdvanceDay();

    SaveSystem saves(dir);
    ASSERT_TRUE(fs::exists(saves.SlotPath(config.SaveSlot)));
    EXPECT_EQ(saves.Load(config.SaveSlot).Snapshot.Day, 2);
}

TEST_F(FarmSessionTest, AutosaveRetriesDefaultSlot) {
    FarmSession session(config, 1);
    session.SetActiveSlot(2);

    // 让槽位 2 的临时文件无法创建
    SaveSystem saves(dir);
    SaveSystem::EnsureDataDirs(dir);
    fs::path tmp = saves.SlotPath(2);
    tmp += ".tmp";
    fs::create_directories(tmp);

    session.AdvanceDay();
    EXPECT_FALSE(fs::exists(saves.SlotPath(2)));
    EXPECT_TRUE(fs::exists(saves.SlotPath(config.DefaultSaveSlot)));
    EXPECT_EQ(session.GetActiveSlot(), config.DefaultSaveSlot);
}

TEST_F(FarmSessionTest, FailedAutosaveKeepsSimulationRunning) {
    fs::path blocker = dir / "blocker";
    { std::ofstream(blocker) << "x"; }
    config.DataDir = blocker.string();

    FarmSession session(config, 1);
    EXPECT_NO_THROW(session.AdvanceDay());
    EXPECT_EQ(session.GetDay(), 2);
    EXPECT_FALSE(session.SaveGame(1));
}

// ── 快照 ────────────────────────────────────────────────────

TEST_F(FarmSessionTest, SnapshotRestoreIntoFreshSession) {
    FarmSession a(config, 1);
    PlantWatered(a, 4, 4, "tomato");
    PlantWatered(a, 5, 4, "corn");
    a.AdvanceDay();
    a.GetPlayer().Money = 33;
    a.GetPlayer().Items.AddItem("apple", 2);
    a.GetPlayer().Position = {200.0f, 210.0f};
    a.GetPlayer().Facing = Direction::Up;

    SaveSnapshot snap = a.BuildSnapshot();

    FarmSession b(config, 2);
    b.RestoreSnapshot(snap);

    EXPECT_EQ(b.GetDay(), 2);
    EXPECT_EQ(b.GetPlayer().Money, 33);
    EXPECT_EQ(b.GetPlayer().Items.CountItem("apple"), 2u);
    EXPECT_EQ(b.GetPlayer().Position, glm::vec2(200.0f, 210.0f));
    EXPECT_EQ(b.GetPlayer().Facing, Direction::Up);
    EXPECT_EQ(b.GetSoil().CaptureSoil().Grid, a.GetSoil().CaptureSoil().Grid);
    EXPECT_EQ(b.GetSoil().FindCrop(4, 4)->GetStage(), 1u);
}

TEST_F(FarmSessionTest, RestoreRelocatesFarAwayPlayer) {
    FarmSession a(config, 1);
    PlantWatered(a, 1, 1, "corn");
    SaveSnapshot snap = a.BuildSnapshot();
    snap.Player.Pos = glm::ivec2(5000, 5000);

    FarmSession b(config, 1);
    b.RestoreSnapshot(snap);
    EXPECT_EQ(b.GetPlayer().Position, Collision2D::TileCenter({1, 1}, 48));
}

TEST_F(FarmSessionTest, RestoreKeepsNearbyPlayer) {
    FarmSession a(config, 1);
    PlantWatered(a, 1, 1, "corn");
    SaveSnapshot snap = a.BuildSnapshot();
    snap.Player.Pos = glm::ivec2(600, 400);

    FarmSession b(config, 1);
    b.RestoreSnapshot(snap);
    EXPECT_EQ(b.GetPlayer().Position, glm::vec2(600.0f, 400.0f));
}

TEST_F(FarmSessionTest, RestoreWithoutOptionalFieldsKeepsCurrentValues) {
    FarmSession session(config, 1);
    session.GetPlayer().Money = 9;

    SaveSnapshot snap;
    snap.Day = 4;
    snap.Soil = session.GetSoil().CaptureSoil();
    session.RestoreSnapshot(snap);

    EXPECT_EQ(session.GetDay(), 4);
    EXPECT_EQ(session.GetPlayer().Money, 9);
    EXPECT_EQ(session.GetPlayer().Seeds.CountItem("corn"), 5u);
}

TEST_F(FarmSessionTest, RestoreDropsInFlightActionsAndRain) {
    config.RainOneIn = 1;
    FarmSession session(config, 1);
    SaveSnapshot clean = session.BuildSnapshot();
    session.AdvanceDay();
    ASSERT_TRUE(session.IsRaining());

    auto& p = session.GetPlayer();
    p.Position = {120.0f, 70.0f};
    p.Facing = Direction::Down;
    PlayerInput key;
    key.HotbarKey = 2;                          // 水壶, 触发切换冷却
    session.Update(0.0f, key);
    key.HotbarKey = 1;                          // 回到锄头
    session.Update(config.Actions.SwitchCooldown + 0.05f, key);
    PlayerInput use;
    use.Action = true;
    session.Update(0.0f, use);
    ASSERT_TRUE(session.GetActuator().IsToolBusy());

    clean.Player.Pos = glm::ivec2(120, 70);
    session.RestoreSnapshot(clean);
    EXPECT_FALSE(session.IsRaining());
    EXPECT_FALSE(session.GetActuator().IsRooted());
    EXPECT_FALSE(session.GetActuator().IsSwitchCoolingDown(ActionKind::Tool));

    session.Update(config.Actions.ToolUseTime + 0.05f, PlayerInput{});
    EXPECT_EQ(session.GetSoil().CountFlag(TileFlag::Tilled), 0u);
}

TEST_F(FarmSessionTest, SaveAndLoadGameThroughSlots) {
    FarmSession a(config, 1);
    PlantWatered(a, 3, 3, "corn");
    a.GetPlayer().Money = 77;
    ASSERT_TRUE(a.SaveGame(4));

    FarmSession b(config, 1);
    ASSERT_TRUE(b.LoadGame(4));
    EXPECT_EQ(b.GetActiveSlot(), 4u);
    EXPECT_EQ(b.GetPlayer().Money, 77);
    EXPECT_NE(b.GetSoil().FindCrop(3, 3), nullptr);
}

TEST_F(FarmSessionTest, LoadMissingSlotKeepsState) {
    FarmSession session(config, 1);
    session.GetPlayer().Money = 12;
    EXPECT_FALSE(session.LoadGame(9));
    EXPECT_EQ(session.GetPlayer().Money, 12);
    EXPECT_EQ(session.GetDay(), 1);
}

// ── 接触收获 ────────────────────────────────────────────────

TEST_F(FarmSessionTest, AutoHarvestOnContact) {
    config.AutoHarvestOnContact = true;
    config.RainOneIn = 1;
    FarmSession session(config, 1);
    PlantWatered(session, 10, 6, "corn");
    for (int i = 0; i < 3; i++) session.AdvanceDay();

    session.GetPlayer().Position = Collision2D::TileCenter({10, 6}, 48);
    session.Update(0.016f, PlayerInput{});
    EXPECT_EQ(session.GetPlayer().Items.CountItem("corn"), 1u);
    EXPECT_TRUE(session.GetSoil().GetCrops().empty());
}

TEST_F(FarmSessionTest, NoAutoHarvestWhenDisabled) {
    config.AutoHarvestOnContact = false;
    config.RainOneIn = 1;
    FarmSession session(config, 1);
    PlantWatered(session, 10, 6, "corn");
    for (int i = 0; i < 3; i++) session.AdvanceDay();

    session.GetPlayer().Position = Collision2D::TileCenter({10, 6}, 48);
    session.Update(0.016f, PlayerInput{});
    EXPECT_EQ(session.GetPlayer().Items.CountItem("corn"), 0u);
    EXPECT_EQ(session.GetSoil().GetCrops().size(), 1u);
}

// ── 通过输入完成一次耕作 ────────────────────────────────────

TEST_F(FarmSessionTest, InputDrivesTillPlantWater) {
    FarmSession session(config, 1);
    auto& p = session.GetPlayer();
    p.Position = {120.0f, 70.0f};
    p.Facing = Direction::Down;
    const f32 wait = config.Actions.ToolUseTime + 0.05f;

    PlayerInput use;
    use.Action = true;
    session.Update(0.0f, use);                  // 锄头
    session.Update(wait, PlayerInput{});

    PlayerInput key;
    key.HotbarKey = 4;                          // 玉米种子
    session.Update(0.0f, key);
    session.Update(0.0f, use);
    session.Update(wait, PlayerInput{});

    key.HotbarKey = 2;                          // 水壶
    session.Update(0.0f, key);
    session.Update(0.0f, use);
    session.Update(wait, PlayerInput{});

    auto& soil = session.GetSoil();
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Tilled));
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Planted));
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Watered));
    EXPECT_EQ(p.Seeds.CountItem("corn"), 4u);
}
