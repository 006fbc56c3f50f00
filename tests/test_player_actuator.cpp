/**
 * @file test_player_actuator.cpp
 * @brief 玩家动作执行器单元测试
 *
 * 目标格计算、定时提交 (目标冻结)、移动锁定、槽位切换冷却、
 * 水壶 3×3、斧头砍树、收获立即生效。
 */

#include <gtest/gtest.h>
#include "game/player_actuator.h"
#include "game/soil_grid.h"
#include "game/tree.h"
#include "test_helpers.h"

using namespace Meadow;

class PlayerActuatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        catalog.Register({"corn", 4, 5, 10});
        catalog.Register({"tomato", 4, 7, 20});
        soil.MarkAllFarmable();

        player.Hotbar = {"hoe", "water-can", "axe", "corn", "tomato"};
        player.SelectSlot(0, catalog);
        player.Position = {120.0f, 70.0f};   // 面朝下时目标 = (2,2)
        player.Facing = Direction::Down;

        actuator.SetFeedback(&feedback);
    }

    /// 推进到当前动作全部提交
    void Finish() {
        actuator.Update(tuning.ToolUseTime + 0.01f, PlayerInput{});
    }

    CropCatalog  catalog;
    SoilGrid     soil{10, 10, 48, catalog};
    TreeField    trees;
    PlayerState  player;
    ActionTuning tuning;
    PlayerActuator actuator{player, soil, trees, catalog, tuning};
    Testing::RecordingFeedback feedback;
};

// ── 目标格 ──────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, TargetTileFollowsFacing) {
    player.Facing = Direction::Down;
    EXPECT_EQ(actuator.ComputeTargetTile(), TileCoord(2, 2));
    player.Facing = Direction::Up;
    EXPECT_EQ(actuator.ComputeTargetTile(), TileCoord(2, 1));
    player.Facing = Direction::Left;
    EXPECT_EQ(actuator.ComputeTargetTile(), TileCoord(1, 2));
    player.Facing = Direction::Right;
    EXPECT_EQ(actuator.ComputeTargetTile(), TileCoord(3, 2));
}

// ── 定时提交 ────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, ToolCommitsAfterUseTimeOnFrozenTarget) {
    ASSERT_TRUE(actuator.UseSelected());
    EXPECT_TRUE(actuator.IsToolBusy());
    ASSERT_TRUE(actuator.GetToolAction().has_value());
    EXPECT_EQ(actuator.GetToolAction()->Target, TileCoord(2, 2));

    // 开始后玩家被挪走, 提交仍作用于原目标
    player.Position = {400.0f, 400.0f};

    actuator.Update(0.2f, PlayerInput{});
    EXPECT_FALSE(soil.HasFlag(2, 2, TileFlag::Tilled));
    actuator.Update(0.2f, PlayerInput{});
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Tilled));
    EXPECT_FALSE(actuator.IsToolBusy());
    EXPECT_EQ(feedback.CountSound(SoundCue::Hoe), 1u);
}

TEST_F(PlayerActuatorTest, PreviewShownAtStartAndClearedAtCommit) {
    actuator.UseSelected();
    ASSERT_EQ(feedback.Previews.size(), 1u);
    EXPECT_EQ(feedback.Previews[0], TileCoord(2, 2));
    EXPECT_EQ(feedback.Clears, 0u);
    Finish();
    EXPECT_EQ(feedback.Clears, 1u);
}

TEST_F(PlayerActuatorTest, SecondActionOfSameClassIsRejected) {
    EXPECT_TRUE(actuator.StartToolAction(ToolType::Hoe));
    EXPECT_FALSE(actuator.StartToolAction(ToolType::WaterCan));
    EXPECT_EQ(actuator.GetToolAction()->Tool, ToolType::Hoe);
}

TEST_F(PlayerActuatorTest, MovementLockedWhileActing) {
    actuator.UseSelected();
    PlayerInput in;
    in.Right = true;
    actuator.Update(0.1f, in);
    EXPECT_EQ(player.Position, glm::vec2(120.0f, 70.0f));

    Finish();
    actuator.Update(0.5f, in);
    EXPECT_FLOAT_EQ(player.Position.x, 120.0f + tuning.MoveSpeed * 0.5f);
    EXPECT_EQ(player.Facing, Direction::Right);
}

TEST_F(PlayerActuatorTest, MovementClampedToWorld) {
    PlayerInput in;
    in.Up = true;
    actuator.Update(5.0f, in);
    EXPECT_FLOAT_EQ(player.Position.y, 0.0f);
    EXPECT_EQ(player.Facing, Direction::Up);
}

TEST_F(PlayerActuatorTest, StatusTracksActivity) {
    actuator.UseSelected();
    EXPECT_EQ(player.Status, "down_hoe");
    Finish();
    EXPECT_EQ(player.Status, "down_idle");

    PlayerInput in;
    in.Left = true;
    actuator.Update(0.1f, in);
    EXPECT_EQ(player.Status, "left_walk");
}

// ── 种子 ────────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, SeedActionNeedsInventory) {
    soil.Till(2, 2);
    EXPECT_FALSE(actuator.StartSeedAction("corn"));
    EXPECT_FALSE(actuator.IsSeedBusy());

    player.Seeds.AddItem("corn", 1);
    EXPECT_TRUE(actuator.StartSeedAction("corn"));
    Finish();
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Planted));
    EXPECT_EQ(player.Seeds.CountItem("corn"), 0u);
    EXPECT_EQ(feedback.CountSound(SoundCue::Plant), 1u);
}

TEST_F(PlayerActuatorTest, FailedPlantKeepsSeed) {
    player.Seeds.AddItem("tomato", 2);
    EXPECT_TRUE(actuator.StartSeedAction("tomato"));   // 目标未翻耕
    Finish();
    EXPECT_FALSE(soil.HasFlag(2, 2, TileFlag::Planted));
    EXPECT_EQ(player.Seeds.CountItem("tomato"), 2u);
}

TEST_F(PlayerActuatorTest, ToolAndSeedRunIndependently) {
    soil.Till(2, 2);
    player.Seeds.AddItem("corn", 1);
    EXPECT_TRUE(actuator.StartToolAction(ToolType::WaterCan));
    EXPECT_TRUE(actuator.StartSeedAction("corn"));
    Finish();
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Watered));
    EXPECT_TRUE(soil.HasFlag(2, 2, TileFlag::Planted));
    EXPECT_FALSE(actuator.IsRooted());
}

// ── 水壶 ────────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, WaterCanWatersThreeByThree) {
    for (i32 y = 1; y <= 3; y++)
        for (i32 x = 1; x <= 3; x++) soil.Till(x, y);
    soil.Till(4, 2);

    actuator.StartToolAction(ToolType::WaterCan);
    Finish();

    EXPECT_EQ(soil.CountFlag(TileFlag::Watered), 9u);
    EXPECT_FALSE(soil.HasFlag(4, 2, TileFlag::Watered));
}

TEST_F(PlayerActuatorTest, WaterCanOnDryGroundDoesNothing) {
    actuator.StartToolAction(ToolType::WaterCan);
    Finish();
    EXPECT_EQ(soil.CountFlag(TileFlag::Watered), 0u);
    EXPECT_EQ(feedback.CountSound(SoundCue::Water), 0u);
}

// ── 斧头 ────────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, AxeChopsTreeAtTargetPoint) {
    trees.AddTree(AABB2D({120.0f, 120.0f}, {24.0f, 32.0f}), 5, 2);

    for (int i = 0; i < 6; i++) {
        ASSERT_TRUE(actuator.StartToolAction(ToolType::Axe));
        Finish();
    }

    EXPECT_EQ(player.Items.CountItem("apple"), 2u);
    EXPECT_EQ(player.Items.CountItem("wood"), TreeField::WOOD_PER_TREE);
    EXPECT_EQ(trees.CountAlive(), 0u);
    EXPECT_EQ(feedback.CountSound(SoundCue::Axe), 5u);   // 树桩不再受击
}

TEST_F(PlayerActuatorTest, AxeMissesWhenNoTree) {
    trees.AddTree(AABB2D({400.0f, 400.0f}, {24.0f, 32.0f}), 5, 2);
    actuator.StartToolAction(ToolType::Axe);
    Finish();
    EXPECT_EQ(trees.GetTrees()[0].Health, 5);
    EXPECT_TRUE(player.Items.GetAll().empty());
}

// ── 收获 ────────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, HarvestIsImmediateUnderPlayer) {
    soil.Till(2, 2);
    soil.Plant(2, 2, "corn");
    soil.SetRaining(true);
    for (int i = 0; i < 3; i++) soil.UpdatePlants();

    player.Position = Collision2D::TileCenter({2, 2}, 48);
    EXPECT_TRUE(actuator.StartToolAction(ToolType::Harvest));
    EXPECT_FALSE(actuator.IsToolBusy());
    EXPECT_EQ(player.Items.CountItem("corn"), 1u);
    EXPECT_EQ(feedback.CountSound(SoundCue::Success), 1u);
    EXPECT_FALSE(soil.HasFlag(2, 2, TileFlag::Planted));
}

TEST_F(PlayerActuatorTest, HarvestIgnoresCropOutOfReach) {
    soil.Till(2, 2);
    soil.Plant(2, 2, "corn");
    soil.SetRaining(true);
    for (int i = 0; i < 3; i++) soil.UpdatePlants();

    // 工具作用点在 (2,2) 上, 但收获看的是玩家自身
    EXPECT_FALSE(actuator.HarvestNow().has_value());
    EXPECT_EQ(soil.GetCrops().size(), 1u);
}

// ── 槽位选择 ────────────────────────────────────────────────

TEST_F(PlayerActuatorTest, HotbarKeySelectsSlotAndSyncsSelection) {
    EXPECT_TRUE(actuator.SelectHotbarKey(4));
    EXPECT_EQ(player.SelectedSlot, 3u);
    EXPECT_EQ(player.SelectedSeed, "corn");
    EXPECT_EQ(player.SelectedTool, ToolType::Hoe);

    EXPECT_FALSE(actuator.SelectHotbarKey(0));
    EXPECT_FALSE(actuator.SelectHotbarKey(6));
}

TEST_F(PlayerActuatorTest, SwitchCooldownPerClass) {
    EXPECT_TRUE(actuator.SelectHotbarKey(2));    // 水壶
    EXPECT_TRUE(actuator.IsSwitchCoolingDown(ActionKind::Tool));
    EXPECT_FALSE(actuator.SelectHotbarKey(3));   // 斧头: 冷却中
    EXPECT_EQ(player.SelectedSlot, 1u);

    EXPECT_TRUE(actuator.SelectHotbarKey(4));    // 种子不受工具冷却影响

    actuator.Update(tuning.SwitchCooldown + 0.05f, PlayerInput{});
    EXPECT_TRUE(actuator.SelectHotbarKey(3));
    EXPECT_EQ(player.SelectedTool, ToolType::Axe);
}

TEST_F(PlayerActuatorTest, ScrollCyclesWithWrap) {
    PlayerInput in;
    in.HotbarScroll = -1;
    actuator.Update(0.0f, in);
    EXPECT_EQ(player.SelectedSlot, 4u);
    EXPECT_EQ(player.SelectedSeed, "tomato");

    actuator.Update(tuning.SwitchCooldown + 0.05f, PlayerInput{});
    in.HotbarScroll = 1;
    actuator.Update(0.0f, in);
    EXPECT_EQ(player.SelectedSlot, 0u);
}

TEST_F(PlayerActuatorTest, ActionInputUsesSelectedSlot) {
    PlayerInput in;
    in.Action = true;
    actuator.Update(0.0f, in);
    EXPECT_TRUE(actuator.IsToolBusy());
    EXPECT_EQ(actuator.GetToolAction()->Tool, ToolType::Hoe);
}
