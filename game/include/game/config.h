#pragma once

#include "meadow/core/types.h"
#include "game/crop.h"

#include <glm/glm.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace Meadow {

// ── 动作参数 ──────────────────────────────────────────────

struct ActionTuning {
    f32 MoveSpeed      = 120.0f;   // 像素/秒
    f32 ToolUseTime    = 0.35f;
    f32 SeedUseTime    = 0.35f;
    f32 SwitchCooldown = 0.2f;

    /// 玩家中心到工具作用点的偏移 (像素), 按 Direction 索引: 下 上 左 右
    glm::vec2 ToolOffsets[4] = {
        {  0.0f,  50.0f},
        {  0.0f, -20.0f},
        {-50.0f,  40.0f},
        { 50.0f,  40.0f},
    };

    glm::vec2 HitboxHalfSize = {12.0f, 20.0f};
};

struct TreeSpawn {
    glm::vec2 Center = {0.0f, 0.0f};
    glm::vec2 Size   = {48.0f, 64.0f};
    i32 Health = 5;
    u32 Apples = 2;
};

// ── 游戏配置 ──────────────────────────────────────────────

struct GameConfig {
    glm::ivec2 WindowSize = {960, 640};
    i32        TileSize   = 48;
    glm::ivec2 GridSize   = {20, 13};   // 窗口 / tile

    ActionTuning Actions;
    f32 DayTransitionTime = 1.0f;
    u32 RainOneIn         = 3;          // 1/N 概率下雨, 0 = 永不

    i32 StartingMoney = 0;
    ItemCounts StartingSeeds = {{"corn", 5}, {"tomato", 5}};
    std::vector<std::string> Hotbar = {"hoe", "water-can", "axe", "corn", "tomato"};

    std::vector<CropDef> Crops = {
        {"corn",   4, 5, 10},
        {"tomato", 4, 7, 20},
    };
    std::unordered_map<std::string, u32> SellPrices = {{"wood", 4}, {"apple", 2}};

    std::vector<TreeSpawn> Trees = {
        {{ 72.0f, 72.0f}, {48.0f, 64.0f}, 5, 2},
        {{888.0f, 72.0f}, {48.0f, 64.0f}, 5, 2},
    };

    std::string DataDir  = "data";
    u32  SaveSlot        = 1;
    u32  DefaultSaveSlot = 1;
    std::string LogLevel = "info";
    bool AutoHarvestOnContact = true;
};

/// 从 JSON 读取配置, 缺失的键保留默认值。
/// 文件不存在: 返回 true 并使用默认值; 解析失败: 返回 false, config 不变
bool LoadGameConfig(const std::string& path, GameConfig& config);

} // namespace Meadow
