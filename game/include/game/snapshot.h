#pragma once

#include "meadow/core/types.h"
#include "game/tile.h"
#include "game/player_state.h"

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Meadow {

// ── 存档快照 ──────────────────────────────────────────────
//
// 恢复模拟所需的完整可变状态; 不保存任何派生/缓存字段。

struct PlayerSnapshot {
    std::optional<i32>        Money;
    std::optional<ItemCounts> Inventory;
    std::optional<ItemCounts> SeedInventory;
    std::optional<glm::ivec2> Pos;
    std::optional<Direction>  Facing;
    std::string               Status = "down_idle";
};

struct SoilSnapshot {
    std::vector<std::vector<TileMask>> Grid;   // [y][x]
    i32 TileSize = 48;
    u32 Width  = 0;
    u32 Height = 0;
};

struct CropRecord {
    i32 X = 0;
    i32 Y = 0;
    std::string Type;
    f64 GrowthStage = 0.0;
};

struct SaveSnapshot {
    i32 Day = 1;
    PlayerSnapshot Player;
    SoilSnapshot   Soil;
    std::vector<CropRecord> Plants;
};

} // namespace Meadow
