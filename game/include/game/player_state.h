#pragma once

#include "meadow/core/types.h"
#include "meadow/game2d/collision2d.h"

#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Meadow {

class CropCatalog;

// ── 朝向枚举 ──────────────────────────────────────────────

enum class Direction : u8 {
    Down = 0,   // 面向屏幕 (默认)
    Up,
    Left,
    Right,
};

inline const char* DirectionName(Direction d) {
    switch (d) {
        case Direction::Down:  return "down";
        case Direction::Up:    return "up";
        case Direction::Left:  return "left";
        case Direction::Right: return "right";
    }
    return "down";
}

std::optional<Direction> ParseDirection(const std::string& name);

// ── 工具类型 ──────────────────────────────────────────────

enum class ToolType : u8 {
    None = 0,
    Hoe,        // 锄头: 翻地
    WaterCan,   // 水壶: 浇水 (3×3)
    Axe,        // 斧头: 砍树
    Harvest,    // 收获: 立即生效, 不计时
};

const char* ToolID(ToolType tool);
ToolType    ParseToolID(const std::string& id);   // 非工具返回 None

// ── 背包 (物品 ID → 数量, 数量永不为负) ──────────────────

class Inventory {
public:
    void AddItem(const std::string& id, u32 count = 1);

    /// 扣除数量, 不足时扣到 0 为止; 返回实际扣除数
    u32  RemoveItem(const std::string& id, u32 count = 1);

    bool HasItem(const std::string& id, u32 count = 1) const { return CountItem(id) >= count; }
    u32  CountItem(const std::string& id) const;

    void Replace(const ItemCounts& items);
    void Clear() { m_Items.clear(); }
    const ItemCounts& GetAll() const { return m_Items; }

private:
    ItemCounts m_Items;
};

// ── 玩家状态 ──────────────────────────────────────────────

struct PlayerState {
    i32 Money = 0;
    Inventory Items;    // 收获物 / 杂物
    Inventory Seeds;    // 种子

    std::vector<std::string> Hotbar;   // 工具或种子 ID
    u32         SelectedSlot = 0;
    ToolType    SelectedTool = ToolType::None;
    std::string SelectedSeed;

    Direction   Facing   = Direction::Down;
    WorldPos    Position = {0.0f, 0.0f};
    std::string Status   = "down_idle";

    glm::vec2 HitboxHalfSize = {12.0f, 20.0f};   // 32×48 贴图内缩 8

    /// 当前槽位的 ID (空槽返回空串)
    const std::string& GetSelectedID() const;

    /// 选中槽位并根据所属目录同步 SelectedTool / SelectedSeed; 越界返回 false
    bool SelectSlot(u32 slot, const CropCatalog& seeds);

    AABB2D GetHitbox() const { return AABB2D(Position, HitboxHalfSize); }
};

} // namespace Meadow
