#pragma once

#include "meadow/core/types.h"
#include "meadow/game2d/collision2d.h"

#include <string>
#include <vector>
#include <unordered_map>

namespace Meadow {

// ── 作物定义 ──────────────────────────────────────────────

struct CropDef {
    std::string ID;
    u32 Frames    = 4;      // 生长阶段贴图数量 (资源加载器提供)
    u32 SeedPrice = 0;      // 商店买入价
    u32 SellPrice = 0;      // 商店卖出价

    /// 成熟阶段 = 帧数 - 1, 至少 1 (刚种下的作物永远不可收获)
    u32 MaxStage() const { return Frames > 1 ? Frames - 1 : 1; }
};

// ── 作物目录 (同时是种子目录) ─────────────────────────────

class CropCatalog {
public:
    static constexpr u32 DEFAULT_MAX_STAGE = 3;

    void Register(const CropDef& def);
    const CropDef* Find(const std::string& id) const;
    bool Has(const std::string& id) const { return Find(id) != nullptr; }

    /// 未注册的作物类型按默认 3 阶段处理
    u32 MaxStage(const std::string& id) const;

    /// 按注册顺序
    const std::vector<std::string>& GetIDs() const { return m_Order; }
    u32 Size() const { return (u32)m_Order.size(); }

private:
    std::unordered_map<std::string, CropDef> m_Defs;
    std::vector<std::string> m_Order;
};

// ── 作物实例 ──────────────────────────────────────────────
//
// 状态: Growing(0..max-1) → Mature(max), Mature 为吸收态, 不会倒退。

class Crop {
public:
    Crop(const TileCoord& tile, std::string type, u32 maxStage, u32 stage = 0);

    /// 生长一个阶段; 已成熟时无效果, 返回是否发生变化
    bool Advance();

    const TileCoord&   GetTile()     const { return m_Tile; }
    const std::string& GetType()     const { return m_Type; }
    u32                GetStage()    const { return m_Stage; }
    u32                GetMaxStage() const { return m_MaxStage; }
    bool               IsHarvestable() const { return m_Stage >= m_MaxStage; }

    /// 占地范围 = 所在 Tile 的像素矩形
    AABB2D GetFootprint(i32 tileSize) const {
        return Collision2D::TileBounds(m_Tile, tileSize);
    }

private:
    TileCoord   m_Tile;
    std::string m_Type;
    u32         m_Stage    = 0;
    u32         m_MaxStage = CropCatalog::DEFAULT_MAX_STAGE;
};

} // namespace Meadow
