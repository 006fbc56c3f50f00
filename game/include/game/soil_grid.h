#pragma once

#include "meadow/core/types.h"
#include "meadow/game2d/collision2d.h"
#include "game/tile.h"
#include "game/crop.h"
#include "game/snapshot.h"

#include <optional>
#include <string>
#include <vector>

namespace Meadow {

class IFeedbackSink;

// ── 土壤网格 ──────────────────────────────────────────────
//
// 持有 width × height 个格子标记和全部存活作物 (按种植顺序)。
// 坐标均为 Tile 索引, 不是像素。所有拒绝的操作都不修改状态。

class SoilGrid {
public:
    SoilGrid(u32 width, u32 height, i32 tileSize, const CropCatalog& catalog);

    void SetFeedback(IFeedbackSink* sink);

    u32 GetWidth()    const { return m_Width; }
    u32 GetHeight()   const { return m_Height; }
    i32 GetTileSize() const { return m_TileSize; }

    bool InBounds(i32 tx, i32 ty) const {
        return tx >= 0 && ty >= 0 && tx < (i32)m_Width && ty < (i32)m_Height;
    }

    /// 越界返回 0
    TileMask GetFlags(i32 tx, i32 ty) const;
    bool HasFlag(i32 tx, i32 ty, TileFlag f) const { return (GetFlags(tx, ty) & ToMask(f)) != 0; }
    u32  CountFlag(TileFlag f) const;

    // ── 地形 ─────────────────────────────────
    void SetFarmable(i32 tx, i32 ty, bool farmable);
    void MarkAllFarmable();

    // ── 农事操作 ─────────────────────────────
    bool Till(i32 tx, i32 ty);
    bool Water(i32 tx, i32 ty);
    void WaterAll();
    void RemoveWater();
    bool Plant(i32 tx, i32 ty, const std::string& cropType);

    /// 收获第一株与区域相交的成熟作物 (像素坐标); 每次最多一株
    std::optional<std::string> HarvestAt(const AABB2D& area);
    std::optional<std::string> HarvestAtTile(i32 tx, i32 ty);

    /// 日切: 已浇水 (或下雨) 的作物生长一阶段
    void UpdatePlants();

    bool IsRaining() const { return m_Raining; }
    void SetRaining(bool raining) { m_Raining = raining; }

    // ── 作物查询 ─────────────────────────────
    const std::vector<Crop>& GetCrops() const { return m_Crops; }
    const Crop* FindCrop(i32 tx, i32 ty) const;

    /// 根据上右下左四邻翻耕情况给出土壤贴图键 ("o" "x" "lr" ...); 未翻耕返回 nullptr
    const char* ClassifySoilTile(i32 tx, i32 ty) const;

    // ── 存档 ─────────────────────────────────
    SoilSnapshot CaptureSoil() const;
    std::vector<CropRecord> CapturePlants() const;

    /// 整体替换网格与作物; 越界作物坐标夹到边界内, 目标格已有作物则跳过
    void Restore(const SoilSnapshot& soil, const std::vector<CropRecord>& plants);

private:
    SoilTile&       At(i32 tx, i32 ty);
    const SoilTile& At(i32 tx, i32 ty) const;
    bool IsTilled(i32 tx, i32 ty) const { return HasFlag(tx, ty, TileFlag::Tilled); }

    u32 m_Width    = 0;
    u32 m_Height   = 0;
    i32 m_TileSize = 48;
    bool m_Raining = false;

    std::vector<SoilTile> m_Tiles;   // 行优先 [y * width + x]
    std::vector<Crop>     m_Crops;

    const CropCatalog* m_Catalog  = nullptr;
    IFeedbackSink*     m_Feedback = nullptr;
};

} // namespace Meadow
