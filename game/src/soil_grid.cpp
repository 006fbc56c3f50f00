#include "game/soil_grid.h"
#include "game/feedback.h"
#include "meadow/core/assert.h"
#include "meadow/core/log.h"

#include <algorithm>
#include <cmath>

namespace Meadow {

namespace {

// 位掩码: 上=1 右=2 下=4 左=8, 位=1 表示该方向邻居也已翻耕
constexpr const char* SOIL_TILE_KEYS[16] = {
    "o",    // 0000 孤岛
    "b",    // 0001 上
    "l",    // 0010 右
    "bl",   // 0011 上右
    "t",    // 0100 下
    "tb",   // 0101 上下
    "tl",   // 0110 右下
    "tbr",  // 0111 上右下
    "r",    // 1000 左
    "br",   // 1001 上左
    "lr",   // 1010 左右
    "lrb",  // 1011 上右左
    "tr",   // 1100 下左
    "tbl",  // 1101 上下左
    "lrt",  // 1110 右下左
    "x",    // 1111 四面
};

} // namespace

SoilGrid::SoilGrid(u32 width, u32 height, i32 tileSize, const CropCatalog& catalog)
    : m_Width(width), m_Height(height), m_TileSize(tileSize),
      m_Tiles((size_t)width * height), m_Catalog(&catalog),
      m_Feedback(&NullFeedbackSink::Get()) {
    LOG_INFO("[土壤] 创建网格 %ux%u (tile %d px)", width, height, tileSize);
}

void SoilGrid::SetFeedback(IFeedbackSink* sink) {
    m_Feedback = sink ? sink : &NullFeedbackSink::Get();
}

SoilTile& SoilGrid::At(i32 tx, i32 ty) {
    MEADOW_ASSERT(InBounds(tx, ty));
    size_t index = (size_t)ty * m_Width + (size_t)tx;
    MEADOW_ASSERT_INDEX(index, m_Tiles.size());
    return m_Tiles[index];
}

const SoilTile& SoilGrid::At(i32 tx, i32 ty) const {
    MEADOW_ASSERT(InBounds(tx, ty));
    size_t index = (size_t)ty * m_Width + (size_t)tx;
    MEADOW_ASSERT_INDEX(index, m_Tiles.size());
    return m_Tiles[index];
}

TileMask SoilGrid::GetFlags(i32 tx, i32 ty) const {
    if (!InBounds(tx, ty)) return 0;
    return At(tx, ty).Flags;
}

u32 SoilGrid::CountFlag(TileFlag f) const {
    return (u32)std::count_if(m_Tiles.begin(), m_Tiles.end(),
                              [f](const SoilTile& t) { return t.Has(f); });
}

void SoilGrid::SetFarmable(i32 tx, i32 ty, bool farmable) {
    if (!InBounds(tx, ty)) return;
    auto& tile = At(tx, ty);
    if (farmable) {
        tile.Set(TileFlag::Farmable);
        return;
    }

    // 不可耕种的地面不能保留其它标记, 上面的作物一并移除
    const bool hadSoil = tile.Has(TileFlag::Tilled);
    tile.Flags = 0;
    size_t removed = std::erase_if(m_Crops, [&](const Crop& c) {
        return c.GetTile().x == tx && c.GetTile().y == ty;
    });
    if (removed) LOG_DEBUG("[土壤] %d,%d 设为不可耕种, 移除 %zu 株作物", tx, ty, removed);
    if (hadSoil) m_Feedback->SoilChanged();
}

void SoilGrid::MarkAllFarmable() {
    for (auto& tile : m_Tiles) tile.Set(TileFlag::Farmable);
}

// ── 农事操作 ──────────────────────────────────────────────

bool SoilGrid::Till(i32 tx, i32 ty) {
    if (!InBounds(tx, ty)) {
        LOG_DEBUG("[土壤] 翻耕越界: %d,%d", tx, ty);
        return false;
    }
    auto& tile = At(tx, ty);
    if (!tile.Has(TileFlag::Farmable) || tile.Has(TileFlag::Tilled)) {
        LOG_DEBUG("[土壤] 无法翻耕 %d,%d (F=%d X=%d)", tx, ty,
                  tile.Has(TileFlag::Farmable), tile.Has(TileFlag::Tilled));
        return false;
    }
    tile.Set(TileFlag::Tilled);
    m_Feedback->SoilChanged();
    if (m_Raining) WaterAll();
    return true;
}

bool SoilGrid::Water(i32 tx, i32 ty) {
    if (!InBounds(tx, ty)) return false;
    auto& tile = At(tx, ty);
    if (!tile.Has(TileFlag::Tilled)) {
        LOG_TRACE("[土壤] %d,%d 未翻耕, 无法浇水", tx, ty);
        return false;
    }
    tile.Set(TileFlag::Watered);
    return true;
}

void SoilGrid::WaterAll() {
    for (auto& tile : m_Tiles) {
        if (tile.Has(TileFlag::Tilled)) tile.Set(TileFlag::Watered);
    }
    LOG_DEBUG("[土壤] 全部翻耕地已浇水 (下雨)");
}

void SoilGrid::RemoveWater() {
    for (auto& tile : m_Tiles) tile.Clear(TileFlag::Watered);
}

bool SoilGrid::Plant(i32 tx, i32 ty, const std::string& cropType) {
    if (!InBounds(tx, ty)) return false;
    auto& tile = At(tx, ty);
    if (!tile.Has(TileFlag::Tilled) || tile.Has(TileFlag::Planted)) return false;

    tile.Set(TileFlag::Planted);
    m_Crops.emplace_back(TileCoord{tx, ty}, cropType, m_Catalog->MaxStage(cropType));
    LOG_DEBUG("[土壤] 种下 %s @ %d,%d", cropType.c_str(), tx, ty);
    return true;
}

std::optional<std::string> SoilGrid::HarvestAt(const AABB2D& area) {
    auto it = std::find_if(m_Crops.begin(), m_Crops.end(), [&](const Crop& c) {
        return c.IsHarvestable() && c.GetFootprint(m_TileSize).Overlaps(area);
    });
    if (it == m_Crops.end()) return std::nullopt;

    const TileCoord tile = it->GetTile();
    std::string type = it->GetType();
    auto& cell = At(tile.x, tile.y);
    cell.Clear(TileFlag::Planted);
    cell.Clear(TileFlag::Watered);
    m_Crops.erase(it);

    LOG_DEBUG("[土壤] 收获 %s @ %d,%d", type.c_str(), tile.x, tile.y);
    return type;
}

std::optional<std::string> SoilGrid::HarvestAtTile(i32 tx, i32 ty) {
    return HarvestAt(Collision2D::TileBounds({tx, ty}, m_TileSize));
}

void SoilGrid::UpdatePlants() {
    u32 grown = 0;
    for (auto& crop : m_Crops) {
        const TileCoord& t = crop.GetTile();
        if (m_Raining || At(t.x, t.y).Has(TileFlag::Watered)) {
            if (crop.Advance()) grown++;
        }
    }
    LOG_DEBUG("[土壤] 作物生长: %u / %zu", grown, m_Crops.size());
}

const Crop* SoilGrid::FindCrop(i32 tx, i32 ty) const {
    for (auto& crop : m_Crops) {
        if (crop.GetTile().x == tx && crop.GetTile().y == ty) return &crop;
    }
    return nullptr;
}

const char* SoilGrid::ClassifySoilTile(i32 tx, i32 ty) const {
    if (!IsTilled(tx, ty)) return nullptr;
    u8 mask = 0;
    if (IsTilled(tx, ty - 1)) mask |= 1;
    if (IsTilled(tx + 1, ty)) mask |= 2;
    if (IsTilled(tx, ty + 1)) mask |= 4;
    if (IsTilled(tx - 1, ty)) mask |= 8;
    return SOIL_TILE_KEYS[mask];
}

// ── 存档 ──────────────────────────────────────────────────

SoilSnapshot SoilGrid::CaptureSoil() const {
    SoilSnapshot snap;
    snap.TileSize = m_TileSize;
    snap.Width  = m_Width;
    snap.Height = m_Height;
    snap.Grid.resize(m_Height);
    for (u32 y = 0; y < m_Height; y++) {
        snap.Grid[y].resize(m_Width);
        for (u32 x = 0; x < m_Width; x++)
            snap.Grid[y][x] = At((i32)x, (i32)y).Flags;
    }
    return snap;
}

std::vector<CropRecord> SoilGrid::CapturePlants() const {
    std::vector<CropRecord> out;
    out.reserve(m_Crops.size());
    for (auto& crop : m_Crops) {
        out.push_back({crop.GetTile().x, crop.GetTile().y, crop.GetType(), (f64)crop.GetStage()});
    }
    return out;
}

void SoilGrid::Restore(const SoilSnapshot& soil, const std::vector<CropRecord>& plants) {
    if (!soil.Grid.empty()) {
        m_Height = (u32)soil.Grid.size();
        m_Width  = (u32)soil.Grid[0].size();
        m_Tiles.assign((size_t)m_Width * m_Height, SoilTile{});
        for (u32 y = 0; y < m_Height; y++) {
            const auto& row = soil.Grid[y];
            if (row.size() != m_Width)
                LOG_WARN("[土壤] 存档第 %u 行宽度 %zu 与首行 %u 不一致", y, row.size(), m_Width);
            u32 n = std::min<u32>((u32)row.size(), m_Width);
            for (u32 x = 0; x < n; x++)
                At((i32)x, (i32)y).Flags = NormalizeTileMask(row[x]);
        }
    }
    if (soil.TileSize > 0) m_TileSize = soil.TileSize;

    m_Crops.clear();
    for (auto& rec : plants) {
        if (m_Width == 0 || m_Height == 0) break;
        i32 tx = std::clamp(rec.X, 0, (i32)m_Width - 1);
        i32 ty = std::clamp(rec.Y, 0, (i32)m_Height - 1);
        if (tx != rec.X || ty != rec.Y) {
            LOG_DEBUG("[土壤] 恢复: 作物 %d,%d 重定位到 %d,%d (网格 %ux%u)",
                      rec.X, rec.Y, tx, ty, m_Width, m_Height);
        }
        if (FindCrop(tx, ty)) {
            LOG_WARN("[土壤] 恢复: %d,%d 已有作物, 跳过 %s", tx, ty, rec.Type.c_str());
            continue;
        }

        auto& tile = At(tx, ty);
        tile.Set(TileFlag::Farmable);
        tile.Set(TileFlag::Tilled);
        tile.Set(TileFlag::Planted);

        u32 maxStage = m_Catalog->MaxStage(rec.Type);
        f64 stage = std::isfinite(rec.GrowthStage) ? std::floor(rec.GrowthStage) : 0.0;
        stage = std::clamp(stage, 0.0, (f64)maxStage);
        m_Crops.emplace_back(TileCoord{tx, ty}, rec.Type, maxStage, (u32)stage);
    }

    // 没有作物的 Planted 标记是残留数据
    for (u32 y = 0; y < m_Height; y++) {
        for (u32 x = 0; x < m_Width; x++) {
            auto& tile = At((i32)x, (i32)y);
            if (tile.Has(TileFlag::Planted) && !FindCrop((i32)x, (i32)y)) {
                LOG_DEBUG("[土壤] 恢复: 清除 %u,%u 的孤立种植标记", x, y);
                tile.Clear(TileFlag::Planted);
            }
        }
    }

    m_Feedback->SoilChanged();
    LOG_INFO("[土壤] 恢复完成: %ux%u, 作物 %zu 株", m_Width, m_Height, m_Crops.size());
}

} // namespace Meadow
