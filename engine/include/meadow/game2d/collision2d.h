#pragma once

#include "meadow/core/types.h"

#include <glm/glm.hpp>
#include <cmath>

namespace Meadow {

// ── 2D AABB 碰撞盒 (像素坐标, Y 向下) ─────────────────────
struct AABB2D {
    glm::vec2 Min;  // 左上角
    glm::vec2 Max;  // 右下角

    AABB2D() : Min(0), Max(0) {}
    AABB2D(const glm::vec2& center, const glm::vec2& halfSize)
        : Min(center - halfSize), Max(center + halfSize) {}

    static AABB2D FromMinMax(const glm::vec2& mn, const glm::vec2& mx) {
        AABB2D box;
        box.Min = mn;
        box.Max = mx;
        return box;
    }

    /// 严格相交 (仅共享边不算)
    bool Overlaps(const AABB2D& other) const {
        return Min.x < other.Max.x && Max.x > other.Min.x &&
               Min.y < other.Max.y && Max.y > other.Min.y;
    }

    /// 半开区间 [Min, Max)
    bool Contains(const glm::vec2& p) const {
        return p.x >= Min.x && p.x < Max.x && p.y >= Min.y && p.y < Max.y;
    }

    /// 各边向外扩张 amount (负值 = 收缩)
    AABB2D Inflated(f32 amount) const {
        return FromMinMax(Min - glm::vec2(amount), Max + glm::vec2(amount));
    }

    glm::vec2 GetCenter() const { return (Min + Max) * 0.5f; }
    glm::vec2 GetSize()   const { return Max - Min; }
};

// ── Tile ↔ 像素换算 ─────────────────────────────────────

namespace Collision2D {

/// Tile (tx,ty) 覆盖的像素矩形
inline AABB2D TileBounds(const TileCoord& tile, i32 tileSize) {
    glm::vec2 mn = glm::vec2(tile) * (f32)tileSize;
    return AABB2D::FromMinMax(mn, mn + glm::vec2((f32)tileSize));
}

/// Tile 中心点 (像素)
inline glm::vec2 TileCenter(const TileCoord& tile, i32 tileSize) {
    return (glm::vec2(tile) + 0.5f) * (f32)tileSize;
}

/// 像素点所在的 Tile (向下取整, 负坐标也正确)
inline TileCoord WorldToTile(const glm::vec2& p, i32 tileSize) {
    return {(i32)std::floor(p.x / (f32)tileSize), (i32)std::floor(p.y / (f32)tileSize)};
}

} // namespace Collision2D

} // namespace Meadow
