#pragma once

#include "meadow/core/types.h"

#include <optional>
#include <string>

namespace Meadow {

// ── 土壤标记 ──────────────────────────────────────────────
//
// 一个格子可以同时 翻耕+浇水+种植, 用正交位标记而不是状态枚举。
// 不变量: Tilled ⇒ Farmable, Watered ⇒ Tilled, Planted ⇒ Tilled

enum class TileFlag : u8 {
    Farmable = 1 << 0,   // 可耕种 (地形静态属性)
    Tilled   = 1 << 1,   // 已翻耕
    Watered  = 1 << 2,   // 已浇水 (当天有效)
    Planted  = 1 << 3,   // 已种植 (恰好一株作物)
};

using TileMask = u8;

constexpr TileMask ToMask(TileFlag f) { return (TileMask)f; }

constexpr TileFlag ALL_TILE_FLAGS[] = {
    TileFlag::Farmable, TileFlag::Tilled, TileFlag::Watered, TileFlag::Planted
};

// ── 单个格子 ──────────────────────────────────────────────

struct SoilTile {
    TileMask Flags = 0;

    bool Has(TileFlag f) const { return (Flags & ToMask(f)) != 0; }
    void Set(TileFlag f)       { Flags |= ToMask(f); }
    void Clear(TileFlag f)     { Flags &= (TileMask)~ToMask(f); }
};

/// 修正违反不变量的标记组合 (恢复存档时使用)
inline TileMask NormalizeTileMask(TileMask mask) {
    if (mask & ToMask(TileFlag::Tilled)) mask |= ToMask(TileFlag::Farmable);
    if (!(mask & ToMask(TileFlag::Tilled)))
        mask &= (TileMask)~(ToMask(TileFlag::Watered) | ToMask(TileFlag::Planted));
    return mask;
}

// ── 存档编码: 'F' 'X' 'W' 'P' ──────────────────────────────

inline const char* TileFlagCode(TileFlag f) {
    switch (f) {
        case TileFlag::Farmable: return "F";
        case TileFlag::Tilled:   return "X";
        case TileFlag::Watered:  return "W";
        case TileFlag::Planted:  return "P";
        default: return "?";
    }
}

inline std::optional<TileFlag> ParseTileFlag(const std::string& code) {
    if (code == "F") return TileFlag::Farmable;
    if (code == "X") return TileFlag::Tilled;
    if (code == "W") return TileFlag::Watered;
    if (code == "P") return TileFlag::Planted;
    return std::nullopt;
}

} // namespace Meadow
