#pragma once

#include "meadow/core/types.h"
#include "meadow/game2d/collision2d.h"

#include <glm/glm.hpp>
#include <vector>

namespace Meadow {

// ── 树 ────────────────────────────────────────────────────

struct Tree {
    AABB2D Bounds;          // 像素范围
    i32    Health = 5;
    u32    Apples = 0;      // 每次受击掉落一个
    bool   Alive  = true;   // false = 树桩
};

struct ChopResult {
    bool Hit       = false;
    u32  Apples    = 0;     // 本次掉落的苹果
    u32  Wood      = 0;     // 倒下时产出的木材
    bool Felled    = false;
};

// ── 树木集合 ──────────────────────────────────────────────

class TreeField {
public:
    static constexpr u32 WOOD_PER_TREE = 1;

    void AddTree(const AABB2D& bounds, i32 health = 5, u32 apples = 0);
    void Clear() { m_Trees.clear(); }

    /// 对包含该点的第一棵活树造成伤害; 树桩不受影响
    ChopResult DamageAt(const glm::vec2& point, i32 damage = 1);

    const std::vector<Tree>& GetTrees() const { return m_Trees; }
    u32 CountAlive() const;

private:
    std::vector<Tree> m_Trees;
};

} // namespace Meadow
