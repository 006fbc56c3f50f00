#include "game/tree.h"
#include "meadow/core/log.h"

#include <algorithm>

namespace Meadow {

void TreeField::AddTree(const AABB2D& bounds, i32 health, u32 apples) {
    Tree tree;
    tree.Bounds = bounds;
    tree.Health = health;
    tree.Apples = apples;
    m_Trees.push_back(tree);
}

ChopResult TreeField::DamageAt(const glm::vec2& point, i32 damage) {
    ChopResult result;
    for (auto& tree : m_Trees) {
        if (!tree.Alive || !tree.Bounds.Contains(point)) continue;

        result.Hit = true;
        tree.Health -= damage;
        if (tree.Apples > 0) {
            tree.Apples--;
            result.Apples = 1;
        }
        if (tree.Health <= 0) {
            tree.Health = 0;
            tree.Alive  = false;
            result.Felled = true;
            result.Wood   = WOOD_PER_TREE;
            LOG_DEBUG("[树木] 树倒下 @ %.0f,%.0f", tree.Bounds.GetCenter().x, tree.Bounds.GetCenter().y);
        }
        break;
    }
    return result;
}

u32 TreeField::CountAlive() const {
    return (u32)std::count_if(m_Trees.begin(), m_Trees.end(),
                              [](const Tree& t) { return t.Alive; });
}

} // namespace Meadow
