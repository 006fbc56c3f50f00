#include "game/player_state.h"
#include "game/crop.h"
#include "meadow/core/log.h"

#include <algorithm>

namespace Meadow {

std::optional<Direction> ParseDirection(const std::string& name) {
    if (name == "down")  return Direction::Down;
    if (name == "up")    return Direction::Up;
    if (name == "left")  return Direction::Left;
    if (name == "right") return Direction::Right;
    return std::nullopt;
}

const char* ToolID(ToolType tool) {
    switch (tool) {
        case ToolType::Hoe:      return "hoe";
        case ToolType::WaterCan: return "water-can";
        case ToolType::Axe:      return "axe";
        case ToolType::Harvest:  return "harvest";
        default: return "";
    }
}

ToolType ParseToolID(const std::string& id) {
    if (id == "hoe")       return ToolType::Hoe;
    if (id == "water-can") return ToolType::WaterCan;
    if (id == "axe")       return ToolType::Axe;
    if (id == "harvest")   return ToolType::Harvest;
    return ToolType::None;
}

// ── Inventory ─────────────────────────────────────────────

void Inventory::AddItem(const std::string& id, u32 count) {
    if (id.empty() || count == 0) return;
    m_Items[id] += count;
}

u32 Inventory::RemoveItem(const std::string& id, u32 count) {
    auto it = m_Items.find(id);
    if (it == m_Items.end()) return 0;
    u32 removed = std::min(it->second, count);
    it->second -= removed;
    return removed;
}

u32 Inventory::CountItem(const std::string& id) const {
    auto it = m_Items.find(id);
    return it != m_Items.end() ? it->second : 0;
}

void Inventory::Replace(const ItemCounts& items) {
    m_Items = items;
}

// ── PlayerState ───────────────────────────────────────────

const std::string& PlayerState::GetSelectedID() const {
    static const std::string s_Empty;
    return SelectedSlot < Hotbar.size() ? Hotbar[SelectedSlot] : s_Empty;
}

bool PlayerState::SelectSlot(u32 slot, const CropCatalog& seeds) {
    if (slot >= Hotbar.size()) return false;
    SelectedSlot = slot;

    const std::string& id = Hotbar[slot];
    ToolType tool = ParseToolID(id);
    if (tool != ToolType::None) {
        SelectedTool = tool;
    } else if (seeds.Has(id)) {
        SelectedSeed = id;
    } else {
        LOG_DEBUG("[玩家] 槽位 %u 的物品 '%s' 既不是工具也不是种子", slot, id.c_str());
    }
    return true;
}

} // namespace Meadow
