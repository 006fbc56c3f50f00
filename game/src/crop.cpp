#include "game/crop.h"
#include "meadow/core/log.h"

#include <algorithm>

namespace Meadow {

void CropCatalog::Register(const CropDef& def) {
    if (m_Defs.find(def.ID) == m_Defs.end()) m_Order.push_back(def.ID);
    m_Defs[def.ID] = def;
    LOG_DEBUG("[作物] 注册: %s (%u 阶段, 种子 %u, 售价 %u)",
              def.ID.c_str(), def.MaxStage(), def.SeedPrice, def.SellPrice);
}

const CropDef* CropCatalog::Find(const std::string& id) const {
    auto it = m_Defs.find(id);
    return it != m_Defs.end() ? &it->second : nullptr;
}

u32 CropCatalog::MaxStage(const std::string& id) const {
    auto* def = Find(id);
    return def ? def->MaxStage() : DEFAULT_MAX_STAGE;
}

Crop::Crop(const TileCoord& tile, std::string type, u32 maxStage, u32 stage)
    : m_Tile(tile), m_Type(std::move(type)),
      m_Stage(std::min(stage, maxStage)), m_MaxStage(maxStage) {}

bool Crop::Advance() {
    if (m_Stage >= m_MaxStage) return false;
    m_Stage++;
    return true;
}

} // namespace Meadow
