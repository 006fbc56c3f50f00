#include "game/farm_session.h"
#include "game/feedback.h"
#include "meadow/core/log.h"

#include <algorithm>

namespace Meadow {

CropCatalog FarmSession::BuildCatalog(const GameConfig& config) {
    CropCatalog catalog;
    for (auto& def : config.Crops) catalog.Register(def);
    return catalog;
}

FarmSession::FarmSession(const GameConfig& config, u32 rngSeed)
    : m_Config(config),
      m_Catalog(BuildCatalog(config)),
      m_Soil((u32)std::max(config.GridSize.x, 0), (u32)std::max(config.GridSize.y, 0),
             config.TileSize, m_Catalog),
      m_Actuator(m_Player, m_Soil, m_Trees, m_Catalog, config.Actions),
      m_Shop(m_Catalog, config.SellPrices),
      m_DayCycle(config.DayTransitionTime),
      m_Saves(config.DataDir),
      m_Rng(rngSeed),
      m_ActiveSlot(config.SaveSlot),
      m_Feedback(&NullFeedbackSink::Get()) {
    m_Soil.MarkAllFarmable();
    SpawnTrees();

    m_Player.Money = config.StartingMoney;
    m_Player.Seeds.Replace(config.StartingSeeds);
    m_Player.Hotbar = config.Hotbar;
    m_Player.Position = glm::vec2(config.WindowSize) * 0.5f;
    m_Player.SelectSlot(0, m_Catalog);

    m_DayCycle.OnDayAdvance([this]() { AdvanceDay(); });

    LOG_INFO("[农场] 会话开始: 网格 %dx%d, %u 种作物, %zu 棵树",
             config.GridSize.x, config.GridSize.y, m_Catalog.Size(), m_Trees.GetTrees().size());
}

void FarmSession::SetFeedback(IFeedbackSink* sink) {
    m_Feedback = sink ? sink : &NullFeedbackSink::Get();
    m_Soil.SetFeedback(sink);
    m_Actuator.SetFeedback(sink);
    m_Shop.SetFeedback(sink);
}

void FarmSession::SpawnTrees() {
    m_Trees.Clear();
    for (auto& spawn : m_Config.Trees)
        m_Trees.AddTree(AABB2D(spawn.Center, spawn.Size * 0.5f), spawn.Health, spawn.Apples);
}

// ── 帧更新 ────────────────────────────────────────────────

void FarmSession::Update(f32 dt, const PlayerInput& input) {
    m_Actuator.Update(dt, input);

    if (m_Config.AutoHarvestOnContact) m_Actuator.HarvestNow();

    m_DayCycle.Tick(dt);
}

bool FarmSession::Sleep() {
    if (!m_DayCycle.Start()) return false;
    LOG_INFO("[农场] 第 %d 天结束, 睡觉", m_Day);
    return true;
}

bool FarmSession::RollRain(std::mt19937& rng, u32 oneIn) {
    if (oneIn == 0) return false;
    std::uniform_int_distribution<u32> dist(0, oneIn - 1);
    return dist(rng) == 0;
}

void FarmSession::AdvanceDay() {
    m_Day++;
    m_Soil.UpdatePlants();
    m_Soil.RemoveWater();

    bool raining = RollRain(m_Rng, m_Config.RainOneIn);
    m_Soil.SetRaining(raining);
    if (raining) m_Soil.WaterAll();

    LOG_INFO("[农场] 第 %d 天%s, 作物 %zu 株", m_Day, raining ? " (下雨)" : "",
             m_Soil.GetCrops().size());

    if (SaveGame(m_ActiveSlot)) return;

    LOG_WARN("[农场] 自动存档失败, 改用默认槽位 %u 重试", m_Config.DefaultSaveSlot);
    if (SaveGame(m_Config.DefaultSaveSlot)) m_ActiveSlot = m_Config.DefaultSaveSlot;
}

// ── 快照 ──────────────────────────────────────────────────

SaveSnapshot FarmSession::BuildSnapshot() const {
    SaveSnapshot snap;
    snap.Day = m_Day;

    auto& p = snap.Player;
    p.Money = m_Player.Money;
    p.Inventory = m_Player.Items.GetAll();
    p.SeedInventory = m_Player.Seeds.GetAll();
    p.Pos = glm::ivec2(glm::round(m_Player.Position));
    p.Facing = m_Player.Facing;
    p.Status = m_Player.Status;

    snap.Soil = m_Soil.CaptureSoil();
    snap.Plants = m_Soil.CapturePlants();
    return snap;
}

void FarmSession::RestoreSnapshot(const SaveSnapshot& snapshot) {
    m_Day = snapshot.Day;
    m_Actuator.ResetActions();
    m_Soil.SetRaining(false);   // 天气不存档, 读档当天视为晴天
    m_Soil.Restore(snapshot.Soil, snapshot.Plants);
    m_Actuator.SetWorldBounds(
        glm::vec2((f32)m_Soil.GetWidth(), (f32)m_Soil.GetHeight()) * (f32)m_Soil.GetTileSize());

    auto& p = snapshot.Player;
    if (p.Money)         m_Player.Money = *p.Money;
    if (p.Inventory)     m_Player.Items.Replace(*p.Inventory);
    if (p.SeedInventory) m_Player.Seeds.Replace(*p.SeedInventory);
    if (p.Facing)        m_Player.Facing = *p.Facing;
    if (!p.Status.empty()) m_Player.Status = p.Status;
    if (p.Pos) {
        m_Player.Position = glm::vec2(*p.Pos);
        RelocatePlayerNearCrops();
    }

    // 种子数量可能变了, 重新同步选择
    m_Player.SelectSlot(m_Player.SelectedSlot, m_Catalog);
}

void FarmSession::RelocatePlayerNearCrops() {
    auto& crops = m_Soil.GetCrops();
    if (crops.empty()) return;

    f32 threshold = (f32)std::max(m_Config.WindowSize.x, m_Config.WindowSize.y);
    i32 ts = m_Soil.GetTileSize();
    for (auto& crop : crops) {
        if (glm::distance(m_Player.Position, Collision2D::TileCenter(crop.GetTile(), ts)) <= threshold)
            return;
    }

    glm::vec2 target = Collision2D::TileCenter(crops.front().GetTile(), ts);
    LOG_WARN("[农场] 存档位置 (%.0f, %.0f) 远离所有作物, 移到 (%.0f, %.0f)",
             m_Player.Position.x, m_Player.Position.y, target.x, target.y);
    m_Player.Position = target;
}

bool FarmSession::SaveGame(u32 slot) {
    try {
        m_Saves.Save(slot, BuildSnapshot());
    } catch (const SaveError& e) {
        LOG_ERROR("[农场] 存档槽位 %u 失败: %s", slot, e.what());
        return false;
    }
    m_Feedback->ShowToast("已保存 (第 " + std::to_string(m_Day) + " 天)");
    return true;
}

bool FarmSession::LoadGame(u32 slot) {
    LoadResult result;
    try {
        result = m_Saves.Load(slot);
    } catch (const LoadError& e) {
        LOG_ERROR("[农场] 读取槽位 %u 失败, 保留当前状态: %s", slot, e.what());
        return false;
    }

    RestoreSnapshot(result.Snapshot);
    m_ActiveSlot = slot;
    m_Feedback->ShowToast(result.FromBackup ? "已从备份读取存档" : "已读取存档");
    return true;
}

} // namespace Meadow
