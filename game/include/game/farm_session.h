#pragma once

#include "meadow/core/types.h"
#include "game/config.h"
#include "game/crop.h"
#include "game/day_cycle.h"
#include "game/player_actuator.h"
#include "game/player_state.h"
#include "game/save_system.h"
#include "game/shop.h"
#include "game/snapshot.h"
#include "game/soil_grid.h"
#include "game/tree.h"

#include <random>

namespace Meadow {

class IFeedbackSink;

// ── 农场会话 ──────────────────────────────────────────────
//
// 持有全部模拟组件并负责串联:
//   帧: 执行器 (计时 → 动作 → 移动) → 接触收获 → 日切过渡
//   日切: 天数+1 → 作物生长 → 清除浇水 → 决定降雨 → 自动存档

class FarmSession {
public:
    explicit FarmSession(const GameConfig& config, u32 rngSeed = std::random_device{}());
    FarmSession(const FarmSession&) = delete;
    FarmSession& operator=(const FarmSession&) = delete;

    void SetFeedback(IFeedbackSink* sink);

    void Update(f32 dt, const PlayerInput& input);

    /// 睡觉: 开始日切过渡; 已在过渡中返回 false
    bool Sleep();

    /// 日切回调本体 (过渡结束时调用)
    void AdvanceDay();

    // ── 存档 ─────────────────────────────────
    SaveSnapshot BuildSnapshot() const;
    void RestoreSnapshot(const SaveSnapshot& snapshot);

    /// 失败时记录日志并返回 false, 内存状态不变
    bool SaveGame(u32 slot);
    bool LoadGame(u32 slot);

    /// 1/oneIn 概率返回 true; oneIn 为 0 时永不下雨
    static bool RollRain(std::mt19937& rng, u32 oneIn);

    // ── 访问 ─────────────────────────────────
    i32  GetDay() const { return m_Day; }
    bool IsRaining() const { return m_Soil.IsRaining(); }
    u32  GetActiveSlot() const { return m_ActiveSlot; }
    void SetActiveSlot(u32 slot) { m_ActiveSlot = slot; }

    const GameConfig&   GetConfig()   const { return m_Config; }
    const CropCatalog&  GetCatalog()  const { return m_Catalog; }
    SoilGrid&           GetSoil()           { return m_Soil; }
    const SoilGrid&     GetSoil()     const { return m_Soil; }
    TreeField&          GetTrees()          { return m_Trees; }
    PlayerState&        GetPlayer()         { return m_Player; }
    const PlayerState&  GetPlayer()   const { return m_Player; }
    PlayerActuator&     GetActuator()       { return m_Actuator; }
    Shop&               GetShop()           { return m_Shop; }
    DayCycleController& GetDayCycle()       { return m_DayCycle; }
    const SaveSystem&   GetSaveSystem() const { return m_Saves; }

private:
    static CropCatalog BuildCatalog(const GameConfig& config);
    void SpawnTrees();
    void RelocatePlayerNearCrops();

    GameConfig         m_Config;
    CropCatalog        m_Catalog;
    SoilGrid           m_Soil;
    TreeField          m_Trees;
    PlayerState        m_Player;
    PlayerActuator     m_Actuator;
    Shop               m_Shop;
    DayCycleController m_DayCycle;
    SaveSystem         m_Saves;
    std::mt19937       m_Rng;

    i32 m_Day = 1;
    u32 m_ActiveSlot = 1;
    IFeedbackSink* m_Feedback;
};

} // namespace Meadow
