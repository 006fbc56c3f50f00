#pragma once

#include "meadow/core/types.h"
#include "meadow/core/timer.h"
#include "game/config.h"
#include "game/player_state.h"

#include <glm/glm.hpp>
#include <optional>
#include <string>

namespace Meadow {

class SoilGrid;
class TreeField;
class CropCatalog;
class IFeedbackSink;

// ── 动作 ──────────────────────────────────────────────────

enum class ActionKind : u8 {
    Tool = 0,
    Seed,
};

/// 进行中的定时动作; 目标在开始时冻结, 到期时按值提交
struct PendingAction {
    ActionKind  Kind = ActionKind::Tool;
    ToolType    Tool = ToolType::None;
    std::string Seed;
    TileCoord   Target      = {0, 0};
    glm::vec2   TargetPoint = {0.0f, 0.0f};   // 像素, 斧头用
    f32         Remaining   = 0.0f;
};

// ── 每帧输入 (由输入层填充) ───────────────────────────────

struct PlayerInput {
    bool Up    = false;
    bool Down  = false;
    bool Left  = false;
    bool Right = false;
    bool Action = false;       // 使用当前槽位 (边沿触发)
    i32  HotbarKey = 0;        // 1..5 → 槽位 0..4, 0 = 无
    i32  HotbarScroll = 0;     // 滚轮 ±1
};

// ── 玩家动作执行器 ────────────────────────────────────────
//
// 帧内顺序: 计时器 → 目标解析 (选槽/开始动作) → 移动。
// 动作进行中玩家被定住, 游戏内无法取消, 只能自然到期; 读档时整体清空。

class PlayerActuator {
public:
    static constexpr i32 HOTBAR_KEYS = 5;

    PlayerActuator(PlayerState& player, SoilGrid& soil, TreeField& trees,
                   const CropCatalog& seeds, const ActionTuning& tuning);

    void SetFeedback(IFeedbackSink* sink);

    /// 移动范围 (像素), 默认取土壤网格大小
    void SetWorldBounds(const glm::vec2& size) { m_WorldBounds = size; }

    void Update(f32 dt, const PlayerInput& input);

    // ── 分步 ─────────────────────────────────
    void UpdateTimers(f32 dt);
    void ResolveInput(const PlayerInput& input);
    void Move(f32 dt, const PlayerInput& input);

    // ── 槽位选择 ─────────────────────────────
    bool SelectHotbarKey(i32 key);
    bool SelectSlot(u32 slot);
    bool CycleSlot(i32 delta);

    // ── 动作 ─────────────────────────────────
    bool UseSelected();
    bool StartToolAction(ToolType tool);
    bool StartSeedAction(const std::string& seed);

    /// 收获工具: 立即查询玩家脚下, 不计时
    std::optional<std::string> HarvestNow();

    /// 丢弃进行中的动作和切换冷却 (读档时用)
    void ResetActions();

    /// 把动作作用到世界上; 返回是否产生效果
    bool ApplyAction(const PendingAction& action);

    glm::vec2 ComputeTargetPoint() const;
    TileCoord ComputeTargetTile() const;

    bool IsRooted()   const { return m_ToolAction.has_value() || m_SeedAction.has_value(); }
    bool IsToolBusy() const { return m_ToolAction.has_value(); }
    bool IsSeedBusy() const { return m_SeedAction.has_value(); }
    bool IsSwitchCoolingDown(ActionKind kind) const;

    const std::optional<PendingAction>& GetToolAction() const { return m_ToolAction; }
    const std::optional<PendingAction>& GetSeedAction() const { return m_SeedAction; }

private:
    PendingAction MakeAction(ActionKind kind, f32 duration) const;
    void SetStatus(const char* activity);
    void Commit(std::optional<PendingAction>& slot, f32 dt);

    PlayerState&       m_Player;
    SoilGrid&          m_Soil;
    TreeField&         m_Trees;
    const CropCatalog& m_Seeds;
    ActionTuning       m_Tuning;
    IFeedbackSink*     m_Feedback;

    std::optional<PendingAction> m_ToolAction;
    std::optional<PendingAction> m_SeedAction;
    Timer m_ToolSwitchTimer;
    Timer m_SeedSwitchTimer;

    glm::vec2 m_WorldBounds = {0.0f, 0.0f};
};

} // namespace Meadow
