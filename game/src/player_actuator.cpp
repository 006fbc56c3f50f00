#include "game/player_actuator.h"
#include "game/soil_grid.h"
#include "game/tree.h"
#include "game/crop.h"
#include "game/feedback.h"
#include "meadow/core/log.h"

#include <algorithm>
#include <cmath>

namespace Meadow {

namespace {

const char* ToolActivity(ToolType tool) {
    switch (tool) {
        case ToolType::Hoe:      return "hoe";
        case ToolType::WaterCan: return "water";
        case ToolType::Axe:      return "axe";
        case ToolType::Harvest:  return "harvest";
        default: return "idle";
    }
}

} // namespace

PlayerActuator::PlayerActuator(PlayerState& player, SoilGrid& soil, TreeField& trees,
                               const CropCatalog& seeds, const ActionTuning& tuning)
    : m_Player(player), m_Soil(soil), m_Trees(trees), m_Seeds(seeds), m_Tuning(tuning),
      m_Feedback(&NullFeedbackSink::Get()),
      m_ToolSwitchTimer(tuning.SwitchCooldown),
      m_SeedSwitchTimer(tuning.SwitchCooldown) {
    m_Player.HitboxHalfSize = tuning.HitboxHalfSize;
    m_WorldBounds = glm::vec2((f32)soil.GetWidth(), (f32)soil.GetHeight()) * (f32)soil.GetTileSize();
}

void PlayerActuator::SetFeedback(IFeedbackSink* sink) {
    m_Feedback = sink ? sink : &NullFeedbackSink::Get();
}

void PlayerActuator::Update(f32 dt, const PlayerInput& input) {
    UpdateTimers(dt);
    ResolveInput(input);
    Move(dt, input);
}

// ── 计时器 ────────────────────────────────────────────────

void PlayerActuator::UpdateTimers(f32 dt) {
    m_ToolSwitchTimer.Update(dt);
    m_SeedSwitchTimer.Update(dt);
    Commit(m_ToolAction, dt);
    Commit(m_SeedAction, dt);
}

void PlayerActuator::Commit(std::optional<PendingAction>& slot, f32 dt) {
    if (!slot) return;
    slot->Remaining -= dt;
    if (slot->Remaining > 0.0f) return;

    PendingAction action = std::move(*slot);
    slot.reset();
    m_Feedback->ClearPreview();
    ApplyAction(action);
    if (!IsRooted()) SetStatus("idle");
}

// ── 输入解析 ──────────────────────────────────────────────

void PlayerActuator::ResolveInput(const PlayerInput& input) {
    if (input.HotbarKey != 0) SelectHotbarKey(input.HotbarKey);
    if (input.HotbarScroll != 0) CycleSlot(input.HotbarScroll);
    if (input.Action) UseSelected();
}

bool PlayerActuator::SelectHotbarKey(i32 key) {
    if (key < 1 || key > HOTBAR_KEYS) return false;
    return SelectSlot((u32)(key - 1));
}

bool PlayerActuator::SelectSlot(u32 slot) {
    if (slot >= m_Player.Hotbar.size()) return false;
    if (slot == m_Player.SelectedSlot) return true;

    const std::string& id = m_Player.Hotbar[slot];
    Timer* cooldown = nullptr;
    if (ParseToolID(id) != ToolType::None) cooldown = &m_ToolSwitchTimer;
    else if (m_Seeds.Has(id))              cooldown = &m_SeedSwitchTimer;

    if (cooldown && cooldown->IsRunning()) return false;
    if (!m_Player.SelectSlot(slot, m_Seeds)) return false;
    if (cooldown) cooldown->Start();
    LOG_TRACE("[玩家] 选中槽位 %u: %s", slot, id.c_str());
    return true;
}

bool PlayerActuator::CycleSlot(i32 delta) {
    i32 n = (i32)m_Player.Hotbar.size();
    if (n == 0 || delta == 0) return false;
    i32 next = (((i32)m_Player.SelectedSlot + delta) % n + n) % n;
    return SelectSlot((u32)next);
}

// ── 动作开始 ──────────────────────────────────────────────

glm::vec2 PlayerActuator::ComputeTargetPoint() const {
    return m_Player.Position + m_Tuning.ToolOffsets[(u8)m_Player.Facing];
}

TileCoord PlayerActuator::ComputeTargetTile() const {
    return Collision2D::WorldToTile(ComputeTargetPoint(), m_Soil.GetTileSize());
}

PendingAction PlayerActuator::MakeAction(ActionKind kind, f32 duration) const {
    PendingAction action;
    action.Kind        = kind;
    action.TargetPoint = ComputeTargetPoint();
    action.Target      = Collision2D::WorldToTile(action.TargetPoint, m_Soil.GetTileSize());
    action.Remaining   = duration;
    return action;
}

bool PlayerActuator::UseSelected() {
    const std::string& id = m_Player.GetSelectedID();
    ToolType tool = ParseToolID(id);
    if (tool == ToolType::Harvest) return HarvestNow().has_value();
    if (tool != ToolType::None)    return StartToolAction(tool);
    if (m_Seeds.Has(id))           return StartSeedAction(id);
    return false;
}

bool PlayerActuator::StartToolAction(ToolType tool) {
    if (tool == ToolType::Harvest) return HarvestNow().has_value();
    if (tool == ToolType::None || m_ToolAction) return false;

    PendingAction action = MakeAction(ActionKind::Tool, m_Tuning.ToolUseTime);
    action.Tool = tool;
    m_Feedback->ShowPreview(action.Target);
    LOG_TRACE("[玩家] 开始使用 %s → %d,%d", ToolID(tool), action.Target.x, action.Target.y);
    m_ToolAction = std::move(action);
    SetStatus(ToolActivity(tool));
    return true;
}

bool PlayerActuator::StartSeedAction(const std::string& seed) {
    if (m_SeedAction || !m_Seeds.Has(seed)) return false;
    if (!m_Player.Seeds.HasItem(seed)) return false;

    PendingAction action = MakeAction(ActionKind::Seed, m_Tuning.SeedUseTime);
    action.Seed = seed;
    m_Feedback->ShowPreview(action.Target);
    LOG_TRACE("[玩家] 开始播种 %s → %d,%d", seed.c_str(), action.Target.x, action.Target.y);
    m_SeedAction = std::move(action);
    SetStatus("seed");
    return true;
}

std::optional<std::string> PlayerActuator::HarvestNow() {
    auto crop = m_Soil.HarvestAt(m_Player.GetHitbox());
    if (crop) {
        m_Player.Items.AddItem(*crop);
        m_Feedback->PlaySound(SoundCue::Success);
        LOG_DEBUG("[玩家] 收获 %s (共 %u)", crop->c_str(), m_Player.Items.CountItem(*crop));
    }
    return crop;
}

// ── 动作提交 ──────────────────────────────────────────────

bool PlayerActuator::ApplyAction(const PendingAction& action) {
    const TileCoord& t = action.Target;

    if (action.Kind == ActionKind::Seed) {
        if (!m_Player.Seeds.HasItem(action.Seed)) return false;
        if (!m_Soil.Plant(t.x, t.y, action.Seed)) return false;
        m_Player.Seeds.RemoveItem(action.Seed, 1);
        m_Feedback->PlaySound(SoundCue::Plant);
        return true;
    }

    switch (action.Tool) {
        case ToolType::Hoe: {
            bool ok = m_Soil.Till(t.x, t.y);
            if (ok) m_Feedback->PlaySound(SoundCue::Hoe);
            return ok;
        }
        case ToolType::WaterCan: {
            // 水壶浇灌目标周围 3×3
            bool any = false;
            for (i32 dy = -1; dy <= 1; dy++)
                for (i32 dx = -1; dx <= 1; dx++)
                    any |= m_Soil.Water(t.x + dx, t.y + dy);
            if (any) m_Feedback->PlaySound(SoundCue::Water);
            return any;
        }
        case ToolType::Axe: {
            ChopResult r = m_Trees.DamageAt(action.TargetPoint);
            if (!r.Hit) return false;
            if (r.Apples) m_Player.Items.AddItem("apple", r.Apples);
            if (r.Wood)   m_Player.Items.AddItem("wood", r.Wood);
            m_Feedback->PlaySound(SoundCue::Axe);
            return true;
        }
        case ToolType::Harvest:
            return HarvestNow().has_value();
        default:
            return false;
    }
}

void PlayerActuator::ResetActions() {
    m_ToolAction.reset();
    m_SeedAction.reset();
    m_ToolSwitchTimer.Stop();
    m_SeedSwitchTimer.Stop();
}

bool PlayerActuator::IsSwitchCoolingDown(ActionKind kind) const {
    return kind == ActionKind::Tool ? m_ToolSwitchTimer.IsRunning()
                                    : m_SeedSwitchTimer.IsRunning();
}

// ── 移动 ──────────────────────────────────────────────────

void PlayerActuator::Move(f32 dt, const PlayerInput& input) {
    if (IsRooted()) return;

    glm::vec2 moveDir = {0, 0};
    if (input.Up)    moveDir.y -= 1;
    if (input.Down)  moveDir.y += 1;
    if (input.Left)  moveDir.x -= 1;
    if (input.Right) moveDir.x += 1;

    if (moveDir.x == 0.0f && moveDir.y == 0.0f) {
        SetStatus("idle");
        return;
    }

    moveDir = glm::normalize(moveDir);
    glm::vec2 pos = m_Player.Position + moveDir * m_Tuning.MoveSpeed * dt;
    m_Player.Position = glm::clamp(pos, glm::vec2(0.0f), m_WorldBounds);

    if (std::abs(moveDir.y) >= std::abs(moveDir.x))
        m_Player.Facing = moveDir.y < 0 ? Direction::Up : Direction::Down;
    else
        m_Player.Facing = moveDir.x > 0 ? Direction::Right : Direction::Left;
    SetStatus("walk");
}

void PlayerActuator::SetStatus(const char* activity) {
    m_Player.Status = std::string(DirectionName(m_Player.Facing)) + "_" + activity;
}

} // namespace Meadow
