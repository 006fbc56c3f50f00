#include "farm_autopilot.h"
#include "meadow/core/log.h"

#include <cmath>

namespace Meadow {

namespace {

constexpr f32 ARRIVE_EPSILON = 2.5f;
constexpr u32 MAX_WALK_FRAMES = 60 * 30;

} // namespace

FarmAutopilot::FarmAutopilot(FarmSession& session, std::vector<TileCoord> plot)
    : m_Session(session), m_Plot(std::move(plot)) {}

void FarmAutopilot::Step(const PlayerInput& input) {
    m_Session.Update(FRAME_DT, input);
    m_Frames++;
}

void FarmAutopilot::Idle(f32 seconds) {
    PlayerInput none;
    for (f32 t = 0.0f; t < seconds; t += FRAME_DT) Step(none);
}

bool FarmAutopilot::WalkTo(const glm::vec2& target) {
    auto& player = m_Session.GetPlayer();
    for (u32 i = 0; i < MAX_WALK_FRAMES; i++) {
        glm::vec2 d = target - player.Position;
        PlayerInput in;
        // 先横后竖, 每帧只按一个方向
        if (std::abs(d.x) > ARRIVE_EPSILON) {
            in.Left = d.x < 0;
            in.Right = d.x > 0;
        } else if (std::abs(d.y) > ARRIVE_EPSILON) {
            in.Up = d.y < 0;
            in.Down = d.y > 0;
        } else {
            return true;
        }
        Step(in);
    }
    LOG_WARN("[自动] 无法到达 (%.0f, %.0f)", target.x, target.y);
    return false;
}

bool FarmAutopilot::WalkToFace(const TileCoord& tile) {
    auto& cfg = m_Session.GetConfig();
    glm::vec2 stand = Collision2D::TileCenter(tile, cfg.TileSize) -
                      cfg.Actions.ToolOffsets[(u8)Direction::Down];

    // 停在上方一步, 再向下一帧以朝下
    f32 step = cfg.Actions.MoveSpeed * FRAME_DT;
    if (!WalkTo(stand - glm::vec2(0.0f, step))) return false;
    PlayerInput down;
    down.Down = true;
    Step(down);
    return m_Session.GetPlayer().Facing == Direction::Down;
}

bool FarmAutopilot::SelectHotbarID(const std::string& id) {
    auto& hotbar = m_Session.GetPlayer().Hotbar;
    for (size_t i = 0; i < hotbar.size() && i < (size_t)PlayerActuator::HOTBAR_KEYS; i++) {
        if (hotbar[i] != id) continue;
        // 等冷却结束
        Idle(m_Session.GetConfig().Actions.SwitchCooldown + FRAME_DT);
        PlayerInput in;
        in.HotbarKey = (i32)i + 1;
        Step(in);
        return m_Session.GetPlayer().SelectedSlot == (u32)i;
    }
    return false;
}

void FarmAutopilot::UseSelectedAndWait() {
    PlayerInput in;
    in.Action = true;
    Step(in);
    while (m_Session.GetActuator().IsRooted()) Step(PlayerInput{});
}

void FarmAutopilot::TendTile(const TileCoord& tile) {
    auto& soil = m_Session.GetSoil();
    if (!soil.InBounds(tile.x, tile.y)) return;
    if (!WalkToFace(tile)) return;

    if (!soil.HasFlag(tile.x, tile.y, TileFlag::Tilled) && SelectHotbarID("hoe"))
        UseSelectedAndWait();

    if (!soil.HasFlag(tile.x, tile.y, TileFlag::Planted)) {
        auto& player = m_Session.GetPlayer();
        for (auto& seed : m_Session.GetCatalog().GetIDs()) {
            if (!player.Seeds.HasItem(seed)) continue;
            if (SelectHotbarID(seed)) {
                UseSelectedAndWait();
                break;
            }
        }
    }

    if (!soil.HasFlag(tile.x, tile.y, TileFlag::Watered) && SelectHotbarID("water-can"))
        UseSelectedAndWait();
}

void FarmAutopilot::HarvestTile(const TileCoord& tile) {
    auto* crop = m_Session.GetSoil().FindCrop(tile.x, tile.y);
    if (!crop || !crop->IsHarvestable()) return;

    WalkTo(Collision2D::TileCenter(tile, m_Session.GetConfig().TileSize));
    if (!m_Session.GetConfig().AutoHarvestOnContact)
        m_Session.GetActuator().HarvestNow();
}

void FarmAutopilot::Trade() {
    auto& player = m_Session.GetPlayer();
    auto& shop = m_Session.GetShop();

    u32 income = shop.SellAll(player);
    if (income > 0) LOG_INFO("[自动] 卖出收入 %u, 现有 %d", income, player.Money);

    // 每种种子补到地块数量
    for (auto& seed : m_Session.GetCatalog().GetIDs()) {
        while (player.Seeds.CountItem(seed) < (u32)m_Plot.size()) {
            if (!shop.BuySeed(player, seed)) break;
        }
    }
}

void FarmAutopilot::RunDay() {
    i32 day = m_Session.GetDay();

    for (auto& tile : m_Plot) HarvestTile(tile);
    for (auto& tile : m_Plot) TendTile(tile);
    Trade();

    m_Session.Sleep();
    while (m_Session.GetDay() == day) Step(PlayerInput{});
}

} // namespace Meadow
