#pragma once

#include "game/farm_session.h"

#include <string>
#include <vector>

namespace Meadow {

// ── 自动驾驶 ──────────────────────────────────────────────
//
// 代替键盘: 只通过 PlayerInput 驱动会话, 走到地块前面翻地/播种/浇水,
// 收获成熟作物后卖掉, 再买种子, 然后睡觉。

class FarmAutopilot {
public:
    static constexpr f32 FRAME_DT = 1.0f / 60.0f;

    FarmAutopilot(FarmSession& session, std::vector<TileCoord> plot);

    /// 完整地过一天 (直到日切回调触发)
    void RunDay();

    u32 GetFramesRun() const { return m_Frames; }

private:
    void Step(const PlayerInput& input);
    void Idle(f32 seconds);

    /// 走到能用工具作用于 tile 的位置 (面朝下)
    bool WalkToFace(const TileCoord& tile);
    bool WalkTo(const glm::vec2& target);

    bool SelectHotbarID(const std::string& id);
    void UseSelectedAndWait();

    void TendTile(const TileCoord& tile);
    void HarvestTile(const TileCoord& tile);
    void Trade();

    FarmSession& m_Session;
    std::vector<TileCoord> m_Plot;
    u32 m_Frames = 0;
};

} // namespace Meadow
