#include "game/day_cycle.h"
#include "meadow/core/log.h"

#include <algorithm>

namespace Meadow {

DayCycleController::DayCycleController(f32 duration)
    : m_Timer(duration, [this]() {
          LOG_DEBUG("[日切] 过渡结束, 触发日切");
          if (m_OnDayAdvance) m_OnDayAdvance();
      }) {}

bool DayCycleController::Start() {
    if (m_Timer.IsRunning()) return false;
    m_Timer.Start();
    LOG_DEBUG("[日切] 开始过渡 (%.2fs)", m_Timer.GetDuration());
    return true;
}

bool DayCycleController::Tick(f32 dt) {
    return m_Timer.Update(dt);
}

u8 DayCycleController::FadeAlpha() const {
    if (!IsRunning()) return 0;
    return (u8)std::clamp(m_Timer.GetProgress() * 255.0f, 0.0f, 255.0f);
}

} // namespace Meadow
