#pragma once

#include "meadow/core/types.h"
#include "meadow/core/timer.h"

#include <functional>

namespace Meadow {

// ── 日切过渡 ──────────────────────────────────────────────
//
// Idle → Running(渐变) → 触发日切回调 → Idle
// 只负责 "时间到了", 一天意味着什么由回调的持有者决定。

class DayCycleController {
public:
    using DayAdvanceCallback = std::function<void()>;

    explicit DayCycleController(f32 duration = 1.0f);
    DayCycleController(const DayCycleController&) = delete;
    DayCycleController& operator=(const DayCycleController&) = delete;

    /// 已在运行时无效果, 返回是否真正开始
    bool Start();

    /// 到期时同步调用一次回调; 返回本帧是否触发
    bool Tick(f32 dt);

    void OnDayAdvance(DayAdvanceCallback callback) { m_OnDayAdvance = std::move(callback); }

    bool IsRunning()   const { return m_Timer.IsRunning(); }
    f32  GetProgress() const { return IsRunning() ? m_Timer.GetElapsed() : 0.0f; }
    f32  GetDuration() const { return m_Timer.GetDuration(); }

    /// 渐变遮罩透明度 0..255 (不运行时为 0)
    u8 FadeAlpha() const;

private:
    Timer m_Timer;
    DayAdvanceCallback m_OnDayAdvance;
};

} // namespace Meadow
