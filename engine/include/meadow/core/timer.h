#pragma once

#include "meadow/core/types.h"

#include <functional>

namespace Meadow {

// ── 倒计时器 ────────────────────────────────────────────────
//
// 所有定时动作 (工具/种子使用、切换冷却、日切渐变) 共用的原语。
// 到期时停止并调用一次回调 (可为空)。

class Timer {
public:
    using Callback = std::function<void()>;

    Timer() = default;
    explicit Timer(f32 duration, Callback callback = nullptr)
        : m_Duration(duration), m_Callback(std::move(callback)) {}

    void Start();
    /// 中止计时, 不触发回调
    void Stop() { m_Running = false; }

    /// 推进计时; 到期时返回 true (本帧触发)
    bool Update(f32 dt);

    bool IsRunning() const { return m_Running; }
    bool Finished()  const { return !m_Running && m_Elapsed >= m_Duration; }

    f32 GetDuration() const { return m_Duration; }
    f32 GetElapsed()  const { return m_Elapsed; }
    f32 GetRemaining() const;
    f32 GetProgress() const;  // 0..1

private:
    f32      m_Duration = 0.0f;
    f32      m_Elapsed  = 0.0f;
    bool     m_Running  = false;
    Callback m_Callback;
};

} // namespace Meadow
