#include "meadow/core/timer.h"

#include <algorithm>

namespace Meadow {

void Timer::Start() {
    m_Running = true;
    m_Elapsed = 0.0f;
}

bool Timer::Update(f32 dt) {
    if (!m_Running) return false;
    m_Elapsed += dt;
    if (m_Elapsed < m_Duration) return false;

    m_Running = false;
    if (m_Callback) m_Callback();
    return true;
}

f32 Timer::GetRemaining() const {
    return std::max(0.0f, m_Duration - m_Elapsed);
}

f32 Timer::GetProgress() const {
    if (m_Duration <= 0.0f) return 1.0f;
    return std::clamp(m_Elapsed / m_Duration, 0.0f, 1.0f);
}

} // namespace Meadow
