#pragma once

#include "meadow/core/types.h"

#include <string>

namespace Meadow {

// ── 音效提示 ──────────────────────────────────────────────

enum class SoundCue : u8 {
    Hoe = 0,
    Water,
    Plant,
    Axe,
    Success,    // 收获
    Purchase,   // 买入/卖出
};

inline const char* SoundCueName(SoundCue cue) {
    switch (cue) {
        case SoundCue::Hoe:      return "hoe";
        case SoundCue::Water:    return "water";
        case SoundCue::Plant:    return "plant";
        case SoundCue::Axe:      return "axe";
        case SoundCue::Success:  return "success";
        case SoundCue::Purchase: return "purchase";
        default: return "?";
    }
}

// ── 表现层回调接口 ────────────────────────────────────────
//
// 核心只负责通知, 不依赖返回结果。由音频/渲染/HUD 层实现。

class IFeedbackSink {
public:
    virtual ~IFeedbackSink() = default;

    virtual void PlaySound(SoundCue cue) = 0;
    virtual void ShowPreview(const TileCoord& tile) = 0;
    virtual void ClearPreview() = 0;
    virtual void ShowToast(const std::string& text) = 0;

    /// 翻耕状态变化, 需要重建土壤贴图
    virtual void SoilChanged() = 0;
};

class NullFeedbackSink : public IFeedbackSink {
public:
    void PlaySound(SoundCue) override {}
    void ShowPreview(const TileCoord&) override {}
    void ClearPreview() override {}
    void ShowToast(const std::string&) override {}
    void SoilChanged() override {}

    static NullFeedbackSink& Get() {
        static NullFeedbackSink s_Instance;
        return s_Instance;
    }
};

} // namespace Meadow
