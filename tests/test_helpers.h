#pragma once

#include "game/feedback.h"

#include <filesystem>
#include <random>
#include <string>
#include <vector>

namespace Meadow::Testing {

// ── 记录所有提示的反馈替身 ──────────────────────────────────

class RecordingFeedback : public IFeedbackSink {
public:
    void PlaySound(SoundCue cue) override { Sounds.push_back(cue); }
    void ShowPreview(const TileCoord& tile) override { Previews.push_back(tile); }
    void ClearPreview() override { Clears++; }
    void ShowToast(const std::string& text) override { Toasts.push_back(text); }
    void SoilChanged() override { SoilRebuilds++; }

    u32 CountSound(SoundCue cue) const {
        u32 n = 0;
        for (auto s : Sounds) n += (s == cue);
        return n;
    }

    std::vector<SoundCue>    Sounds;
    std::vector<TileCoord>   Previews;
    std::vector<std::string> Toasts;
    u32 Clears = 0;
    u32 SoilRebuilds = 0;
};

// ── 每个测试独立的临时目录 ──────────────────────────────────

inline std::filesystem::path MakeTempDir(const std::string& tag) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("meadow_" + tag + "_" + std::to_string(rd()));
    std::filesystem::create_directories(dir);
    return dir;
}

} // namespace Meadow::Testing
