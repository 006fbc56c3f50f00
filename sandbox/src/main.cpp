// ── Meadow Sandbox ──────────────────────────────────────────
// 无窗口演示: 读取配置与存档, 自动耕种 N 天, 输出汇总后存档

#include "meadow/meadow.h"
#include "game/farm_session.h"
#include "game/feedback.h"
#include "farm_autopilot.h"

#include <cstdlib>
#include <cstring>
#include <string>

namespace {

struct LaunchOptions {
    std::string ConfigPath = "data/settings/game.json";
    Meadow::u32 Slot = 0;       // 0 = 使用配置
    Meadow::u32 Days = 3;
    bool Debug = false;
    bool Help  = false;
};

bool ParseU32(const char* s, Meadow::u32& out) {
    char* end = nullptr;
    unsigned long v = std::strtoul(s, &end, 10);
    if (!s[0] || *end != '\0' || s[0] == '-') return false;
    out = (Meadow::u32)v;
    return true;
}

bool ParseArgs(int argc, char** argv, LaunchOptions& opts) {
    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        bool hasValue = i + 1 < argc;

        if (std::strcmp(arg, "--debug") == 0) {
            opts.Debug = true;
        } else if (std::strcmp(arg, "--help") == 0 || std::strcmp(arg, "-h") == 0) {
            opts.Help = true;
        } else if (std::strcmp(arg, "--slot") == 0 && hasValue) {
            if (!ParseU32(argv[++i], opts.Slot) || opts.Slot == 0) {
                LOG_ERROR("--slot 需要正整数: %s", argv[i]);
                return false;
            }
        } else if (std::strcmp(arg, "--days") == 0 && hasValue) {
            if (!ParseU32(argv[++i], opts.Days)) {
                LOG_ERROR("--days 需要非负整数: %s", argv[i]);
                return false;
            }
        } else if (std::strcmp(arg, "--config") == 0 && hasValue) {
            opts.ConfigPath = argv[++i];
        } else {
            LOG_ERROR("未知参数: %s", arg);
            return false;
        }
    }
    return true;
}

// 表现层替身: 把提示写进日志
class LogFeedbackSink : public Meadow::IFeedbackSink {
public:
    void PlaySound(Meadow::SoundCue cue) override {
        LOG_TRACE("[音效] %s", Meadow::SoundCueName(cue));
    }
    void ShowPreview(const Meadow::TileCoord& tile) override {
        LOG_TRACE("[预览] %d,%d", tile.x, tile.y);
    }
    void ClearPreview() override {}
    void ShowToast(const std::string& text) override {
        LOG_INFO("[提示] %s", text.c_str());
    }
    void SoilChanged() override { m_SoilRebuilds++; }

    Meadow::u32 GetSoilRebuilds() const { return m_SoilRebuilds; }

private:
    Meadow::u32 m_SoilRebuilds = 0;
};

void PrintSummary(const Meadow::FarmSession& session) {
    auto& player = session.GetPlayer();
    auto& soil = session.GetSoil();

    LOG_INFO("── 第 %d 天 %s──", session.GetDay(), session.IsRaining() ? "(下雨) " : "");
    LOG_INFO("  金钱: %d", player.Money);
    for (auto& [id, count] : player.Items.GetAll())
        LOG_INFO("  物品 %-8s x%u", id.c_str(), count);
    for (auto& [id, count] : player.Seeds.GetAll())
        LOG_INFO("  种子 %-8s x%u", id.c_str(), count);
    LOG_INFO("  已翻耕 %u 格, 已浇水 %u 格, 作物 %zu 株",
             soil.CountFlag(Meadow::TileFlag::Tilled),
             soil.CountFlag(Meadow::TileFlag::Watered),
             soil.GetCrops().size());
    for (auto& crop : soil.GetCrops()) {
        LOG_DEBUG("  %s @ %d,%d 阶段 %u/%u", crop.GetType().c_str(),
                  crop.GetTile().x, crop.GetTile().y, crop.GetStage(), crop.GetMaxStage());
    }
}

} // namespace

int main(int argc, char** argv) {
    Meadow::Logger::Init();
    LOG_INFO("=== Meadow v%s ===", MEADOW_VERSION_STRING);

    LaunchOptions opts;
    if (!ParseArgs(argc, argv, opts)) {
        LOG_INFO("用法: meadow_sandbox [--slot N] [--days N] [--config path] [--debug]");
        return 1;
    }
    if (opts.Help) {
        LOG_INFO("用法: meadow_sandbox [--slot N] [--days N] [--config path] [--debug]");
        return 0;
    }

    Meadow::GameConfig config;
    if (!Meadow::LoadGameConfig(opts.ConfigPath, config)) {
        LOG_WARN("配置读取失败, 使用默认配置");
        config = Meadow::GameConfig{};
    }
    Meadow::Logger::SetLevel(opts.Debug ? Meadow::LogLevel::Debug
                                        : Meadow::Logger::ParseLevel(config.LogLevel));
    if (opts.Slot != 0) config.SaveSlot = opts.Slot;

    try {
        Meadow::SaveSystem::EnsureDataDirs(config.DataDir);
    } catch (const Meadow::SaveError& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
    std::string logPath = config.DataDir + "/cache/sandbox.log";
    if (!Meadow::Logger::SetLogFile(logPath))
        LOG_WARN("无法打开日志文件 %s", logPath.c_str());

    Meadow::FarmSession session(config);
    LogFeedbackSink feedback;
    session.SetFeedback(&feedback);

    if (session.GetSaveSystem().HasSlot(config.SaveSlot)) {
        session.LoadGame(config.SaveSlot);
    } else {
        LOG_INFO("槽位 %u 没有存档, 开始新农场", config.SaveSlot);
    }
    PrintSummary(session);

    // 地块: 窗口中部一行
    std::vector<Meadow::TileCoord> plot;
    Meadow::i32 row = config.GridSize.y / 2 + 1;
    for (Meadow::i32 x = config.GridSize.x / 2 - 2; x < config.GridSize.x / 2 + 2; x++)
        plot.push_back({x, row});

    Meadow::FarmAutopilot pilot(session, plot);
    for (Meadow::u32 d = 0; d < opts.Days; d++) {
        pilot.RunDay();
        PrintSummary(session);
    }

    bool saved = session.SaveGame(session.GetActiveSlot());
    LOG_INFO("运行 %u 帧, 土壤重建 %u 次", pilot.GetFramesRun(), feedback.GetSoilRebuilds());

    Meadow::Logger::Shutdown();
    return saved ? 0 : 1;
}
