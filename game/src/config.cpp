#include "game/config.h"
#include "game/player_state.h"
#include "meadow/core/log.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace Meadow {

namespace {

glm::vec2 ReadVec2(const json& j, const glm::vec2& fallback) {
    if (!j.is_array() || j.size() != 2) return fallback;
    return {j[0].get<f32>(), j[1].get<f32>()};
}

glm::ivec2 ReadIVec2(const json& j, const glm::ivec2& fallback) {
    if (!j.is_array() || j.size() != 2) return fallback;
    return {j[0].get<i32>(), j[1].get<i32>()};
}

void ReadActions(const json& a, ActionTuning& out) {
    out.MoveSpeed      = a.value("move_speed", out.MoveSpeed);
    out.ToolUseTime    = a.value("tool_use_time", out.ToolUseTime);
    out.SeedUseTime    = a.value("seed_use_time", out.SeedUseTime);
    out.SwitchCooldown = a.value("switch_cooldown", out.SwitchCooldown);
    if (a.contains("hitbox_half_size"))
        out.HitboxHalfSize = ReadVec2(a["hitbox_half_size"], out.HitboxHalfSize);

    if (a.contains("tool_offsets") && a["tool_offsets"].is_object()) {
        for (auto& [name, vec] : a["tool_offsets"].items()) {
            auto dir = ParseDirection(name);
            if (!dir) {
                LOG_WARN("[配置] 未知朝向 '%s'", name.c_str());
                continue;
            }
            out.ToolOffsets[(u8)*dir] = ReadVec2(vec, out.ToolOffsets[(u8)*dir]);
        }
    }
}

} // namespace

bool LoadGameConfig(const std::string& path, GameConfig& config) {
    if (!std::filesystem::exists(path)) {
        LOG_INFO("[配置] %s 不存在, 使用默认配置", path.c_str());
        return true;
    }

    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("[配置] 无法打开文件: %s", path.c_str());
        return false;
    }

    GameConfig cfg = config;
    try {
        json root = json::parse(file);

        if (root.contains("window_size")) cfg.WindowSize = ReadIVec2(root["window_size"], cfg.WindowSize);
        cfg.TileSize = root.value("tile_size", cfg.TileSize);
        if (cfg.TileSize <= 0) {
            LOG_ERROR("[配置] tile_size 必须为正数: %d", cfg.TileSize);
            return false;
        }
        // 网格默认由窗口推导
        cfg.GridSize = cfg.WindowSize / cfg.TileSize;
        if (root.contains("grid_size")) cfg.GridSize = ReadIVec2(root["grid_size"], cfg.GridSize);

        if (root.contains("actions")) ReadActions(root["actions"], cfg.Actions);

        cfg.DayTransitionTime = root.value("day_transition_time", cfg.DayTransitionTime);
        cfg.RainOneIn         = root.value("rain_one_in", cfg.RainOneIn);
        cfg.StartingMoney     = root.value("starting_money", cfg.StartingMoney);
        if (root.contains("starting_seeds"))
            cfg.StartingSeeds = root["starting_seeds"].get<ItemCounts>();
        if (root.contains("hotbar"))
            cfg.Hotbar = root["hotbar"].get<std::vector<std::string>>();

        if (root.contains("crops")) {
            cfg.Crops.clear();
            for (auto& c : root["crops"]) {
                CropDef def;
                def.ID        = c.value("id", "");
                def.Frames    = c.value("frames", def.Frames);
                def.SeedPrice = c.value("seed_price", def.SeedPrice);
                def.SellPrice = c.value("sell_price", def.SellPrice);
                if (def.ID.empty()) {
                    LOG_WARN("[配置] 跳过缺少 id 的作物定义");
                    continue;
                }
                cfg.Crops.push_back(def);
            }
        }
        if (root.contains("sell_prices"))
            cfg.SellPrices = root["sell_prices"].get<std::unordered_map<std::string, u32>>();

        if (root.contains("trees")) {
            cfg.Trees.clear();
            for (auto& t : root["trees"]) {
                TreeSpawn spawn;
                if (t.contains("center")) spawn.Center = ReadVec2(t["center"], spawn.Center);
                if (t.contains("size"))   spawn.Size   = ReadVec2(t["size"], spawn.Size);
                spawn.Health = t.value("health", spawn.Health);
                spawn.Apples = t.value("apples", spawn.Apples);
                cfg.Trees.push_back(spawn);
            }
        }

        cfg.DataDir         = root.value("data_dir", cfg.DataDir);
        cfg.SaveSlot        = root.value("save_slot", cfg.SaveSlot);
        cfg.DefaultSaveSlot = root.value("default_save_slot", cfg.DefaultSaveSlot);
        cfg.LogLevel        = root.value("log_level", cfg.LogLevel);
        cfg.AutoHarvestOnContact = root.value("auto_harvest", cfg.AutoHarvestOnContact);
    } catch (const json::exception& e) {
        LOG_ERROR("[配置] JSON 解析失败: %s (%s)", path.c_str(), e.what());
        return false;
    }

    config = cfg;
    LOG_INFO("[配置] 已加载 %s (网格 %dx%d, tile %d)",
             path.c_str(), config.GridSize.x, config.GridSize.y, config.TileSize);
    return true;
}

} // namespace Meadow
