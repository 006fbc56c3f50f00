#include "game/save_system.h"
#include "meadow/core/log.h"

#include <algorithm>
#include <cstdio>
#include <limits>
#include <ctime>
#include <fstream>
#include <regex>

#ifdef _WIN32
    #include <io.h>
#else
    #include <unistd.h>
#endif

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace Meadow {

// ═══════════════════════════════════════════════════════════════
// 快照序列化
// ═══════════════════════════════════════════════════════════════

namespace {

json PlayerToJson(const PlayerSnapshot& p) {
    json j = json::object();
    if (p.Money)         j["money"] = *p.Money;
    if (p.Inventory)     j["inventory"] = *p.Inventory;
    if (p.SeedInventory) j["seed_inventory"] = *p.SeedInventory;
    if (p.Pos)           j["pos"] = {p.Pos->x, p.Pos->y};
    j["status"] = p.Status;
    if (p.Facing)        j["facing"] = DirectionName(*p.Facing);
    return j;
}

/// 读取整数并检查范围; 非整数或越界返回空
std::optional<i64> ReadRanged(const json& v, i64 lo, i64 hi) {
    i64 value = 0;
    if (v.is_number_unsigned()) {
        u64 u = v.get<u64>();
        if (u > (u64)hi) return std::nullopt;
        value = (i64)u;
    } else if (v.is_number_integer()) {
        value = v.get<i64>();
    } else {
        return std::nullopt;
    }
    if (value < lo || value > hi) return std::nullopt;
    return value;
}

ItemCounts CountsFromJson(const json& j, const char* field) {
    ItemCounts counts;
    if (!j.is_object()) {
        LOG_WARN("[存档] player.%s 不是对象, 忽略", field);
        return counts;
    }
    for (auto& [id, v] : j.items()) {
        auto n = ReadRanged(v, 0, std::numeric_limits<u32>::max());
        if (!n) {
            LOG_WARN("[存档] player.%s.%s 数量非法, 丢弃", field, id.c_str());
            continue;
        }
        counts[id] = (u32)*n;
    }
    return counts;
}

PlayerSnapshot PlayerFromJson(const json& j) {
    PlayerSnapshot p;
    if (!j.is_object()) return p;

    if (j.contains("money")) {
        auto money = ReadRanged(j["money"], std::numeric_limits<i32>::min(),
                                std::numeric_limits<i32>::max());
        if (money) p.Money = (i32)*money;
        else LOG_WARN("[存档] player.money 越界, 忽略");
    }
    if (j.contains("inventory"))      p.Inventory = CountsFromJson(j["inventory"], "inventory");
    if (j.contains("seed_inventory")) p.SeedInventory = CountsFromJson(j["seed_inventory"], "seed_inventory");
    if (j.contains("pos")) {
        auto& pos = j["pos"];
        if (pos.is_array() && pos.size() == 2)
            p.Pos = glm::ivec2(pos[0].get<i32>(), pos[1].get<i32>());
        else
            LOG_WARN("[存档] player.pos 格式错误, 忽略");
    }
    p.Status = j.value("status", p.Status);
    if (j.contains("facing")) {
        p.Facing = ParseDirection(j["facing"].get<std::string>());
        if (!p.Facing) LOG_WARN("[存档] 未知朝向, 忽略");
    }
    return p;
}

json SoilToJson(const SoilSnapshot& s) {
    json grid = json::array();
    for (auto& row : s.Grid) {
        json jrow = json::array();
        for (TileMask mask : row) {
            json cell = json::array();
            for (TileFlag f : ALL_TILE_FLAGS)
                if (mask & ToMask(f)) cell.push_back(TileFlagCode(f));
            jrow.push_back(std::move(cell));
        }
        grid.push_back(std::move(jrow));
    }
    return {
        {"grid", std::move(grid)},
        {"tile_size", s.TileSize},
        {"width", s.Width},
        {"height", s.Height},
    };
}

SoilSnapshot SoilFromJson(const json& j) {
    SoilSnapshot s;
    if (!j.is_object()) return s;

    if (j.contains("grid")) {
        for (auto& jrow : j["grid"]) {
            std::vector<TileMask> row;
            row.reserve(jrow.size());
            for (auto& cell : jrow) {
                TileMask mask = 0;
                for (auto& code : cell) {
                    auto flag = ParseTileFlag(code.get<std::string>());
                    if (flag) mask |= ToMask(*flag);
                    else LOG_WARN("[存档] 未知土壤标记 '%s'", code.get<std::string>().c_str());
                }
                row.push_back(mask);
            }
            s.Grid.push_back(std::move(row));
        }
    }

    s.TileSize = j.value("tile_size", s.TileSize);
    s.Height = j.value("height", (u32)s.Grid.size());
    s.Width  = j.value("width", s.Grid.empty() ? 0u : (u32)s.Grid[0].size());
    return s;
}

} // namespace

json SnapshotToJson(const SaveSnapshot& snapshot) {
    json plants = json::array();
    for (auto& c : snapshot.Plants) {
        plants.push_back({
            {"x", c.X},
            {"y", c.Y},
            {"type", c.Type},
            {"growth_stage", c.GrowthStage},
        });
    }

    return {
        {"day", snapshot.Day},
        {"player", PlayerToJson(snapshot.Player)},
        {"soil", SoilToJson(snapshot.Soil)},
        {"plants", std::move(plants)},
    };
}

SaveSnapshot SnapshotFromJson(const json& payload) {
    SaveSnapshot snap;
    snap.Day = payload.value("day", snap.Day);
    if (payload.contains("player")) snap.Player = PlayerFromJson(payload["player"]);
    if (payload.contains("soil"))   snap.Soil   = SoilFromJson(payload["soil"]);

    if (payload.contains("plants")) {
        for (auto& jp : payload["plants"]) {
            CropRecord rec;
            rec.X = jp.value("x", 0);
            rec.Y = jp.value("y", 0);
            rec.Type = jp.value("type", std::string());
            rec.GrowthStage = jp.value("growth_stage", 0.0);
            if (rec.Type.empty()) {
                LOG_WARN("[存档] 作物缺少 type, 跳过 (%d, %d)", rec.X, rec.Y);
                continue;
            }
            snap.Plants.push_back(std::move(rec));
        }
    }
    return snap;
}

// ═══════════════════════════════════════════════════════════════
// SaveSystem
// ═══════════════════════════════════════════════════════════════

SaveSystem::SaveSystem(fs::path dataDir)
    : m_DataDir(std::move(dataDir)) {}

void SaveSystem::EnsureDataDirs(const fs::path& dataDir) {
    std::error_code ec;
    for (const char* sub : {"saves", "cache", "settings"}) {
        fs::create_directories(dataDir / sub, ec);
        if (ec) {
            throw SaveError("无法创建目录 " + (dataDir / sub).string() + ": " + ec.message());
        }
    }
}

fs::path SaveSystem::SlotPath(u32 slot) const {
    return GetSavesDir() / ("save_slot_" + std::to_string(slot) + ".json");
}

fs::path SaveSystem::BackupPath(u32 slot) const {
    fs::path p = SlotPath(slot);
    p += ".bak";
    return p;
}

void SaveSystem::WriteFileSynced(const fs::path& path, const std::string& content) {
    FILE* f = std::fopen(path.string().c_str(), "wb");
    if (!f) throw SaveError("无法写入 " + path.string());

    bool ok = std::fwrite(content.data(), 1, content.size(), f) == content.size();
    ok = ok && std::fflush(f) == 0;
#ifdef _WIN32
    ok = ok && _commit(_fileno(f)) == 0;
#else
    ok = ok && fsync(fileno(f)) == 0;
#endif
    ok = (std::fclose(f) == 0) && ok;

    if (!ok) throw SaveError("写入失败 " + path.string());
}

void SaveSystem::WriteAtomic(const fs::path& target, const std::string& content) {
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    try {
        WriteFileSynced(tmp, content);
    } catch (const SaveError&) {
        fs::remove(tmp, ec);
        throw;
    }

    if (fs::exists(target, ec)) {
        fs::path bak = target;
        bak += ".bak";
        fs::copy_file(target, bak, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            // 备份失败不阻止保存, 但要留下记录
            LOG_WARN("[存档] 备份 %s 失败: %s", target.string().c_str(), ec.message().c_str());
            ec.clear();
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw SaveError("重命名到 " + target.string() + " 失败: " + ec.message());
    }
}

fs::path SaveSystem::Save(u32 slot, const SaveSnapshot& snapshot) const {
    EnsureDataDirs(m_DataDir);

    json envelope;
    try {
        envelope = {
            {"metadata", {
                {"version", FORMAT_VERSION},
                {"timestamp", (i64)std::time(nullptr)},
            }},
            {"payload", SnapshotToJson(snapshot)},
        };
    } catch (const json::exception& e) {
        throw SaveError(std::string("序列化失败: ") + e.what());
    }

    fs::path path = SlotPath(slot);
    std::string text;
    try {
        text = envelope.dump(2);
    } catch (const json::type_error& e) {
        // 非法 UTF-8 的物品 ID
        throw SaveError(std::string("序列化失败: ") + e.what());
    }

    WriteAtomic(path, text);
    LOG_INFO("[存档] 已保存槽位 %u → %s (第 %d 天)", slot, path.string().c_str(), snapshot.Day);
    return path;
}

LoadResult SaveSystem::LoadFile(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw LoadError("无法打开 " + path.string());
    }

    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw LoadError("JSON 解析失败 " + path.string() + ": " + e.what());
    }

    if (!root.is_object() || !root.contains("payload") || !root["payload"].is_object()) {
        throw LoadError("缺少 payload: " + path.string());
    }

    LoadResult result;
    result.Path = path.string();
    try {
        if (root.contains("metadata") && root["metadata"].is_object()) {
            auto& meta = root["metadata"];
            result.Metadata.Version   = meta.value("version", FORMAT_VERSION);
            result.Metadata.Timestamp = meta.value("timestamp", (i64)0);
        }
        result.Snapshot = SnapshotFromJson(root["payload"]);
    } catch (const json::exception& e) {
        throw LoadError("存档内容无效 " + path.string() + ": " + e.what());
    }

    if (result.Metadata.Version > FORMAT_VERSION) {
        LOG_WARN("[存档] %s 版本 %d 高于当前 %d, 尝试按当前格式读取",
                 path.string().c_str(), result.Metadata.Version, FORMAT_VERSION);
    }
    return result;
}

LoadResult SaveSystem::Load(u32 slot) const {
    fs::path path = SlotPath(slot);
    std::string primaryError;
    try {
        LoadResult result = LoadFile(path);
        LOG_INFO("[存档] 已读取槽位 %u (第 %d 天)", slot, result.Snapshot.Day);
        return result;
    } catch (const LoadError& e) {
        primaryError = e.what();
        LOG_WARN("[存档] %s", e.what());
    }

    fs::path bak = BackupPath(slot);
    std::error_code ec;
    if (!fs::exists(bak, ec)) {
        throw LoadError("槽位 " + std::to_string(slot) + " 读取失败且无备份: " + primaryError);
    }

    try {
        LoadResult result = LoadFile(bak);
        result.FromBackup = true;
        LOG_WARN("[存档] 槽位 %u 已从备份恢复 (第 %d 天)", slot, result.Snapshot.Day);
        return result;
    } catch (const LoadError& e) {
        throw LoadError("槽位 " + std::to_string(slot) + " 主文件与备份均无效: " +
                        primaryError + "; " + e.what());
    }
}

std::vector<u32> SaveSystem::ListSlots() const {
    std::vector<u32> slots;
    std::error_code ec;
    fs::path dir = GetSavesDir();
    if (!fs::is_directory(dir, ec)) return slots;

    static const std::regex pattern(R"(save_slot_(\d+)\.json)");
    for (auto& entry : fs::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file(ec)) continue;
        std::string name = entry.path().filename().string();
        std::smatch m;
        if (!std::regex_match(name, m, pattern)) continue;
        try {
            slots.push_back((u32)std::stoul(m[1].str()));
        } catch (const std::out_of_range&) {
            LOG_WARN("[存档] 忽略槽位号过大的文件 %s", name.c_str());
        }
    }
    std::sort(slots.begin(), slots.end());
    return slots;
}

bool SaveSystem::HasSlot(u32 slot) const {
    std::error_code ec;
    return fs::exists(SlotPath(slot), ec) || fs::exists(BackupPath(slot), ec);
}

bool SaveSystem::DeleteSlot(u32 slot) const {
    bool removed = false;
    for (const fs::path& p : {SlotPath(slot), BackupPath(slot)}) {
        std::error_code ec;
        removed |= fs::remove(p, ec);
        if (ec) throw SaveError("删除 " + p.string() + " 失败: " + ec.message());
    }
    if (removed) LOG_INFO("[存档] 已删除槽位 %u", slot);
    return removed;
}

} // namespace Meadow
