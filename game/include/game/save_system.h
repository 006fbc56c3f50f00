#pragma once

#include "meadow/core/types.h"
#include "game/snapshot.h"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace Meadow {

// ── 存档错误 ──────────────────────────────────────────────

class SaveError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class LoadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SaveMetadata {
    i32 Version   = 1;
    i64 Timestamp = 0;   // unix 秒
};

struct LoadResult {
    SaveSnapshot Snapshot;
    SaveMetadata Metadata;
    std::string  Path;
    bool FromBackup = false;
};

// ── 快照 ⇄ JSON ───────────────────────────────────────────

nlohmann::json SnapshotToJson(const SaveSnapshot& snapshot);

/// payload 对象 → 快照; 类型不符时抛 nlohmann::json::exception
SaveSnapshot SnapshotFromJson(const nlohmann::json& payload);

// ── 存档系统 ──────────────────────────────────────────────
//
// 文件: <data>/saves/save_slot_<N>.json, 外层 { metadata, payload }。
// 写入: 临时文件 → fsync → (旧文件复制到 .bak) → 原子 rename。
// 读取: 主文件失败时回退到 .bak, 两者都失败抛 LoadError。

class SaveSystem {
public:
    static constexpr i32 FORMAT_VERSION = 1;

    explicit SaveSystem(std::filesystem::path dataDir);

    /// 创建 saves/ cache/ settings/
    static void EnsureDataDirs(const std::filesystem::path& dataDir);

    /// 返回写入的路径; 失败抛 SaveError
    std::filesystem::path Save(u32 slot, const SaveSnapshot& snapshot) const;

    /// 失败抛 LoadError
    LoadResult Load(u32 slot) const;

    /// 读取并校验单个文件 (不回退)
    static LoadResult LoadFile(const std::filesystem::path& path);

    /// 按槽位号升序
    std::vector<u32> ListSlots() const;

    bool HasSlot(u32 slot) const;

    /// 删除存档及其 .bak; 返回是否删除了任何文件
    bool DeleteSlot(u32 slot) const;

    std::filesystem::path GetSavesDir() const { return m_DataDir / "saves"; }
    std::filesystem::path SlotPath(u32 slot) const;
    std::filesystem::path BackupPath(u32 slot) const;

    /// 写入并强制落盘 (不做 rename)
    static void WriteFileSynced(const std::filesystem::path& path, const std::string& content);

    /// 临时文件 + rename; target 已存在时先复制为 .bak
    static void WriteAtomic(const std::filesystem::path& target, const std::string& content);

private:
    std::filesystem::path m_DataDir;
};

} // namespace Meadow
