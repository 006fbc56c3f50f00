#pragma once

#include <cstdint>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <unordered_map>

#include <glm/glm.hpp>

namespace Meadow {

// ── 基本类型别名 ────────────────────────────────────────────

using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

using f32 = float;
using f64 = double;

// ── 智能指针别名 ────────────────────────────────────────────

template<typename T>
using Scope = std::unique_ptr<T>;

template<typename T, typename... Args>
constexpr Scope<T> CreateScope(Args&&... args) {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template<typename T>
using Ref = std::shared_ptr<T>;

template<typename T, typename... Args>
constexpr Ref<T> CreateRef(Args&&... args) {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

// ── 坐标 ────────────────────────────────────────────────────

/// Tile 坐标 (格子索引, 非像素)
using TileCoord = glm::ivec2;

/// 世界坐标 (像素)
using WorldPos = glm::vec2;

/// 物品 ID → 数量
using ItemCounts = std::unordered_map<std::string, u32>;

} // namespace Meadow
