#pragma once

#include "meadow/core/log.h"

// ── 断言宏 ──────────────────────────────────────────────────
// 仅用于内部索引不变量, 玩家可触发的失败走返回值

#if defined(_MSC_VER)
    #define MEADOW_DEBUGBREAK() __debugbreak()
#else
    #define MEADOW_DEBUGBREAK() __builtin_trap()
#endif

#ifdef MEADOW_DEBUG
    #define MEADOW_ASSERT(condition)                                   \
        do {                                                           \
            if (!(condition)) {                                        \
                LOG_FATAL("断言失败: %s", #condition);                  \
                MEADOW_DEBUGBREAK();                                   \
            }                                                          \
        } while(0)

    /// 网格/数组下标检查
    #define MEADOW_ASSERT_INDEX(index, size)                           \
        do {                                                           \
            if ((size_t)(index) >= (size_t)(size)) {                   \
                LOG_FATAL("下标越界: %s = %zu, 上限 %zu", #index,       \
                    (size_t)(index), (size_t)(size));                  \
                MEADOW_DEBUGBREAK();                                   \
            }                                                          \
        } while(0)
#else
    #define MEADOW_ASSERT(condition) ((void)0)
    #define MEADOW_ASSERT_INDEX(index, size) ((void)0)
#endif
