#pragma once

// ── 引擎核心头文件 ──────────────────────────────────────────

#define MEADOW_VERSION_MAJOR 0
#define MEADOW_VERSION_MINOR 1
#define MEADOW_VERSION_STRING "0.1.0"

// Core
#include "meadow/core/types.h"
#include "meadow/core/log.h"
#include "meadow/core/assert.h"
#include "meadow/core/timer.h"

// Game2D
#include "meadow/game2d/collision2d.h"
