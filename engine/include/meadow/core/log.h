#pragma once

#include <string>
#include <cstdio>
#include <cstdarg>

namespace Meadow {

// ── 日志级别 ────────────────────────────────────────────────

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// ── 日志回调 (HUD / 调试面板集成) ────────────────────────────

using LogCallback = void(*)(LogLevel level, const char* message);

// ── 日志系统 ────────────────────────────────────────────────

class Logger {
public:
    static void Init(LogLevel level = LogLevel::Info);
    static void Shutdown();
    static void SetLevel(LogLevel level);
    static LogLevel GetLevel() { return s_Level; }
    static void Log(LogLevel level, const char* file, int line, const char* fmt, ...);

    /// 设置日志回调 (调试面板用来接收日志)
    static void SetCallback(LogCallback callback);

    /// 额外写入纯文本日志文件 (空路径 = 关闭)
    static bool SetLogFile(const std::string& path);

    /// "trace" / "debug" / "info" / "warn" / "error" / "fatal", 未知返回 fallback
    static LogLevel ParseLevel(const std::string& name, LogLevel fallback = LogLevel::Info);

    static const char* LevelToString(LogLevel level);

private:
    static LogLevel s_Level;
    static LogCallback s_Callback;
    static FILE* s_File;
    static void SetConsoleColor(LogLevel level);
    static void ResetConsoleColor();
};

} // namespace Meadow

// ── 日志宏 ──────────────────────────────────────────────────

#define LOG_TRACE(fmt, ...) ::Meadow::Logger::Log(::Meadow::LogLevel::Trace, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_DEBUG(fmt, ...) ::Meadow::Logger::Log(::Meadow::LogLevel::Debug, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_INFO(fmt, ...)  ::Meadow::Logger::Log(::Meadow::LogLevel::Info,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_WARN(fmt, ...)  ::Meadow::Logger::Log(::Meadow::LogLevel::Warn,  __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_ERROR(fmt, ...) ::Meadow::Logger::Log(::Meadow::LogLevel::Error, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
#define LOG_FATAL(fmt, ...) ::Meadow::Logger::Log(::Meadow::LogLevel::Fatal, __FILE__, __LINE__, fmt, ##__VA_ARGS__)
