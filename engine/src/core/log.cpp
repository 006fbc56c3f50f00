#include "meadow/core/log.h"

#include <cstdio>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <mutex>

#ifdef _WIN32
    #define WIN32_LEAN_AND_MEAN
    #include <windows.h>
#endif

namespace Meadow {

LogLevel Logger::s_Level = LogLevel::Info;
LogCallback Logger::s_Callback = nullptr;
FILE* Logger::s_File = nullptr;
static std::mutex s_LogMutex;

void Logger::Init(LogLevel level) {
#ifdef _WIN32
    HANDLE hConsole = GetStdHandle(STD_OUTPUT_HANDLE);
    DWORD mode = 0;
    GetConsoleMode(hConsole, &mode);
    SetConsoleMode(hConsole, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING);
#endif
    s_Level = level;
    LOG_INFO("日志系统初始化完成 (级别 %s)", LevelToString(level));
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(s_LogMutex);
    if (s_File) {
        fclose(s_File);
        s_File = nullptr;
    }
    s_Callback = nullptr;
}

void Logger::SetLevel(LogLevel level) {
    s_Level = level;
}

const char* Logger::LevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        default:              return "?????";
    }
}

LogLevel Logger::ParseLevel(const std::string& name, LogLevel fallback) {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "info")  return LogLevel::Info;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    return fallback;
}

void Logger::SetConsoleColor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: printf("\033[90m");    break;
        case LogLevel::Debug: printf("\033[36m");    break;
        case LogLevel::Info:  printf("\033[32m");    break;
        case LogLevel::Warn:  printf("\033[33m");    break;
        case LogLevel::Error: printf("\033[31m");    break;
        case LogLevel::Fatal: printf("\033[1;31m");  break;
    }
}

void Logger::ResetConsoleColor() {
    printf("\033[0m");
}

void Logger::SetCallback(LogCallback callback) {
    s_Callback = callback;
}

bool Logger::SetLogFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(s_LogMutex);
    if (s_File) {
        fclose(s_File);
        s_File = nullptr;
    }
    if (path.empty()) return true;
    s_File = fopen(path.c_str(), "a");
    return s_File != nullptr;
}

void Logger::Log(LogLevel level, const char* file, int line, const char* fmt, ...) {
    if (level < s_Level) return;

    std::lock_guard<std::mutex> lock(s_LogMutex);

    // 格式化消息
    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    time_t now = time(nullptr);
    struct tm t {};
#ifdef _WIN32
    localtime_s(&t, &now);
#else
    localtime_r(&now, &t);
#endif

    // Debug 及以下附带源位置
    char location[128] = "";
    if (level <= LogLevel::Debug && file) {
        const char* base = strrchr(file, '/');
        if (!base) base = strrchr(file, '\\');
        snprintf(location, sizeof(location), " (%s:%d)", base ? base + 1 : file, line);
    }

    SetConsoleColor(level);
    printf("[%02d:%02d:%02d] [%s] %s%s\n",
        t.tm_hour, t.tm_min, t.tm_sec,
        LevelToString(level), buffer, location);
    ResetConsoleColor();

    if (s_File) {
        fprintf(s_File, "[%04d-%02d-%02d %02d:%02d:%02d] [%s] %s%s\n",
            t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
            t.tm_hour, t.tm_min, t.tm_sec,
            LevelToString(level), buffer, location);
        if (level >= LogLevel::Warn) fflush(s_File);
    }

    // 转发到回调
    if (s_Callback) {
        s_Callback(level, buffer);
    }

    if (level >= LogLevel::Warn) {
        fflush(stdout);
    }
}

} // namespace Meadow
