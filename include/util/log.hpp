#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string>

namespace blelink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always printed, used for lifecycle milestones
};

inline Level &global_level()
{
    static Level lv = Level::Info;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Case-insensitive; accepts debug, info, warn/warning, error/err.
inline bool parse_level(const char *name, Level &out)
{
    if (!name)
        return false;
    std::string level(name);
    for (auto &c : level)
        c = (char)std::tolower((unsigned char)c);
    if (level == "debug")
        out = Level::Debug;
    else if (level == "info")
        out = Level::Info;
    else if (level == "warn" || level == "warning")
        out = Level::Warning;
    else if (level == "error" || level == "err")
        out = Level::Error;
    else
        return false;
    return true;
}

// Unknown names select Info and return false.
inline bool set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    bool  ok = parse_level(name, lv);
    set_log_level(lv);
    return ok;
}

inline const char *level_name(Level lv)
{
    static const char *const names[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]", "[SYSTEM]"};
    const int                i       = static_cast<int>(lv);
    return (i >= 0 && i <= static_cast<int>(Level::System)) ? names[i] : "?";
}

// Per-thread number, assigned in order of each thread's first log line.
inline unsigned thread_tag()
{
    static std::atomic<unsigned> next{1};
    thread_local unsigned        tag = next.fetch_add(1, std::memory_order_relaxed);
    return tag;
}

inline void timestamp(char *buf, size_t n)
{
    using namespace std::chrono;
    const auto  now = system_clock::now();
    const auto  ms  = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt  = system_clock::to_time_t(now);
    std::tm     tm{};
    localtime_r(&tt, &tm);
    std::snprintf(buf, n, "%02d:%02d:%02d.%03d", tm.tm_hour, tm.tm_min, tm.tm_sec,
                  (int)ms.count());
}

// Bus thread, timer thread and callers all log; keep lines whole.
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fprintf(stderr, "%s %s t%u %s: ", ts, level_name(lv), thread_tag(), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::blelink::logf(::blelink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::blelink::logf(::blelink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::blelink::logf(::blelink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::blelink::logf(::blelink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::blelink::logf(::blelink::Level::System, __func__, __VA_ARGS__)

}  // namespace blelink
