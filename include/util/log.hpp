#pragma once
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace gattlink
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing result lines, always printed
};

inline std::atomic<Level> &global_level()
{
    static std::atomic<Level> lv{Level::Debug};
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level().store(lv);
}

// "debug|info|warn|warning|error|err", any case. false leaves `out` untouched.
inline bool parse_level(const char *name, Level &out)
{
    std::string level = name ? std::string(name) : std::string();
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

// Unknown names select Info.
inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;
    (void)parse_level(name, lv);
    set_log_level(lv);
}

inline const char *level_name(Level lv)
{
    switch (lv)
    {
        case Level::Debug:
            return "[DEBUG]";
        case Level::Info:
            return "[INFO]";
        case Level::Warning:
            return "[WARN]";
        case Level::Error:
            return "[ERROR]";
        case Level::System:
            return "[SYSTEM]";
    }
    return "?";
}

// HH:MM:SS.mmm, local time
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

// Serializes whole lines; the bus thread, notify listener and command loop share stderr.
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level().load())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::string line(ts);
    line += ' ';
    line += level_name(lv);
    line += ' ';
    line += func ? func : "?";
    line += ": ";

    va_list ap;
    va_start(ap, fmt);
    va_list ap2;
    va_copy(ap2, ap);
    const int need = std::vsnprintf(nullptr, 0, fmt, ap);
    va_end(ap);
    if (need > 0)
    {
        const size_t at = line.size();
        line.resize(at + (size_t)need + 1);
        std::vsnprintf(&line[at], (size_t)need + 1, fmt, ap2);
        line.resize(at + (size_t)need);
    }
    va_end(ap2);

    if (line.empty() || line.back() != '\n')
        line.push_back('\n');

    std::lock_guard<std::mutex> lk(log_mutex());
    std::fputs(line.c_str(), stderr);
}

#define LOG_DEBUG(...) ::gattlink::logf(::gattlink::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::gattlink::logf(::gattlink::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::gattlink::logf(::gattlink::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::gattlink::logf(::gattlink::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::gattlink::logf(::gattlink::Level::System, __func__, __VA_ARGS__)

}  // namespace gattlink
