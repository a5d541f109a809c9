#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <cstdlib>
#include <ctime>
#include <optional>
#include <strings.h>

namespace chunkwire
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // always printed (tool output summaries)
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

// Case-insensitive; nullopt for names we don't know
inline std::optional<Level> level_from_name(const char *name)
{
    static const struct
    {
        const char *name;
        Level       lv;
    } table[] = {
        {"debug", Level::Debug},   {"info", Level::Info},   {"warn", Level::Warning},
        {"warning", Level::Warning}, {"error", Level::Error}, {"err", Level::Error},
    };
    if (!name)
        return std::nullopt;
    for (const auto &e : table)
    {
        if (strcasecmp(name, e.name) == 0)
            return e.lv;
    }
    return std::nullopt;
}

inline void set_log_level_by_name(const char *name)
{
    set_log_level(level_from_name(name).value_or(Level::Info));  // default
}

// Reads the threshold from env_var (e.g. CHUNKWIRE_LOG_LEVEL); unset leaves it alone
inline bool init_log_from_env(const char *env_var)
{
    const char *v = std::getenv(env_var);
    if (!v || !*v)
        return true;
    auto lv = level_from_name(v);
    set_log_level(lv.value_or(Level::Info));
    return lv.has_value();
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

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::chunkwire::logf(::chunkwire::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::chunkwire::logf(::chunkwire::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::chunkwire::logf(::chunkwire::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::chunkwire::logf(::chunkwire::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::chunkwire::logf(::chunkwire::Level::System, __func__, __VA_ARGS__)

}  // namespace chunkwire
