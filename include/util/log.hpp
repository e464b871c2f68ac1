#pragma once
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>
#include <string_view>

namespace pillbox
{

enum class Level
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
    System  = 4  // operator-facing status, always above the threshold
};

inline Level &global_level()
{
    static Level lv = Level::Debug;
    return lv;
}

inline void set_log_level(Level lv)
{
    global_level() = lv;
}

// Returns false (and leaves `out` alone) for unknown names.
inline bool parse_level(std::string_view name, Level &out)
{
    if (name == "debug" || name == "DEBUG")
        out = Level::Debug;
    else if (name == "info" || name == "INFO")
        out = Level::Info;
    else if (name == "warn" || name == "warning" || name == "WARN" || name == "WARNING")
        out = Level::Warning;
    else if (name == "error" || name == "err" || name == "ERROR" || name == "ERR")
        out = Level::Error;
    else
        return false;
    return true;
}

inline void set_log_level_by_name(const char *name)
{
    Level lv = Level::Info;  // default for unknown names
    if (name)
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

// loop thread, bus thread and control-socket workers all log; keep lines whole
inline std::mutex &log_mutex()
{
    static std::mutex mu;
    return mu;
}

// Process name printed on every line ("pillboxd", "pillboxctl"); empty = none.
inline const char *&log_tag()
{
    static const char *tag = "";
    return tag;
}

inline void set_log_tag(const char *tag)
{
    log_tag() = tag ? tag : "";
}

inline void logf(Level lv, const char *func, const char *fmt, ...)
{
    if ((int)lv < (int)global_level())
        return;

    char ts[16];
    timestamp(ts, sizeof(ts));

    std::lock_guard<std::mutex> lk(log_mutex());
    if (*log_tag())
        std::fprintf(stderr, "%s %s <%s> %s: ", ts, level_name(lv), log_tag(), func ? func : "?");
    else
        std::fprintf(stderr, "%s %s %s: ", ts, level_name(lv), func ? func : "?");

    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);

    size_t m = std::strlen(fmt);
    if (m == 0 || fmt[m - 1] != '\n')
        std::fputc('\n', stderr);
}

#define LOG_DEBUG(...) ::pillbox::logf(::pillbox::Level::Debug, __func__, __VA_ARGS__)
#define LOG_INFO(...) ::pillbox::logf(::pillbox::Level::Info, __func__, __VA_ARGS__)
#define LOG_WARN(...) ::pillbox::logf(::pillbox::Level::Warning, __func__, __VA_ARGS__)
#define LOG_ERROR(...) ::pillbox::logf(::pillbox::Level::Error, __func__, __VA_ARGS__)
#define LOG_SYSTEM(...) ::pillbox::logf(::pillbox::Level::System, __func__, __VA_ARGS__)

}  // namespace pillbox
