#pragma once

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <optional>
#include <string_view>

namespace util {

enum class LogLevel { Trace, Debug, Info, Warn, Error, Fatal };

inline const char* level_name(LogLevel lvl) noexcept {
    switch (lvl) {
    case LogLevel::Trace: return "TRACE";
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info: return "INFO";
    case LogLevel::Warn: return "WARN";
    case LogLevel::Error: return "ERROR";
    case LogLevel::Fatal: return "FATAL";
    }
    return "UNKNOWN";
}

// Accepts the names printed by level_name(), case-insensitive.
inline std::optional<LogLevel> parse_log_level(std::string_view text) noexcept {
    constexpr LogLevel levels[] = {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                                   LogLevel::Warn,  LogLevel::Error, LogLevel::Fatal};
    for (const auto lvl : levels) {
        const char* name = level_name(lvl);
        if (std::strlen(name) != text.size()) {
            continue;
        }
        bool same = true;
        for (std::size_t i = 0; i < text.size(); ++i) {
            char c = text[i];
            if (c >= 'a' && c <= 'z') {
                c = static_cast<char>(c - 'a' + 'A');
            }
            if (c != name[i]) {
                same = false;
                break;
            }
        }
        if (same) {
            return lvl;
        }
    }
    return std::nullopt;
}

namespace detail {
inline std::mutex& log_mutex() {
    static std::mutex mtx;
    return mtx;
}

inline std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> lvl{LogLevel::Info};
    return lvl;
}

inline std::atomic<std::FILE*>& log_sink() {
    static std::atomic<std::FILE*> sink{nullptr};
    return sink;
}

inline void log_impl(LogLevel lvl, const char* fmt, va_list args) {
    std::lock_guard<std::mutex> lock(log_mutex());
    std::FILE* out = log_sink().load(std::memory_order_relaxed);
    if (!out) {
        out = stderr;
    }
    std::fprintf(out, "%s: ", level_name(lvl));
    std::vfprintf(out, fmt, args);
    std::fprintf(out, "\n");
    if (lvl >= LogLevel::Warn) {
        std::fflush(out);
    }
}
} // namespace detail

inline void set_log_level(LogLevel lvl) noexcept { detail::min_level().store(lvl, std::memory_order_relaxed); }
inline LogLevel log_level() noexcept { return detail::min_level().load(std::memory_order_relaxed); }
inline bool log_enabled(LogLevel lvl) noexcept { return lvl >= log_level(); }

// nullptr restores stderr. The caller keeps ownership of the FILE.
inline void set_log_sink(std::FILE* sink) noexcept { detail::log_sink().store(sink, std::memory_order_relaxed); }

class SyncLogger {
public:
    static void log(LogLevel lvl, const char* fmt, ...) {
        if (!log_enabled(lvl)) {
            return;
        }
        va_list args;
        va_start(args, fmt);
        detail::log_impl(lvl, fmt, args);
        va_end(args);
    }
};

inline void log(LogLevel lvl, const char* fmt, ...) {
    if (!log_enabled(lvl)) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    detail::log_impl(lvl, fmt, args);
    va_end(args);
}

} // namespace util

#define LOG_TRACE(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Trace, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_DEBUG(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Debug, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_INFO(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Info,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_WARN(FMT, ...)  ::util::SyncLogger::log(::util::LogLevel::Warn,  (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_ERROR(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Error, (FMT) __VA_OPT__(, __VA_ARGS__))
#define LOG_FATAL(FMT, ...) ::util::SyncLogger::log(::util::LogLevel::Fatal, (FMT) __VA_OPT__(, __VA_ARGS__))
