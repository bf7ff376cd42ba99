#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace util {

using WallTime = std::chrono::system_clock::time_point;

// Nanoseconds since the Unix epoch. Pre-epoch instants come back negative.
[[nodiscard]] inline std::int64_t to_unix_ns(WallTime tp) noexcept {
    return static_cast<std::int64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count());
}

[[nodiscard]] inline WallTime from_unix_ns(std::int64_t ns) noexcept {
    return WallTime(std::chrono::duration_cast<WallTime::duration>(std::chrono::nanoseconds(ns)));
}

// ISO 8601 UTC with millisecond precision, e.g. 2024-05-01T12:30:00.125Z.
inline std::string format_iso8601_utc(WallTime tp) {
    const auto ns = to_unix_ns(tp);
    std::int64_t secs = ns / 1'000'000'000;
    std::int64_t rem_ns = ns % 1'000'000'000;
    if (rem_ns < 0) {
        rem_ns += 1'000'000'000;
        --secs;
    }
    const std::time_t t = static_cast<std::time_t>(secs);
    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &t);
#else
    gmtime_r(&t, &tm);
#endif
    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(rem_ns / 1'000'000));
    return std::string(buf);
}

} // namespace util
