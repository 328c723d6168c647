#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <string>

namespace sentinel::infra {

// Milliseconds since the Unix epoch, UTC.
using TimestampMs = int64_t;

using WallClock = std::function<TimestampMs()>;

constexpr TimestampMs MS_PER_SECOND = 1000;
constexpr TimestampMs MS_PER_HOUR = 60 * 60 * MS_PER_SECOND;
constexpr TimestampMs MS_PER_DAY = 24 * MS_PER_HOUR;

inline TimestampMs systemNowMs() {
    return std::chrono::duration_cast<
        std::chrono::milliseconds
    >(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

inline WallClock systemClock() {
    return &systemNowMs;
}

inline std::tm toUtc(TimestampMs ts) {
    std::time_t secs =
        static_cast<std::time_t>(ts / MS_PER_SECOND);
    std::tm out{};
    gmtime_r(&secs, &out);
    return out;
}

// 2025-01-09T14:03:22.120Z
inline std::string toIso8601(TimestampMs ts) {
    std::tm t = toUtc(ts);
    char buf[40];
    std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
        t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
        t.tm_hour, t.tm_min, t.tm_sec,
        static_cast<int>(ts % MS_PER_SECOND)
    );
    return buf;
}

// Rebalance bucket key, e.g. 2025-01-09_14
inline std::string hourBucket(TimestampMs ts) {
    std::tm t = toUtc(ts);
    char buf[24];
    std::snprintf(
        buf, sizeof(buf),
        "%04d-%02d-%02d_%02d",
        t.tm_year + 1900, t.tm_mon + 1, t.tm_mday,
        t.tm_hour
    );
    return buf;
}

}
