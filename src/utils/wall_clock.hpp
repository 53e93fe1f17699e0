// ============================================================================
// utils/wall_clock.hpp - Device wall-clock times as seconds since 1970
// ============================================================================
#pragma once
#include <cstdint>
#include <ctime>

namespace accelio {

// Device clocks are local time; they are encoded here as if they were UTC so
// that fmod(t, 86400) is the local time of day.
inline double civil_to_seconds(int year, int month, int day,
                               int hour, int minute, int second) {
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    return double(timegm(&tm));
}

// .NET ticks (100 ns since 0001-01-01) used by ActiGraph info.txt.
constexpr int64_t TICKS_AT_UNIX_EPOCH = 621355968000000000LL;

inline double ticks_to_seconds(int64_t ticks) {
    return double(ticks - TICKS_AT_UNIX_EPOCH) / 1e7;
}

inline int64_t seconds_to_ticks(double seconds) {
    return int64_t(seconds * 1e7) + TICKS_AT_UNIX_EPOCH;
}

} // namespace accelio
