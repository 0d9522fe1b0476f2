#pragma once

#include <cstdint>

namespace fraudshield::infra {

struct CalendarFields {
    int hour = 0;
    int day_of_week = 0;   // Monday = 0
    int day_of_month = 1;
};

// Break an epoch timestamp into local calendar fields without touching
// the process time zone (gmtime/localtime are not reentrant).
inline CalendarFields calendarFields(int64_t epoch_seconds, int offset_minutes) noexcept {
    const int64_t local = epoch_seconds + static_cast<int64_t>(offset_minutes) * 60;

    int64_t days = local / 86400;
    int64_t secs = local % 86400;
    if (secs < 0) {
        secs += 86400;
        days -= 1;
    }

    CalendarFields f;
    f.hour = static_cast<int>(secs / 3600);

    // 1970-01-01 was a Thursday (Monday = 0 -> Thursday = 3)
    int64_t dow = (days + 3) % 7;
    if (dow < 0) dow += 7;
    f.day_of_week = static_cast<int>(dow);

    // civil-from-days, days since 1970-01-01
    const int64_t z = days + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    f.day_of_month = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);

    return f;
}

// Days since 1970-01-01 for a proleptic Gregorian date (days-from-civil).
inline int64_t daysFromCivil(int64_t y, unsigned m, unsigned d) noexcept {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

} // namespace fraudshield::infra
