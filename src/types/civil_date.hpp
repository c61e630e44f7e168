#pragma once
#include <ctime>

namespace tsgen {

// A calendar day with no time-of-day component (proleptic Gregorian).
struct civil_date {
    int year  = 1970;
    int month = 1;   // 1..12
    int day   = 1;   // 1..31
};

enum class weekday { sunday, monday, tuesday, wednesday, thursday, friday, saturday };

inline bool is_leap_year(int y) noexcept {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

inline int days_in_month(int y, int m) noexcept {
    static constexpr int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m < 1 || m > 12) return 0;
    return (m == 2 && is_leap_year(y)) ? 29 : days[m - 1];
}

inline bool is_valid(const civil_date& d) noexcept {
    return d.month >= 1 && d.month <= 12 && d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

// Days since 1970-01-01. Era-based, exact for any valid date.
inline long days_from_civil(const civil_date& d) noexcept {
    const long y   = static_cast<long>(d.year) - (d.month <= 2 ? 1 : 0);
    const long era = (y >= 0 ? y : y - 399) / 400;
    const long yoe = y - era * 400;                                          // [0, 399]
    const long mp  = (d.month + 9) % 12;                                     // March = 0
    const long doy = (153 * mp + 2) / 5 + d.day - 1;                         // [0, 365]
    const long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;                  // [0, 146096]
    return era * 146097 + doe - 719468;
}

inline civil_date civil_from_days(long z) noexcept {
    z += 719468;
    const long era = (z >= 0 ? z : z - 146096) / 146097;
    const long doe = z - era * 146097;
    const long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long mp  = (5 * doy + 2) / 153;
    const long d   = doy - (153 * mp + 2) / 5 + 1;
    const long m   = mp < 10 ? mp + 3 : mp - 9;
    const long y   = yoe + era * 400 + (m <= 2 ? 1 : 0);
    return civil_date{ static_cast<int>(y), static_cast<int>(m), static_cast<int>(d) };
}

// 1970-01-01 was a Thursday.
inline weekday weekday_from_days(long z) noexcept {
    return static_cast<weekday>(z >= -4 ? (z + 4) % 7 : (z + 5) % 7 + 6);
}

inline weekday day_of_week(const civil_date& d) noexcept {
    return weekday_from_days(days_from_civil(d));
}

inline bool is_weekend(weekday w) noexcept {
    return w == weekday::saturday || w == weekday::sunday;
}

inline civil_date add_days(const civil_date& d, long n) noexcept {
    return civil_from_days(days_from_civil(d) + n);
}

inline bool operator==(const civil_date& a, const civil_date& b) noexcept {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const civil_date& a, const civil_date& b) noexcept { return !(a == b); }
inline bool operator<(const civil_date& a, const civil_date& b) noexcept {
    return days_from_civil(a) < days_from_civil(b);
}
inline bool operator<=(const civil_date& a, const civil_date& b) noexcept { return !(b < a); }

// Current calendar day in the local timezone.
inline civil_date today_local() {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    return civil_date{ tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday };
}

}
