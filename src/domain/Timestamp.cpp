/**
 * @file Timestamp.cpp
 * @brief Civil calendar arithmetic for Timestamp.
 */

#include "domain/Timestamp.hpp"
#include <chrono>
#include <ctime>

namespace notestamp::domain {

namespace {

constexpr long long kMillisPerMinute = 60LL * 1000;
constexpr long long kMillisPerDay = 24LL * 60 * kMillisPerMinute;

long long FloorDiv(long long a, long long b) {
    long long q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

std::tm ToLocalTime(std::time_t tt) {
    std::tm tm = {};
#if defined(_WIN32)
    localtime_s(&tm, &tt);
#else
    localtime_r(&tt, &tm);
#endif
    return tm;
}

} // namespace

long long DaysFromCivil(long long year, int month, int day) {
    // Month index shifted so the year starts in March; Feb 29 is then the last day.
    year -= month <= 2 ? 1 : 0;
    const long long era = (year >= 0 ? year : year - 399) / 400;
    const long long yoe = year - era * 400;
    const long long doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

int DaysInMonth(long long year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2) {
        bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
        return leap ? 29 : 28;
    }
    return kDays[month - 1];
}

long long Timestamp::toEpochMillis() const {
    // Fold months first so DaysFromCivil always sees 1-12.
    long long monthIndex = static_cast<long long>(year) * 12 + (month - 1);
    long long y = FloorDiv(monthIndex, 12);
    int m = static_cast<int>(monthIndex - y * 12) + 1;

    long long days = DaysFromCivil(y, m, 1) + (day - 1);
    return days * kMillisPerDay
        + static_cast<long long>(hour) * 60 * kMillisPerMinute
        + static_cast<long long>(minute) * kMillisPerMinute
        + static_cast<long long>(second) * 1000
        + millisecond;
}

Timestamp Timestamp::FromEpochMillis(long long millis) {
    long long days = FloorDiv(millis, kMillisPerDay);
    long long rem = millis - days * kMillisPerDay;

    long long z = days + 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;

    Timestamp ts;
    ts.day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    ts.month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    ts.year = static_cast<int>(yoe + era * 400 + (ts.month <= 2 ? 1 : 0));
    ts.hour = static_cast<int>(rem / (60 * kMillisPerMinute));
    rem %= 60 * kMillisPerMinute;
    ts.minute = static_cast<int>(rem / kMillisPerMinute);
    rem %= kMillisPerMinute;
    ts.second = static_cast<int>(rem / 1000);
    ts.millisecond = static_cast<int>(rem % 1000);
    return ts;
}

Timestamp Timestamp::FromCivil(int year, int month, int day, int hour, int minute) {
    Timestamp raw;
    raw.year = year;
    raw.month = month;
    raw.day = day;
    raw.hour = hour;
    raw.minute = minute;
    return FromEpochMillis(raw.toEpochMillis());
}

Timestamp Timestamp::Now() {
    auto now = std::chrono::system_clock::now();
    std::tm tm = ToLocalTime(std::chrono::system_clock::to_time_t(now));
    return FromCivil(tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min);
}

bool Timestamp::operator==(const Timestamp& other) const {
    return year == other.year && month == other.month && day == other.day
        && hour == other.hour && minute == other.minute
        && second == other.second && millisecond == other.millisecond;
}

} // namespace notestamp::domain
