/**
 * @file TimestampCodec.cpp
 * @brief Implementation of TimestampCodec.
 */

#include "domain/TimestampCodec.hpp"
#include "domain/TextUtils.hpp"
#include <cstdlib>
#include <iomanip>
#include <sstream>

namespace notestamp::domain {

using text::IsAlpha;
using text::IsSpace;
using text::ReadDigits;

namespace {

const char* const kMonthNames[] = {
    "Jan", "Feb", "Mar", "Apr", "May", "Jun", "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"
};

std::optional<int> MonthFromLabel(const std::string& raw) {
    std::string key = text::ToLower(text::Trim(raw).substr(0, 3));
    for (int i = 0; i < 12; ++i) {
        if (key == text::ToLower(kMonthNames[i])) return i + 1;
    }
    return std::nullopt;
}

void SkipSpaces(const std::string& s, size_t& pos) {
    while (pos < s.size() && IsSpace(s[pos])) ++pos;
}

bool Expect(const std::string& s, size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) return false;
    ++pos;
    return true;
}

} // namespace

std::optional<Timestamp> TimestampCodec::ParseDisplay(const std::string& raw) {
    const std::string s = text::Trim(raw);
    size_t pos = 0;

    int hourRaw = 0, minute = 0, day = 0, year = 0;
    if (!ReadDigits(s, pos, 1, 2, hourRaw)) return std::nullopt;
    if (!Expect(s, pos, ':')) return std::nullopt;
    if (!ReadDigits(s, pos, 2, 2, minute)) return std::nullopt;
    SkipSpaces(s, pos);

    if (pos + 2 > s.size()) return std::nullopt;
    std::string meridiem = text::ToLower(s.substr(pos, 2));
    if (meridiem != "am" && meridiem != "pm") return std::nullopt;
    pos += 2;
    SkipSpaces(s, pos);

    if (!Expect(s, pos, '-')) return std::nullopt;
    SkipSpaces(s, pos);

    size_t monthStart = pos;
    while (pos < s.size() && IsAlpha(s[pos])) ++pos;
    if (pos - monthStart < 3) return std::nullopt;
    std::string monthLabel = s.substr(monthStart, pos - monthStart);

    size_t gap = pos;
    SkipSpaces(s, pos);
    if (pos == gap) return std::nullopt;

    if (!ReadDigits(s, pos, 1, 2, day)) return std::nullopt;
    if (!Expect(s, pos, ',')) return std::nullopt;
    SkipSpaces(s, pos);
    if (!ReadDigits(s, pos, 4, 4, year)) return std::nullopt;
    if (pos != s.size()) return std::nullopt;

    auto month = MonthFromLabel(monthLabel);
    if (!month) return std::nullopt;
    if (minute < 0 || minute > 59) return std::nullopt;
    if (day < 1 || day > 31) return std::nullopt;
    if (year < 1970 || year > 9999) return std::nullopt;
    if (hourRaw < 1 || hourRaw > 12) return std::nullopt;

    int hour = hourRaw % 12;
    if (meridiem == "pm") hour += 12;
    return Timestamp::FromCivil(year, *month, day, hour, minute);
}

std::string TimestampCodec::FormatDisplay(const Timestamp& ts) {
    int hour12 = ts.hour % 12;
    if (hour12 == 0) hour12 = 12;
    const char* meridiem = ts.hour < 12 ? "am" : "pm";
    const char* month = (ts.month >= 1 && ts.month <= 12) ? kMonthNames[ts.month - 1] : "???";

    std::ostringstream ss;
    ss << hour12 << ':' << std::setw(2) << std::setfill('0') << ts.minute << meridiem
       << " - " << month << ' ' << ts.day << ", " << ts.year;
    return ss.str();
}

std::string TimestampCodec::FormatKey(const Timestamp& ts) {
    // Normalize first so callers may hand in carried-over fields.
    Timestamp n = Timestamp::FromEpochMillis(ts.toEpochMillis());

    std::ostringstream ss;
    ss << std::setfill('0');
    if (n.year >= 0 && n.year <= 9999) {
        ss << std::setw(4) << n.year;
    } else {
        ss << (n.year < 0 ? '-' : '+') << std::setw(6) << std::abs(n.year);
    }
    ss << '-' << std::setw(2) << n.month
       << '-' << std::setw(2) << n.day
       << 'T' << std::setw(2) << n.hour
       << ':' << std::setw(2) << n.minute
       << ':' << std::setw(2) << n.second
       << '.' << std::setw(3) << n.millisecond << 'Z';
    return ss.str();
}

std::optional<Timestamp> TimestampCodec::ParseKey(const std::string& s) {
    size_t pos = 0;
    if (s.empty()) return std::nullopt;

    int year = 0;
    if (s[0] == '+' || s[0] == '-') {
        bool negative = s[0] == '-';
        ++pos;
        if (!ReadDigits(s, pos, 6, 6, year)) return std::nullopt;
        if (negative && year == 0) return std::nullopt;
        if (negative) year = -year;
    } else if (!ReadDigits(s, pos, 4, 4, year)) {
        return std::nullopt;
    }

    int month = 1, day = 1, hour = 0, minute = 0, second = 0, millis = 0;
    long long offsetMinutes = 0;

    if (pos < s.size() && s[pos] == '-') {
        ++pos;
        if (!ReadDigits(s, pos, 2, 2, month)) return std::nullopt;
        if (pos < s.size() && s[pos] == '-') {
            ++pos;
            if (!ReadDigits(s, pos, 2, 2, day)) return std::nullopt;
        }
    }

    if (pos < s.size() && (s[pos] == 'T' || s[pos] == ' ')) {
        ++pos;
        if (!ReadDigits(s, pos, 2, 2, hour)) return std::nullopt;
        if (!Expect(s, pos, ':')) return std::nullopt;
        if (!ReadDigits(s, pos, 2, 2, minute)) return std::nullopt;
        if (pos < s.size() && s[pos] == ':') {
            ++pos;
            if (!ReadDigits(s, pos, 2, 2, second)) return std::nullopt;
            if (pos < s.size() && s[pos] == '.') {
                ++pos;
                size_t fracStart = pos;
                int scale = 100;
                // Digits past the third are accepted and truncated.
                while (pos < s.size() && text::IsDigit(s[pos])) {
                    millis += (s[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                }
                if (pos == fracStart) return std::nullopt;
            }
        }

        if (pos < s.size() && s[pos] == 'Z') {
            ++pos;
        } else if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
            int sign = s[pos] == '-' ? -1 : 1;
            ++pos;
            int offHour = 0, offMinute = 0;
            if (!ReadDigits(s, pos, 2, 2, offHour)) return std::nullopt;
            if (!Expect(s, pos, ':')) return std::nullopt;
            if (!ReadDigits(s, pos, 2, 2, offMinute)) return std::nullopt;
            if (offHour > 23 || offMinute > 59) return std::nullopt;
            offsetMinutes = sign * (offHour * 60 + offMinute);
        }
    }

    if (pos != s.size()) return std::nullopt;

    if (month < 1 || month > 12) return std::nullopt;
    if (day < 1 || day > DaysInMonth(year, month)) return std::nullopt;
    if (minute > 59 || second > 59) return std::nullopt;
    if (hour > 24 || (hour == 24 && (minute != 0 || second != 0 || millis != 0))) return std::nullopt;

    Timestamp raw;
    raw.year = year;
    raw.month = month;
    raw.day = day;
    raw.hour = hour;
    raw.minute = minute;
    raw.second = second;
    raw.millisecond = millis;

    long long instant = raw.toEpochMillis() - offsetMinutes * 60 * 1000;
    if (instant > kMaxEpochMillis || instant < -kMaxEpochMillis) return std::nullopt;
    return Timestamp::FromEpochMillis(instant);
}

std::string TimestampCodec::ToDateInputValue(const Timestamp& ts) {
    std::ostringstream ss;
    ss << ts.year << '-' << std::setw(2) << std::setfill('0') << ts.month
       << '-' << std::setw(2) << std::setfill('0') << ts.day;
    return ss.str();
}

std::string TimestampCodec::ToTimeInputValue(const Timestamp& ts) {
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << ts.hour << ':' << std::setw(2) << ts.minute;
    return ss.str();
}

std::optional<Timestamp> TimestampCodec::CombineDateAndTime(const std::string& dateValue, const std::string& timeValue) {
    size_t pos = 0;
    int year = 0, month = 0, day = 0, hour = 0, minute = 0;

    if (!ReadDigits(dateValue, pos, 4, 4, year)) return std::nullopt;
    if (!Expect(dateValue, pos, '-')) return std::nullopt;
    if (!ReadDigits(dateValue, pos, 2, 2, month)) return std::nullopt;
    if (!Expect(dateValue, pos, '-')) return std::nullopt;
    if (!ReadDigits(dateValue, pos, 2, 2, day)) return std::nullopt;
    if (pos != dateValue.size()) return std::nullopt;

    pos = 0;
    if (!ReadDigits(timeValue, pos, 2, 2, hour)) return std::nullopt;
    if (!Expect(timeValue, pos, ':')) return std::nullopt;
    if (!ReadDigits(timeValue, pos, 2, 2, minute)) return std::nullopt;
    if (pos != timeValue.size()) return std::nullopt;

    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;
    if (hour > 23 || minute > 59) return std::nullopt;
    return Timestamp::FromCivil(year, month, day, hour, minute);
}

} // namespace notestamp::domain
