#include <cassert>
#include <iostream>

#include "domain/Timestamp.hpp"
#include "domain/TimestampCodec.hpp"

using namespace notestamp::domain;

static void TestParseDisplay() {
    // Hour outside 1-12 is rejected before the 24-hour conversion.
    assert(!TimestampCodec::ParseDisplay("13:05pm - Jan 1, 2024"));
    assert(!TimestampCodec::ParseDisplay("0:05am - Jan 1, 2024"));

    auto late = TimestampCodec::ParseDisplay("11:05pm - Dec 31, 2023");
    assert(late && *late == Timestamp::FromCivil(2023, 12, 31, 23, 5));

    auto midnight = TimestampCodec::ParseDisplay("12:00am - Jan 1, 2024");
    assert(midnight && midnight->hour == 0 && midnight->minute == 0);

    auto noon = TimestampCodec::ParseDisplay("12:30PM - jan 1, 2024");
    assert(noon && noon->hour == 12 && noon->minute == 30);

    // Loose spacing, full month names and surrounding whitespace.
    auto loose = TimestampCodec::ParseDisplay("  9:05 pm -  September 5,2024 ");
    assert(loose && *loose == Timestamp::FromCivil(2024, 9, 5, 21, 5));

    assert(!TimestampCodec::ParseDisplay("9:05pm - Foo 5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Ja 5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:60pm - Jan 5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:5pm - Jan 5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan 32, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan 0, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan 5, 1969"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan 5, 24"));
    assert(!TimestampCodec::ParseDisplay("9:05pm Jan 5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan5, 2024"));
    assert(!TimestampCodec::ParseDisplay("9:05pm - Jan 5, 2024 extra"));
    assert(!TimestampCodec::ParseDisplay(""));

    // Day overflow rolls into the next month like the calendar does.
    auto rolled = TimestampCodec::ParseDisplay("8:00am - Feb 30, 2024");
    assert(rolled && *rolled == Timestamp::FromCivil(2024, 3, 1, 8, 0));
}

static void TestFormatDisplay() {
    assert(TimestampCodec::FormatDisplay(Timestamp::FromCivil(2024, 1, 5, 21, 5)) == "9:05pm - Jan 5, 2024");
    assert(TimestampCodec::FormatDisplay(Timestamp::FromCivil(2024, 1, 1, 0, 0)) == "12:00am - Jan 1, 2024");
    assert(TimestampCodec::FormatDisplay(Timestamp::FromCivil(2023, 12, 31, 12, 59)) == "12:59pm - Dec 31, 2023");

    // Re-parsing the label gives back the same timestamp.
    const int years[] = {1970, 1999, 2024, 2028, 9999};
    const int minutes[] = {0, 7, 30, 59};
    for (int year : years) {
        for (int month = 1; month <= 12; ++month) {
            for (int hour = 0; hour < 24; ++hour) {
                for (int minute : minutes) {
                    int day = 1 + (hour + month) % DaysInMonth(year, month);
                    Timestamp ts = Timestamp::FromCivil(year, month, day, hour, minute);
                    auto back = TimestampCodec::ParseDisplay(TimestampCodec::FormatDisplay(ts));
                    assert(back && *back == ts);
                }
            }
        }
    }
}

static void TestKeys() {
    Timestamp ts = Timestamp::FromCivil(2024, 1, 1, 10, 0);
    assert(TimestampCodec::FormatKey(ts) == "2024-01-01T10:00:00.000Z");

    auto parsed = TimestampCodec::ParseKey("2024-01-01T10:00:00.000Z");
    assert(parsed && *parsed == ts);

    auto shifted = TimestampCodec::ParseKey("2024-01-01T10:00:00.001Z");
    assert(shifted && shifted->millisecond == 1);
    assert(shifted->toEpochMillis() - ts.toEpochMillis() == 1);

    auto offset = TimestampCodec::ParseKey("2024-01-01T12:00:00+02:00");
    assert(offset && *offset == ts);

    auto noSeconds = TimestampCodec::ParseKey("2024-01-01T10:00");
    assert(noSeconds && *noSeconds == ts);

    auto dateOnly = TimestampCodec::ParseKey("2024-01-01");
    assert(dateOnly && *dateOnly == Timestamp::FromCivil(2024, 1, 1, 0, 0));

    auto leap = TimestampCodec::ParseKey("2024-02-29T00:00:00Z");
    assert(leap && leap->day == 29);

    assert(!TimestampCodec::ParseKey("2023-02-29"));
    assert(!TimestampCodec::ParseKey("2024-13-01"));
    assert(!TimestampCodec::ParseKey("2024-01-01T25:00"));
    assert(!TimestampCodec::ParseKey("2024-01-01T10:00:00.Z"));
    assert(!TimestampCodec::ParseKey("9:05pm - Jan 5, 2024"));
    assert(!TimestampCodec::ParseKey("1704103200000"));
    assert(!TimestampCodec::ParseKey("hello"));
    assert(!TimestampCodec::ParseKey(""));

    Timestamp far = Timestamp::FromCivil(10000, 1, 1, 0, 0);
    assert(TimestampCodec::FormatKey(far) == "+010000-01-01T00:00:00.000Z");
    auto farBack = TimestampCodec::ParseKey("+010000-01-01T00:00:00.000Z");
    assert(farBack && *farBack == far);
}

static void TestEpochArithmetic() {
    assert(Timestamp::FromCivil(1970, 1, 1, 0, 0).toEpochMillis() == 0);
    assert(Timestamp::FromEpochMillis(86400000LL) == Timestamp::FromCivil(1970, 1, 2, 0, 0));
    assert(Timestamp::FromCivil(2024, 1, 1, 0, 0).toEpochMillis() == 1704067200000LL);

    Timestamp beforeEpoch = Timestamp::FromEpochMillis(-1);
    assert(beforeEpoch.year == 1969 && beforeEpoch.month == 12 && beforeEpoch.day == 31);
    assert(beforeEpoch.hour == 23 && beforeEpoch.minute == 59);
    assert(beforeEpoch.second == 59 && beforeEpoch.millisecond == 999);

    Timestamp now = Timestamp::Now();
    assert(now.second == 0 && now.millisecond == 0);
    assert(now.month >= 1 && now.month <= 12);
}

static void TestEditorInputs() {
    Timestamp ts = Timestamp::FromCivil(2024, 3, 7, 9, 5);
    assert(TimestampCodec::ToDateInputValue(ts) == "2024-03-07");
    assert(TimestampCodec::ToTimeInputValue(ts) == "09:05");

    auto combined = TimestampCodec::CombineDateAndTime("2024-03-07", "09:05");
    assert(combined && *combined == ts);

    auto back = TimestampCodec::CombineDateAndTime(TimestampCodec::ToDateInputValue(ts),
                                                   TimestampCodec::ToTimeInputValue(ts));
    assert(back && *back == ts);

    assert(!TimestampCodec::CombineDateAndTime("2024-3-7", "09:05"));
    assert(!TimestampCodec::CombineDateAndTime("2024-03-07", "9:05"));
    assert(!TimestampCodec::CombineDateAndTime("2024-13-01", "09:05"));
    assert(!TimestampCodec::CombineDateAndTime("2024-03-00", "09:05"));
    assert(!TimestampCodec::CombineDateAndTime("2024-03-07", "24:00"));
    assert(!TimestampCodec::CombineDateAndTime("2024-03-07", "10:60"));
    assert(!TimestampCodec::CombineDateAndTime("", ""));
}

int main() {
    std::cout << "[Test] Starting TimestampCodec Test..." << std::endl;

    TestParseDisplay();
    TestFormatDisplay();
    TestKeys();
    TestEpochArithmetic();
    TestEditorInputs();

    std::cout << "[PASS] TimestampCodec Test." << std::endl;
    return 0;
}
