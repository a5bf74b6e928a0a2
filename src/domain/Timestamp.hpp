/**
 * @file Timestamp.hpp
 * @brief Timezone-naive wall-clock value used to stamp note entries.
 */

#pragma once

namespace notestamp::domain {

/// Largest magnitude of a naive millisecond count accepted anywhere in the codec.
constexpr long long kMaxEpochMillis = 8640000000000000LL;

/**
 * @struct Timestamp
 * @brief A local wall-clock instant with no UTC offset semantics.
 *
 * Entries are stamped at minute resolution; second and millisecond stay zero
 * unless the encoder had to shift a colliding key or a stored key carried
 * sub-minute precision.
 */
struct Timestamp {
    int year = 1970;
    int month = 1;      ///< 1-12
    int day = 1;        ///< 1-31
    int hour = 0;       ///< 0-23
    int minute = 0;     ///< 0-59
    int second = 0;
    int millisecond = 0;

    /**
     * @brief Milliseconds since 1970-01-01T00:00, reading the wall clock as if it were UTC.
     * Out-of-range fields are carried over (day 31 of February lands in March).
     */
    long long toEpochMillis() const;

    /** @brief Inverse of toEpochMillis; always yields normalized fields. */
    static Timestamp FromEpochMillis(long long millis);

    /**
     * @brief Builds a minute-resolution timestamp, normalizing day overflow
     * into the following month the way a calendar date facility does.
     */
    static Timestamp FromCivil(int year, int month, int day, int hour, int minute);

    /** @brief Current local wall clock, truncated to the minute. */
    static Timestamp Now();

    bool operator==(const Timestamp& other) const;
    bool operator!=(const Timestamp& other) const { return !(*this == other); }
};

/// Days since 1970-01-01 for a proleptic Gregorian date. Linear in @p day.
long long DaysFromCivil(long long year, int month, int day);

/// Days in @p month of @p year, honoring leap years.
int DaysInMonth(long long year, int month);

} // namespace notestamp::domain
