/**
 * @file TimestampCodec.hpp
 * @brief Text renderings of a Timestamp: display label, storage key and editor inputs.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/Timestamp.hpp"

namespace notestamp::domain {

/**
 * @brief Stateless conversions between Timestamp and its textual forms.
 *
 * Every parser here reports "no match" with an empty optional and never throws.
 */
class TimestampCodec {
public:
    /**
     * @brief Parses a display label such as "9:05pm - Jan 5, 2024".
     *
     * Meridiem is case-insensitive and the month may be any word whose first
     * three letters name a month ("Sept", "january"). Hour must be 1-12,
     * minute 0-59, day 1-31 and year 1970-9999.
     */
    static std::optional<Timestamp> ParseDisplay(const std::string& text);

    /** @brief Renders "h:mm[am|pm] - Mon d, yyyy". */
    static std::string FormatDisplay(const Timestamp& ts);

    /**
     * @brief Renders the storage key "YYYY-MM-DDTHH:MM:SS.mmmZ".
     * The wall clock is written as if it were UTC.
     */
    static std::string FormatKey(const Timestamp& ts);

    /**
     * @brief Parses an absolute ISO 8601 date or date-time.
     *
     * Accepts YYYY, YYYY-MM and YYYY-MM-DD, optionally followed by
     * THH:MM[:SS[.fff]] and a Z or +HH:MM designator. An explicit offset is
     * folded in before the instant is read back as a wall clock.
     */
    static std::optional<Timestamp> ParseKey(const std::string& text);

    /** @brief "YYYY-MM-DD" for a date editor. */
    static std::string ToDateInputValue(const Timestamp& ts);

    /** @brief "HH:MM" (24-hour) for a time editor. */
    static std::string ToTimeInputValue(const Timestamp& ts);

    /**
     * @brief Combines separately edited "YYYY-MM-DD" and "HH:MM" values.
     * @return std::nullopt if either component is malformed or out of range.
     */
    static std::optional<Timestamp> CombineDateAndTime(const std::string& dateValue, const std::string& timeValue);
};

} // namespace notestamp::domain
