/**
 * @file NotesDecoder.hpp
 * @brief Turns a stored notes string into ParsedNotes.
 */

#pragma once

#include <optional>
#include <string>
#include "domain/NoteEntry.hpp"

namespace notestamp::domain {

/**
 * @brief Stateless decoder accepting both the canonical JSON object and the
 * legacy bracketed line format on the same input path.
 */
class NotesDecoder {
public:
    /**
     * @brief Decodes any stored string. Never fails.
     *
     * Tries the canonical JSON object first and falls back to the bracketed
     * line format when the input is not an object or none of its keys reads
     * as a timestamp. Unparseable text is kept as preamble or entry text.
     */
    static ParsedNotes Decode(const std::string& raw);

    /**
     * @brief Canonical half of Decode only.
     * @return std::nullopt unless @p raw is a JSON object with at least one timestamp key.
     */
    static std::optional<ParsedNotes> DecodeStructured(const std::string& raw);

    /**
     * @brief Legacy half of Decode only: lines starting with "[h:mm am - Mon d, yyyy]" open entries.
     */
    static ParsedNotes DecodeLines(const std::string& raw);

    /**
     * @brief Derives a timestamp from a canonical key: ISO date-time, display
     * label, then integer millisecond epoch offset.
     */
    static std::optional<Timestamp> TimestampFromKey(const std::string& key);
};

} // namespace notestamp::domain
