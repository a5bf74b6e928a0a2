/**
 * @file NoteEntry.hpp
 * @brief Structured form of a timestamped notes field.
 */

#pragma once
#include <string>
#include <vector>
#include "domain/Timestamp.hpp"

namespace notestamp::domain {

/**
 * @struct NoteEntry
 * @brief One timestamped note. Text may span several lines.
 */
struct NoteEntry {
    Timestamp timestamp;
    std::string text;

    bool operator==(const NoteEntry& other) const {
        return timestamp == other.timestamp && text == other.text;
    }
};

/**
 * @struct ParsedNotes
 * @brief Decoded notes field: leading untimestamped text plus ordered entries.
 *
 * Entry order is display order and is never re-sorted by timestamp.
 */
struct ParsedNotes {
    std::string preamble; ///< Text that precedes the first entry.
    std::vector<NoteEntry> entries;

    bool operator==(const ParsedNotes& other) const {
        return preamble == other.preamble && entries == other.entries;
    }
};

} // namespace notestamp::domain
