/**
 * @file NotesEditService.hpp
 * @brief Application Service for editing a timestamped notes field.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <string>
#include "domain/NoteEntry.hpp"

namespace notestamp::application {

using namespace notestamp::domain;

/**
 * @struct EditResult
 * @brief Outcome of an append: the new notes plus the entry that should take input focus.
 */
struct EditResult {
    ParsedNotes notes;
    size_t focusIndex = 0;
};

/**
 * @class NotesEditService
 * @brief List-level edits over ParsedNotes.
 *
 * Every edit returns a new value and leaves its input untouched. An index
 * outside the entry list throws std::out_of_range.
 */
class NotesEditService {
public:
    using Clock = std::function<Timestamp()>;

    /**
     * @param clock Source of "now" for appended entries.
     * @param jsonIndent Indent used by commit().
     */
    explicit NotesEditService(Clock clock = Timestamp::Now, int jsonIndent = -1);

    // Adds an empty entry stamped with the clock at the end of the list.
    EditResult append(const ParsedNotes& notes) const;
    EditResult append(const ParsedNotes& notes, const Timestamp& at) const;

    ParsedNotes editText(const ParsedNotes& notes, size_t index, const std::string& text) const;

    ParsedNotes editPreamble(const ParsedNotes& notes, const std::string& preamble) const;

    /**
     * @brief Replaces an entry's timestamp.
     * The caller validates edited date/time input (TimestampCodec::CombineDateAndTime) first.
     */
    ParsedNotes retime(const ParsedNotes& notes, size_t index, const Timestamp& timestamp) const;

    /**
     * @brief Removes an entry without losing its text: the text moves to the
     * end of the previous entry, or of the preamble for the first entry.
     */
    ParsedNotes remove(const ParsedNotes& notes, size_t index) const;

    // Encodes the edited value to the canonical stored string.
    std::string commit(const ParsedNotes& notes) const;

private:
    Clock m_clock;
    int m_jsonIndent;

    void checkIndex(const ParsedNotes& notes, size_t index, const char* operation) const;
};

} // namespace notestamp::application
