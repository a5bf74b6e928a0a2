/**
 * @file NotesEncoder.hpp
 * @brief Serializes ParsedNotes to the canonical stored string.
 */

#pragma once

#include <string>
#include <vector>
#include "domain/NoteEntry.hpp"

namespace notestamp::domain {

class NotesEncoder {
public:
    /**
     * @brief Encodes @p notes as a JSON object of ISO keys to entry text.
     *
     * Without entries the result is the preamble as plain text. Otherwise the
     * preamble is folded into the first entry and keys are made unique by
     * shifting later colliding entries forward one millisecond at a time.
     *
     * @param jsonIndent Indent passed to nlohmann::json::dump (-1 for compact).
     */
    static std::string Encode(const ParsedNotes& notes, int jsonIndent = -1);

    /**
     * @brief The unique keys Encode would assign, in entry order.
     */
    static std::vector<std::string> ResolveKeys(const std::vector<NoteEntry>& entries);
};

} // namespace notestamp::domain
