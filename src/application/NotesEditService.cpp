/**
 * @file NotesEditService.cpp
 * @brief Implementation of NotesEditService.
 */

#include "application/NotesEditService.hpp"
#include "domain/NotesEncoder.hpp"
#include "domain/TextUtils.hpp"
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace notestamp::application {

NotesEditService::NotesEditService(Clock clock, int jsonIndent)
    : m_clock(std::move(clock)), m_jsonIndent(jsonIndent) {}

void NotesEditService::checkIndex(const ParsedNotes& notes, size_t index, const char* operation) const {
    if (index >= notes.entries.size()) {
        throw std::out_of_range(std::string(operation) + ": no entry at index " + std::to_string(index)
                                + " (" + std::to_string(notes.entries.size()) + " entries)");
    }
}

EditResult NotesEditService::append(const ParsedNotes& notes) const {
    return append(notes, m_clock ? m_clock() : Timestamp::Now());
}

EditResult NotesEditService::append(const ParsedNotes& notes, const Timestamp& at) const {
    EditResult result;
    result.notes = notes;
    result.notes.entries.push_back({at, ""});
    result.focusIndex = result.notes.entries.size() - 1;
    return result;
}

ParsedNotes NotesEditService::editText(const ParsedNotes& notes, size_t index, const std::string& text) const {
    checkIndex(notes, index, "editText");
    ParsedNotes next = notes;
    next.entries[index].text = text;
    return next;
}

ParsedNotes NotesEditService::editPreamble(const ParsedNotes& notes, const std::string& preamble) const {
    ParsedNotes next = notes;
    next.preamble = preamble;
    return next;
}

ParsedNotes NotesEditService::retime(const ParsedNotes& notes, size_t index, const Timestamp& timestamp) const {
    checkIndex(notes, index, "retime");
    ParsedNotes next = notes;
    next.entries[index].timestamp = timestamp;
    return next;
}

ParsedNotes NotesEditService::remove(const ParsedNotes& notes, size_t index) const {
    checkIndex(notes, index, "remove");
    ParsedNotes next = notes;
    std::string moved = next.entries[index].text;
    next.entries.erase(next.entries.begin() + static_cast<std::ptrdiff_t>(index));

    if (!moved.empty()) {
        if (index > 0) {
            auto& previous = next.entries[index - 1];
            previous.text = domain::text::JoinWithNewline(previous.text, moved);
        } else {
            next.preamble = domain::text::JoinWithNewline(next.preamble, moved);
        }
    }
    return next;
}

std::string NotesEditService::commit(const ParsedNotes& notes) const {
    return NotesEncoder::Encode(notes, m_jsonIndent);
}

} // namespace notestamp::application
