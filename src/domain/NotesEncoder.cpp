/**
 * @file NotesEncoder.cpp
 * @brief Implementation of NotesEncoder.
 */

#include "domain/NotesEncoder.hpp"
#include "domain/TextUtils.hpp"
#include "domain/TimestampCodec.hpp"
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace notestamp::domain {

using json = nlohmann::ordered_json;

std::vector<std::string> NotesEncoder::ResolveKeys(const std::vector<NoteEntry>& entries) {
    std::vector<std::string> keys;
    keys.reserve(entries.size());
    std::unordered_set<std::string> used;

    for (const auto& entry : entries) {
        long long instant = entry.timestamp.toEpochMillis();
        std::string key = TimestampCodec::FormatKey(Timestamp::FromEpochMillis(instant));
        while (used.count(key) > 0) {
            ++instant;
            key = TimestampCodec::FormatKey(Timestamp::FromEpochMillis(instant));
        }
        used.insert(key);
        keys.push_back(std::move(key));
    }
    return keys;
}

std::string NotesEncoder::Encode(const ParsedNotes& notes, int jsonIndent) {
    std::string preamble = text::TrimEnd(notes.preamble);
    if (notes.entries.empty()) return preamble;

    std::vector<std::string> keys = ResolveKeys(notes.entries);

    json obj = json::object();
    for (size_t i = 0; i < notes.entries.size(); ++i) {
        const std::string& body = notes.entries[i].text;
        if (i == 0 && !preamble.empty()) {
            obj[keys[i]] = body.empty() ? preamble : preamble + "\n" + body;
        } else {
            obj[keys[i]] = body;
        }
    }

    // Legacy text may carry invalid UTF-8; replace it rather than throw.
    return obj.dump(jsonIndent, ' ', false, json::error_handler_t::replace);
}

} // namespace notestamp::domain
