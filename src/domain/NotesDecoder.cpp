/**
 * @file NotesDecoder.cpp
 * @brief Implementation of NotesDecoder.
 */

#include "domain/NotesDecoder.hpp"
#include "domain/TextUtils.hpp"
#include "domain/TimestampCodec.hpp"
#include <iostream>
#include <nlohmann/json.hpp>

namespace notestamp::domain {

using json = nlohmann::ordered_json;

namespace {

// Values nested deeper than this are not note text; the whole field is read as plain text.
constexpr int kMaxNestingDepth = 256;

std::optional<Timestamp> TimestampFromEpochKey(const std::string& key) {
    std::string s = text::Trim(key);
    size_t pos = 0;
    bool negative = false;
    if (pos < s.size() && (s[pos] == '+' || s[pos] == '-')) {
        negative = s[pos] == '-';
        ++pos;
    }
    if (pos >= s.size()) return std::nullopt;

    long long millis = 0;
    for (; pos < s.size(); ++pos) {
        if (!text::IsDigit(s[pos])) return std::nullopt;
        millis = millis * 10 + (s[pos] - '0');
        if (millis > kMaxEpochMillis) return std::nullopt;
    }
    return Timestamp::FromEpochMillis(negative ? -millis : millis);
}

// Stored values are normally strings; anything else is reduced to text here and nowhere else.
std::string CoerceToText(const json& value) {
    if (value.is_null()) return "";
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace

std::optional<Timestamp> NotesDecoder::TimestampFromKey(const std::string& key) {
    if (auto iso = TimestampCodec::ParseKey(key)) return iso;
    if (auto label = TimestampCodec::ParseDisplay(key)) return label;
    return TimestampFromEpochKey(key);
}

std::optional<ParsedNotes> NotesDecoder::DecodeStructured(const std::string& raw) {
    std::string trimmed = text::Trim(raw);
    if (trimmed.empty()) return std::nullopt;

    bool tooDeep = false;
    json::parser_callback_t limitDepth = [&tooDeep](int depth, json::parse_event_t, json&) {
        if (depth > kMaxNestingDepth) tooDeep = true;
        return !tooDeep;
    };

    // Syntax errors and out-of-range numbers (1e400) both come back discarded.
    json parsed = json::parse(trimmed, limitDepth, false);
    if (parsed.is_discarded() || tooDeep) {
        // Plain text or the legacy line format.
        return std::nullopt;
    }
    if (!parsed.is_object()) return std::nullopt;

    ParsedNotes notes;
    for (const auto& item : parsed.items()) {
        auto ts = TimestampFromKey(item.key());
        if (!ts) continue;
        notes.entries.push_back({*ts, CoerceToText(item.value())});
    }

    if (notes.entries.empty()) {
        if (!parsed.empty()) {
            std::cerr << "[NotesDecoder] JSON object has no timestamp keys (" << parsed.size()
                      << " dropped); reading it as plain text." << std::endl;
        }
        return std::nullopt;
    }
    return notes;
}

ParsedNotes NotesDecoder::DecodeLines(const std::string& raw) {
    ParsedNotes notes;
    std::vector<std::string> preambleLines;
    std::optional<NoteEntry> current;

    for (const auto& line : text::SplitLines(raw)) {
        if (!line.empty() && line[0] == '[') {
            size_t close = line.find(']');
            if (close != std::string::npos && close > 1) {
                size_t restStart = close + 1;
                while (restStart < line.size() && text::IsSpace(line[restStart])) ++restStart;
                std::string rest = line.substr(restStart);
                auto ts = rest.find('\r') == std::string::npos
                    ? TimestampCodec::ParseDisplay(line.substr(1, close - 1))
                    : std::nullopt;
                if (ts) {
                    if (current) notes.entries.push_back(std::move(*current));
                    current = NoteEntry{*ts, rest};
                    continue;
                }
            }
        }

        if (current) {
            current->text = text::JoinWithNewline(current->text, line);
        } else {
            preambleLines.push_back(line);
        }
    }
    if (current) notes.entries.push_back(std::move(*current));

    std::string preamble;
    for (size_t i = 0; i < preambleLines.size(); ++i) {
        if (i > 0) preamble += "\n";
        preamble += preambleLines[i];
    }
    notes.preamble = text::TrimEnd(preamble);
    return notes;
}

ParsedNotes NotesDecoder::Decode(const std::string& raw) {
    if (raw.empty()) return {};
    if (auto structured = DecodeStructured(raw)) return *structured;
    return DecodeLines(raw);
}

} // namespace notestamp::domain
