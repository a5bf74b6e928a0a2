#include "application/NotesDisplayFormatter.hpp"
#include "domain/NotesDecoder.hpp"
#include "domain/TextUtils.hpp"
#include "domain/TimestampCodec.hpp"
#include <sstream>

namespace notestamp::application {

using namespace notestamp::domain;

std::string NotesDisplayFormatter::FormatForDisplay(const std::string& raw) {
    std::string trimmed = text::Trim(raw);
    if (trimmed.empty()) return "";

    auto parsed = NotesDecoder::DecodeStructured(trimmed);
    if (!parsed) return trimmed;

    std::ostringstream out;
    for (size_t i = 0; i < parsed->entries.size(); ++i) {
        const auto& entry = parsed->entries[i];
        if (i > 0) out << "\n";
        out << "[" << TimestampCodec::FormatDisplay(entry.timestamp) << "]";
        std::string body = text::TrimEnd(entry.text);
        if (!body.empty()) out << " " << body;
    }
    return out.str();
}

} // namespace notestamp::application
