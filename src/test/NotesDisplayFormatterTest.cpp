#include <cassert>
#include <iostream>
#include <string>

#include "application/NotesDisplayFormatter.hpp"
#include "domain/NotesDecoder.hpp"

using namespace notestamp::application;
using namespace notestamp::domain;

int main() {
    std::cout << "[Test] Starting NotesDisplayFormatter Test..." << std::endl;

    assert(NotesDisplayFormatter::FormatForDisplay("") == "");
    assert(NotesDisplayFormatter::FormatForDisplay("  \n ") == "");
    assert(NotesDisplayFormatter::FormatForDisplay("  plain text  \n") == "plain text");

    // Legacy input is shown as stored.
    std::string legacy = "Intro\n[10:00am - Jan 1, 2024] Follow-up";
    assert(NotesDisplayFormatter::FormatForDisplay(legacy) == legacy);

    std::string stored = R"({"2024-01-05T21:05:00.000Z":"Call back  \n","2024-01-06T09:00:00.000Z":""})";
    std::string shown = NotesDisplayFormatter::FormatForDisplay(stored);
    assert(shown == "[9:05pm - Jan 5, 2024] Call back\n[9:00am - Jan 6, 2024]");

    // The rendering is itself readable as the line format.
    ParsedNotes reread = NotesDecoder::Decode(shown);
    assert(reread.preamble.empty());
    assert(reread.entries.size() == 2);
    assert(reread.entries[0].timestamp == Timestamp::FromCivil(2024, 1, 5, 21, 5));
    assert(reread.entries[0].text == "Call back");
    assert(reread.entries[1].timestamp == Timestamp::FromCivil(2024, 1, 6, 9, 0));
    assert(reread.entries[1].text.empty());

    std::cout << "[PASS] NotesDisplayFormatter Test." << std::endl;
    return 0;
}
