/**
 * @file NotesCommandRunner.cpp
 * @brief Implementation of NotesCommandRunner.
 */

#include "application/NotesCommandRunner.hpp"
#include "application/NotesDisplayFormatter.hpp"
#include "domain/NotesDecoder.hpp"
#include "domain/TimestampCodec.hpp"
#include "infrastructure/ConfigLoader.hpp"
#include <cstddef>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace notestamp::application {

namespace {

std::string ReadAll(std::istream& in) {
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::string JoinArgs(const std::vector<std::string>& args, size_t from) {
    std::string joined;
    for (size_t i = from; i < args.size(); ++i) {
        if (i > from) joined += " ";
        joined += args[i];
    }
    return joined;
}

bool ParseIndex(const std::string& raw, size_t& out) {
    if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) return false;
    try {
        out = static_cast<size_t>(std::stoull(raw));
    } catch (const std::out_of_range&) {
        return false;
    }
    return true;
}

void PrintDecoded(const ParsedNotes& notes, std::ostream& out) {
    if (!notes.preamble.empty()) {
        out << "preamble: " << notes.preamble << "\n";
    }
    for (size_t i = 0; i < notes.entries.size(); ++i) {
        const auto& entry = notes.entries[i];
        out << "#" << i << " [" << TimestampCodec::FormatDisplay(entry.timestamp) << "] "
            << entry.text << "\n";
    }
}

} // namespace

NotesCommandRunner::NotesCommandRunner(std::string configDir, NotesEditService::Clock clock)
    : m_configDir(std::move(configDir)), m_clock(std::move(clock)) {}

void NotesCommandRunner::PrintUsage(std::ostream& out) {
    out <<
        "Usage: notestamp [--config <dir>] <command> [args...]\n"
        "Reads a stored notes string from stdin.\n\n"
        "Commands:\n"
        "  decode                          list preamble and entries\n"
        "  normalize                       re-encode in canonical form\n"
        "  display                         render as [time - date] lines\n"
        "  append [text...]                add an entry stamped now\n"
        "  edit <index> <text...>          replace an entry's text\n"
        "  preamble <text...>              replace the preamble\n"
        "  retime <index> <YYYY-MM-DD> <HH:MM>\n"
        "  delete <index>                  remove an entry, keeping its text\n"
        "  config [json_indent|default_command <value>]\n";
}

int NotesCommandRunner::runConfig(const std::vector<std::string>& args, std::ostream& out) const {
    using infrastructure::ConfigLoader;

    auto settings = ConfigLoader::Load(m_configDir);
    if (args.size() == 1) {
        out << "settings: " << ConfigLoader::GetSettingsPath(m_configDir).string() << "\n"
            << "json_indent: " << settings.jsonIndent << "\n"
            << "default_command: " << settings.defaultCommand << "\n";
        return 0;
    }
    if (args.size() != 3) {
        PrintUsage(std::cerr);
        return 1;
    }

    if (args[1] == "json_indent") {
        int indent = 0;
        try {
            indent = std::stoi(args[2]);
        } catch (const std::exception&) {
            std::cerr << "[notestamp] json_indent must be an integer: " << args[2] << std::endl;
            return 1;
        }
        if (indent < -1 || indent > ConfigLoader::kMaxJsonIndent) {
            std::cerr << "[notestamp] json_indent must be between -1 and "
                      << ConfigLoader::kMaxJsonIndent << ": " << args[2] << std::endl;
            return 1;
        }
        settings.jsonIndent = indent;
    } else if (args[1] == "default_command") {
        settings.defaultCommand = args[2];
    } else {
        std::cerr << "[notestamp] Unknown setting: " << args[1] << std::endl;
        return 1;
    }
    return ConfigLoader::Save(m_configDir, settings) ? 0 : 1;
}

int NotesCommandRunner::run(std::vector<std::string> args, std::istream& in, std::ostream& out) const {
    auto settings = infrastructure::ConfigLoader::Load(m_configDir);
    if (args.empty()) args.push_back(settings.defaultCommand);
    const std::string command = args[0];

    if (command == "config") {
        return runConfig(args, out);
    }

    const std::string raw = ReadAll(in);
    NotesEditService service(m_clock, settings.jsonIndent);
    ParsedNotes notes = NotesDecoder::Decode(raw);

    try {
        if (command == "decode") {
            PrintDecoded(notes, out);
            return 0;
        }
        if (command == "display") {
            out << NotesDisplayFormatter::FormatForDisplay(raw) << "\n";
            return 0;
        }
        if (command == "normalize") {
            out << service.commit(notes) << "\n";
            return 0;
        }
        if (command == "append") {
            auto result = service.append(notes);
            ParsedNotes next = service.editText(result.notes, result.focusIndex, JoinArgs(args, 1));
            out << service.commit(next) << "\n";
            return 0;
        }
        if (command == "preamble") {
            out << service.commit(service.editPreamble(notes, JoinArgs(args, 1))) << "\n";
            return 0;
        }

        if (command != "edit" && command != "retime" && command != "delete") {
            std::cerr << "[notestamp] Unknown command: " << command << std::endl;
            PrintUsage(std::cerr);
            return 1;
        }

        size_t index = 0;
        if (args.size() < 2 || !ParseIndex(args[1], index)) {
            std::cerr << "[notestamp] " << command << " needs an entry index." << std::endl;
            return 1;
        }

        if (command == "edit") {
            out << service.commit(service.editText(notes, index, JoinArgs(args, 2))) << "\n";
            return 0;
        }
        if (command == "delete") {
            out << service.commit(service.remove(notes, index)) << "\n";
            return 0;
        }

        if (args.size() != 4) {
            PrintUsage(std::cerr);
            return 1;
        }
        auto ts = TimestampCodec::CombineDateAndTime(args[2], args[3]);
        if (!ts) {
            std::cerr << "[notestamp] Invalid date/time: " << args[2] << " " << args[3] << std::endl;
            return 1;
        }
        out << service.commit(service.retime(notes, index, *ts)) << "\n";
        return 0;
    } catch (const std::out_of_range& e) {
        std::cerr << "[notestamp] " << e.what() << std::endl;
        return 1;
    }
}

} // namespace notestamp::application
