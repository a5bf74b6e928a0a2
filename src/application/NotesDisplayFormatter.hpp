/**
 * @file NotesDisplayFormatter.hpp
 * @brief Read-only rendering of a stored notes string.
 */

#pragma once
#include <string>

namespace notestamp::application {

class NotesDisplayFormatter {
public:
    /**
     * @brief Renders canonical notes as "[9:05pm - Jan 5, 2024] text" lines.
     *
     * Input that is not canonical JSON is returned trimmed and otherwise
     * unchanged. Blank input yields an empty string. The output is valid
     * legacy line format, so it decodes back to the same timestamps.
     */
    static std::string FormatForDisplay(const std::string& raw);
};

} // namespace notestamp::application
