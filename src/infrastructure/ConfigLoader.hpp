/**
 * @file ConfigLoader.hpp
 * @brief Static utility for loading/saving notestamp configuration (settings.json).
 *
 * Keeps JSON parsing of settings out of the codec and the CLI.
 */

#pragma once

#include <string>
#include <filesystem>

namespace notestamp::infrastructure {

/**
 * @struct CodecSettings
 * @brief User preferences read from settings.json.
 */
struct CodecSettings {
    int jsonIndent = -1;                     ///< Indent of canonical output; -1 is compact.
    std::string defaultCommand = "display";  ///< CLI command run when none is given.
};

class ConfigLoader {
public:
    /// Largest json_indent accepted from settings.json; larger values are clamped.
    static constexpr int kMaxJsonIndent = 16;

    /** @brief Path of settings.json inside @p configDir. */
    static std::filesystem::path GetSettingsPath(const std::string& configDir);

    /**
     * @brief Reads settings.json from @p configDir.
     * @return Defaults for a missing file, and for unreadable or malformed keys.
     *         json_indent is clamped to [-1, kMaxJsonIndent].
     */
    static CodecSettings Load(const std::string& configDir);

    /**
     * @brief Writes @p settings to settings.json, preserving unrelated keys.
     * @return false if the file could not be written.
     */
    static bool Save(const std::string& configDir, const CodecSettings& settings);
};

} // namespace notestamp::infrastructure
