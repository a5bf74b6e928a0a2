/**
 * @file ConfigLoader.cpp
 * @brief Implementation of ConfigLoader.
 */

#include "infrastructure/ConfigLoader.hpp"
#include <cstdint>
#include <fstream>
#include <nlohmann/json.hpp>
#include <iostream>
#include <system_error>

namespace notestamp::infrastructure {

namespace fs = std::filesystem;

namespace {

// Non-negative integers parse as unsigned and may exceed int; compare before narrowing.
int ClampJsonIndent(const nlohmann::json& value) {
    const int maxIndent = ConfigLoader::kMaxJsonIndent;
    bool tooLarge = value.is_number_unsigned()
        ? value.get<std::uint64_t>() > static_cast<std::uint64_t>(maxIndent)
        : value.get<std::int64_t>() > maxIndent;
    bool tooSmall = !value.is_number_unsigned() && value.get<std::int64_t>() < -1;
    if (!tooLarge && !tooSmall) return value.get<int>();

    int clamped = tooSmall ? -1 : maxIndent;
    std::cerr << "[ConfigLoader] json_indent " << value.dump() << " out of range, using "
              << clamped << std::endl;
    return clamped;
}

} // namespace

fs::path ConfigLoader::GetSettingsPath(const std::string& configDir) {
    return fs::path(configDir) / "settings.json";
}

CodecSettings ConfigLoader::Load(const std::string& configDir) {
    CodecSettings settings;
    fs::path configPath = GetSettingsPath(configDir);
    if (!fs::exists(configPath)) {
        return settings;
    }

    try {
        std::ifstream f(configPath);
        nlohmann::json j;
        f >> j;

        if (j.contains("json_indent") && j["json_indent"].is_number_integer()) {
            settings.jsonIndent = ClampJsonIndent(j["json_indent"]);
        }
        if (j.contains("default_command") && j["default_command"].is_string()) {
            settings.defaultCommand = j["default_command"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[ConfigLoader] Error reading settings.json: " << e.what() << std::endl;
        return CodecSettings{};
    }

    return settings;
}

bool ConfigLoader::Save(const std::string& configDir, const CodecSettings& settings) {
    fs::path configPath = GetSettingsPath(configDir);
    nlohmann::json j = nlohmann::json::object();

    // Load existing to preserve other keys
    if (fs::exists(configPath)) {
        try {
            std::ifstream f(configPath);
            f >> j;
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[ConfigLoader] Overwriting unreadable settings.json: " << e.what() << std::endl;
            j = nlohmann::json::object();
        }
        if (!j.is_object()) j = nlohmann::json::object();
    }

    j["json_indent"] = settings.jsonIndent;
    j["default_command"] = settings.defaultCommand;

    std::error_code ec;
    fs::create_directories(configPath.parent_path(), ec);
    if (ec) {
        std::cerr << "[ConfigLoader] Error creating " << configPath.parent_path() << ": " << ec.message() << std::endl;
        return false;
    }

    std::ofstream f(configPath);
    if (!f.is_open()) {
        std::cerr << "[ConfigLoader] Error writing settings.json: cannot open " << configPath << std::endl;
        return false;
    }
    f << j.dump(4);
    return !f.fail();
}

} // namespace notestamp::infrastructure
