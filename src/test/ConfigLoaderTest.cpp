#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include <nlohmann/json.hpp>
#include "infrastructure/ConfigLoader.hpp"
#include "infrastructure/PathUtils.hpp"

using namespace notestamp::infrastructure;
namespace fs = std::filesystem;

namespace {

fs::path MakeConfigDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / "notestamp_config_loader_tests" / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void WriteSettings(const fs::path& dir, const std::string& content) {
    std::ofstream out(dir / "settings.json");
    out << content;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ConfigLoader Test..." << std::endl;

    // Missing file: defaults
    {
        fs::path dir = MakeConfigDir("missing");
        CodecSettings settings = ConfigLoader::Load(dir.string());
        assert(settings.jsonIndent == -1);
        assert(settings.defaultCommand == "display");
    }

    // Values are read
    {
        fs::path dir = MakeConfigDir("values");
        WriteSettings(dir, R"({"json_indent": 2, "default_command": "decode"})");
        CodecSettings settings = ConfigLoader::Load(dir.string());
        assert(settings.jsonIndent == 2);
        assert(settings.defaultCommand == "decode");
    }

    // Wrongly typed keys fall back individually
    {
        fs::path dir = MakeConfigDir("types");
        WriteSettings(dir, R"({"json_indent": "wide", "default_command": "normalize"})");
        CodecSettings settings = ConfigLoader::Load(dir.string());
        assert(settings.jsonIndent == -1);
        assert(settings.defaultCommand == "normalize");
    }

    // json_indent outside [-1, 16] is clamped instead of wrapping through int
    {
        fs::path dir = MakeConfigDir("indent_range");
        WriteSettings(dir, R"({"json_indent": 4294967296})");
        assert(ConfigLoader::Load(dir.string()).jsonIndent == ConfigLoader::kMaxJsonIndent);

        WriteSettings(dir, R"({"json_indent": 2000000000})");
        assert(ConfigLoader::Load(dir.string()).jsonIndent == ConfigLoader::kMaxJsonIndent);

        WriteSettings(dir, R"({"json_indent": -7})");
        assert(ConfigLoader::Load(dir.string()).jsonIndent == -1);

        WriteSettings(dir, R"({"json_indent": 16})");
        assert(ConfigLoader::Load(dir.string()).jsonIndent == 16);
    }

    // Malformed file: defaults
    {
        fs::path dir = MakeConfigDir("malformed");
        WriteSettings(dir, "{ json_indent: ");
        CodecSettings settings = ConfigLoader::Load(dir.string());
        assert(settings.jsonIndent == -1);
        assert(settings.defaultCommand == "display");
    }

    // Save preserves unrelated keys and creates missing directories
    {
        fs::path dir = MakeConfigDir("save");
        WriteSettings(dir, R"({"theme": "dark", "json_indent": 8})");

        CodecSettings settings;
        settings.jsonIndent = 4;
        settings.defaultCommand = "normalize";
        assert(ConfigLoader::Save(dir.string(), settings));

        std::ifstream in(ConfigLoader::GetSettingsPath(dir.string()));
        nlohmann::json j;
        in >> j;
        assert(j["theme"] == "dark");
        assert(j["json_indent"] == 4);
        assert(j["default_command"] == "normalize");

        CodecSettings reloaded = ConfigLoader::Load(dir.string());
        assert(reloaded.jsonIndent == 4);
        assert(reloaded.defaultCommand == "normalize");

        fs::path nested = dir / "nested" / "deeper";
        assert(ConfigLoader::Save(nested.string(), settings));
        assert(fs::exists(nested / "settings.json"));
    }

    // Config directory follows XDG_CONFIG_HOME, then HOME
    {
        setenv("XDG_CONFIG_HOME", "/tmp/xdg-home", 1);
        assert(PathUtils::GetAppConfigDir() == fs::path("/tmp/xdg-home/notestamp"));

        setenv("XDG_CONFIG_HOME", "", 1);
        setenv("HOME", "/tmp/user-home", 1);
        assert(PathUtils::GetAppConfigDir() == fs::path("/tmp/user-home/.config/notestamp"));
    }

    fs::remove_all(fs::temp_directory_path() / "notestamp_config_loader_tests");
    std::cout << "[PASS] ConfigLoader Test." << std::endl;
    return 0;
}
