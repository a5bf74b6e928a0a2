/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>

namespace notestamp::infrastructure {

namespace fs = std::filesystem;

fs::path PathUtils::GetAppConfigDir() {
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg && *xdg) return fs::path(xdg) / "notestamp";

    const char* home = std::getenv("HOME");
    if (home && *home) return fs::path(home) / ".config" / "notestamp";

    return fs::current_path() / "notestamp";
}

} // namespace notestamp::infrastructure
