/**
 * @file PathUtils.hpp
 * @brief Locates the per-user notestamp configuration directory.
 */

#pragma once
#include <filesystem>

namespace notestamp::infrastructure {

class PathUtils {
public:
    /**
     * @brief Directory holding settings.json.
     *
     * $XDG_CONFIG_HOME/notestamp, else $HOME/.config/notestamp, else
     * notestamp under the working directory when neither variable is set.
     */
    static std::filesystem::path GetAppConfigDir();
};

} // namespace notestamp::infrastructure
