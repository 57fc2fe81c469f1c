/**
 * @file PathUtils.hpp
 * @brief XDG locations of the engine's settings and project store.
 */

#pragma once

#include <filesystem>

namespace webforge::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME, else ~/.local/share, else the working directory. */
    static std::filesystem::path GetDataHome();
    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();

    static std::filesystem::path GetProjectsDir();
    static std::filesystem::path GetSettingsFile();
};

} // namespace webforge::infrastructure
