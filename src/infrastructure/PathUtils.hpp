/**
 * @file PathUtils.hpp
 * @brief XDG base directory resolution for default data and config locations.
 */

#pragma once
#include <filesystem>

namespace staffledger::infrastructure {

class PathUtils {
public:
    /** @brief $XDG_DATA_HOME, else ~/.local/share, else the working directory. */
    static std::filesystem::path GetDataHome();

    /** @brief $XDG_CONFIG_HOME, else ~/.config, else the working directory. */
    static std::filesystem::path GetConfigHome();
};

} // namespace staffledger::infrastructure
