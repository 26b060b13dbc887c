/**
 * @file PathUtils.hpp
 * @brief XDG base directories used for the default settings file and dataset root.
 */

#pragma once
#include <string>
#include <filesystem>

namespace adaharvest::infrastructure {

class PathUtils {
public:
    static std::filesystem::path GetDataHome();
    static std::filesystem::path GetConfigHome();

    /** @brief $XDG_CONFIG_HOME/AdaHarvest/settings.json */
    static std::filesystem::path GetDefaultConfigPath();

    /** @brief $XDG_DATA_HOME/AdaHarvest/dataset */
    static std::filesystem::path GetDefaultOutputRoot();
};

} // namespace adaharvest::infrastructure
