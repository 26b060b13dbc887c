/**
 * @file PathUtils.cpp
 * @brief Implementation of PathUtils.
 */

#include "infrastructure/PathUtils.hpp"
#include <cstdlib>
#include <filesystem>

namespace adaharvest::infrastructure {

namespace fs = std::filesystem;

namespace {

fs::path FromEnvOrHome(const char* variable, const char* homeRelative) {
    const char* value = std::getenv(variable);
    if (value && *value) {
        return fs::path(value);
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return fs::path(home) / homeRelative;
    }
    return fs::current_path(); // Fallback
}

} // namespace

fs::path PathUtils::GetDataHome() {
    return FromEnvOrHome("XDG_DATA_HOME", ".local/share");
}

fs::path PathUtils::GetConfigHome() {
    return FromEnvOrHome("XDG_CONFIG_HOME", ".config");
}

fs::path PathUtils::GetDefaultConfigPath() {
    return GetConfigHome() / "AdaHarvest" / "settings.json";
}

fs::path PathUtils::GetDefaultOutputRoot() {
    return GetDataHome() / "AdaHarvest" / "dataset";
}

} // namespace adaharvest::infrastructure
