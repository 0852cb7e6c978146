/**
 * ROM Audit - Platform Implementation (Linux)
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifdef PLATFORM_LINUX

#include "Platform.hpp"

#include <cstdlib>

namespace romaudit {

namespace {
    constexpr const char* APP_NAME = "romaudit";
    
    std::filesystem::path xdgPath(const char* variable, const std::filesystem::path& homeRelative) {
        const char* xdg = std::getenv(variable);
        if (xdg && xdg[0] != '\0') {
            return std::filesystem::path(xdg) / APP_NAME;
        }
        
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / homeRelative / APP_NAME;
        }
        
        return homeRelative / APP_NAME;
    }
}

std::filesystem::path Platform::getConfigPath() {
    // XDG_CONFIG_HOME if set, otherwise ~/.config
    return xdgPath("XDG_CONFIG_HOME", ".config");
}

std::filesystem::path Platform::getCachePath() {
    // XDG_CACHE_HOME if set, otherwise ~/.cache
    return xdgPath("XDG_CACHE_HOME", ".cache");
}

} // namespace romaudit

#endif // PLATFORM_LINUX
