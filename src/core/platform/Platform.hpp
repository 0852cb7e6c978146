/**
 * ROM Audit - Platform Abstraction
 * 
 * Per-user locations for configuration and logs.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

namespace romaudit {

/**
 * Platform abstraction layer
 */
class Platform {
public:
    /**
     * Get the configuration directory path
     * 
     * Linux:   $XDG_CONFIG_HOME/romaudit/ or ~/.config/romaudit/
     * Others:  QStandardPaths::GenericConfigLocation
     */
    static std::filesystem::path getConfigPath();
    
    /**
     * Get the cache directory path (logs)
     * 
     * Linux:   $XDG_CACHE_HOME/romaudit/ or ~/.cache/romaudit/
     * Others:  QStandardPaths::GenericCacheLocation
     */
    static std::filesystem::path getCachePath();
    
    /**
     * Default configuration file, <config path>/config.json
     */
    static std::filesystem::path getDefaultConfigFile() {
        return getConfigPath() / "config.json";
    }
    
    static constexpr bool isLinux() {
#ifdef PLATFORM_LINUX
        return true;
#else
        return false;
#endif
    }
};

} // namespace romaudit
