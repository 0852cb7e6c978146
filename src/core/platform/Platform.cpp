/**
 * ROM Audit - Platform Common Implementation
 * 
 * Used where no platform-specific file applies (see LinuxPlatform.cpp).
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#ifndef PLATFORM_LINUX

#include "Platform.hpp"

#include <QStandardPaths>

namespace romaudit {

namespace {
    constexpr const char* APP_NAME = "romaudit";
    
    std::filesystem::path standardPath(QStandardPaths::StandardLocation location) {
        QString path = QStandardPaths::writableLocation(location);
        if (path.isEmpty()) {
            return std::filesystem::path(APP_NAME);
        }
        return std::filesystem::path(path.toStdString()) / APP_NAME;
    }
}

std::filesystem::path Platform::getConfigPath() {
    return standardPath(QStandardPaths::GenericConfigLocation);
}

std::filesystem::path Platform::getCachePath() {
    return standardPath(QStandardPaths::GenericCacheLocation);
}

} // namespace romaudit

#endif // PLATFORM_LINUX
