/**
 * ROM Audit - Audit Configuration
 * 
 * Settings for a verification run, stored as JSON.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "audit/PackagingPolicy.hpp"

namespace romaudit {

/**
 * Audit configuration
 * 
 * Command line options override the loaded values.
 */
struct AuditConfig {
    std::filesystem::path datFile;                      // Catalog to load
    std::filesystem::path romsDirectory;                // Collection root
    PackagingPolicy policy = PackagingPolicy::NonMerged;
    int threads = 0;                                    // 0 = ideal thread count
    std::string logVerbosity = "info";                  // debug, info, warning, error
    bool scanWholeCollection = false;                   // Search every archive for donors
    std::filesystem::path reportFile;                   // JSON report, empty = none
    
    /**
     * Parse a JSON document, missing keys keep their defaults
     * @throws ConfigError on malformed JSON or invalid values
     */
    static AuditConfig fromJson(const std::string& json);
    std::string toJson() const;
    
    /**
     * Load from a file
     * 
     * A missing file yields the defaults.
     * @return nullopt if the file cannot be parsed
     */
    static std::optional<AuditConfig> load(const std::filesystem::path& path);
    
    bool save(const std::filesystem::path& path) const;
    
    static bool isValidVerbosity(const std::string& verbosity);
};

} // namespace romaudit
