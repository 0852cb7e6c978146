/**
 * ROM Audit - Packaging Policy
 * 
 * Physical layout of inherited content in a collection.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace romaudit {

/**
 * Where inherited content must physically reside
 */
enum class PackagingPolicy {
    Split,      // Merged content only in the ancestor archive
    Merged,     // Whole clone family in the parent archive
    NonMerged   // Every part in the machine's own archive
};

/**
 * Invalid configuration value
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Parse "split", "merged" or "non-merged" (case-insensitive, "nonmerged" accepted)
 */
std::optional<PackagingPolicy> packagingPolicyFromString(const std::string& name);

/**
 * Like packagingPolicyFromString() but throws ConfigError on unknown names
 */
PackagingPolicy parsePackagingPolicy(const std::string& name);

std::string policyName(PackagingPolicy policy);

} // namespace romaudit
