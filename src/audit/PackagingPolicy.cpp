/**
 * ROM Audit - Packaging Policy Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "PackagingPolicy.hpp"

#include <algorithm>
#include <cctype>

namespace romaudit {

std::optional<PackagingPolicy> packagingPolicyFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    
    if (lower == "split") return PackagingPolicy::Split;
    if (lower == "merged") return PackagingPolicy::Merged;
    if (lower == "non-merged" || lower == "nonmerged") return PackagingPolicy::NonMerged;
    return std::nullopt;
}

PackagingPolicy parsePackagingPolicy(const std::string& name) {
    auto policy = packagingPolicyFromString(name);
    if (!policy) {
        throw ConfigError("Unknown packaging policy '" + name +
                          "' (expected split, merged or non-merged)");
    }
    return *policy;
}

std::string policyName(PackagingPolicy policy) {
    switch (policy) {
        case PackagingPolicy::Split: return "split";
        case PackagingPolicy::Merged: return "merged";
        case PackagingPolicy::NonMerged: return "non-merged";
    }
    return "non-merged";
}

} // namespace romaudit
