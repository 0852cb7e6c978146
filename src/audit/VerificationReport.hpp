/**
 * ROM Audit - Verification Report
 * 
 * Per-machine diagnostic produced by the verification engine.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ChecksumIndex.hpp"
#include "PackagingPolicy.hpp"
#include "ResolutionEngine.hpp"

namespace romaudit {

enum class PartStatus {
    Ok,
    Misnamed,
    FixableFromElsewhere,
    Missing,
    Unknown,                    // No-dump, content unverifiable
    DuplicateContentUnresolved  // Content present once but required twice
};

enum class MachineStatus {
    Complete,
    Fixable,
    Incomplete,
    CatalogError,
    NotInCatalog
};

enum class FixAction {
    Rename,     // Rename an entry inside its archive
    Copy        // Copy bytes from another entry
};

/**
 * Suggested repair, never executed
 */
struct FixSuggestion {
    FixAction action = FixAction::Rename;
    std::string sourceArchive;
    std::string sourceEntry;
    std::string targetArchive;
    std::string targetEntry;
};

struct PartVerdict {
    std::string name;
    PartType type = PartType::Rom;
    std::optional<Checksum> expected;
    bool required = true;
    std::string origin;
    std::string archive;            // Where the part was expected
    std::string expectedEntry;
    
    PartStatus status = PartStatus::Missing;
    std::string matchedEntry;       // Entry that satisfied or resembles the part
    std::optional<FixSuggestion> fix;
    std::string cause;              // Why a part is missing, if known
};

struct SampleVerdict {
    std::string name;
    std::string archive;
    bool present = false;
    std::string matchedEntry;
};

/**
 * Supplied file that no expected part claimed
 */
struct UnneededFile {
    std::string name;
    std::optional<Checksum> checksum;   // nullopt if unreadable
    std::string error;
    bool misplaced = false;             // Content is required by another machine
    std::vector<ContentLocation> neededBy;
};

struct VerificationReport {
    std::string machine;
    PackagingPolicy policy = PackagingPolicy::NonMerged;
    MachineStatus status = MachineStatus::Incomplete;
    
    std::vector<PartVerdict> parts;
    std::vector<SampleVerdict> samples;
    std::vector<UnneededFile> unneeded;
    std::vector<CatalogIssue> issues;
    
    size_t countParts(PartStatus status) const;
    bool isComplete() const { return status == MachineStatus::Complete; }
};

std::string partStatusName(PartStatus status);
std::string machineStatusName(MachineStatus status);
std::string fixActionName(FixAction action);

nlohmann::json toJson(const FixSuggestion& fix);
nlohmann::json toJson(const VerificationReport& report);

} // namespace romaudit
