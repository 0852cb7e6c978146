/**
 * ROM Audit - Verification Engine Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "VerificationEngine.hpp"

#include <algorithm>
#include <map>
#include <set>
#include <utility>

#include <spdlog/spdlog.h>

namespace romaudit {

namespace {
    bool sameContent(const std::optional<Checksum>& actual, const Checksum& expected) {
        return actual && actual->matches(expected);
    }
    
    bool isSampleEntry(const std::string& entryName, const std::string& sampleName) {
        return entryName == sampleName || entryName == sampleName + ".wav";
    }
}

VerificationEngine::VerificationEngine(const ResolutionEngine& resolver, ContentHasher& hasher)
    : m_resolver(resolver)
    , m_hasher(hasher)
{
}

std::vector<UnneededFile> VerificationEngine::leftovers(
    const std::string& machineId,
    const std::vector<LocalFile>& files
) const {
    std::vector<UnneededFile> result;
    
    for (const auto& file : files) {
        if (file.consumed) {
            continue;
        }
        
        UnneededFile unneeded;
        unneeded.name = file.entry.name;
        unneeded.checksum = file.entry.checksum;
        unneeded.error = file.entry.error;
        
        if (file.entry.checksum) {
            for (const auto& location : m_resolver.index().lookup(*file.entry.checksum)) {
                if (location.machine != machineId) {
                    unneeded.neededBy.push_back(location);
                }
            }
            unneeded.misplaced = !unneeded.neededBy.empty();
        }
        
        result.push_back(std::move(unneeded));
    }
    
    return result;
}

VerificationReport VerificationEngine::verify(
    const std::string& machineId,
    const std::vector<ArchiveEntry>& suppliedFiles,
    PackagingPolicy policy,
    const CollectionContentView* collection
) const {
    VerificationReport report;
    report.machine = machineId;
    report.policy = policy;
    
    std::vector<LocalFile> files;
    std::vector<CatalogIssue> ioIssues;
    for (auto& hashed : m_hasher.hashAll(suppliedFiles)) {
        if (!hashed.isReadable()) {
            ioIssues.push_back({IssueKind::Io, false, machineId, hashed.name,
                                "unreadable: " + hashed.error});
        }
        files.push_back({std::move(hashed), false});
    }
    
    auto resolution = m_resolver.resolve(machineId, policy);
    report.issues = resolution.issues;
    report.issues.insert(report.issues.end(), ioIssues.begin(), ioIssues.end());
    
    if (!resolution.isSuccess()) {
        report.status = resolution.error == ResolutionError::UnknownMachine
            ? MachineStatus::NotInCatalog
            : MachineStatus::CatalogError;
        report.unneeded = leftovers(machineId, files);
        spdlog::debug("{}: {} ({})", machineId, machineStatusName(report.status), resolution.errorMessage);
        return report;
    }
    
    const EffectiveSet& set = *resolution.set;
    
    std::map<std::string, std::vector<HashedEntry>> remoteArchives;
    auto remoteContents = [&](const std::string& archive) -> const std::vector<HashedEntry>& {
        auto it = remoteArchives.find(archive);
        if (it == remoteArchives.end()) {
            std::vector<HashedEntry> contents;
            if (collection) {
                contents = collection->archiveContents(archive);
            }
            it = remoteArchives.emplace(archive, std::move(contents)).first;
        }
        return it->second;
    };
    auto isLocal = [&machineId](const EffectivePart& part) {
        return part.archive == machineId;
    };
    
    // Entries of other archives already matched to a part, as (archive, entry)
    std::set<std::pair<std::string, std::string>> claimedRemote;
    auto isClaimed = [&claimedRemote](const std::string& archive, const std::string& entry) {
        return claimedRemote.count({archive, entry}) > 0;
    };
    
    std::vector<PartVerdict>& verdicts = report.parts;
    std::vector<bool> settled(set.parts.size(), false);
    for (const auto& part : set.parts) {
        PartVerdict verdict;
        verdict.name = part.name;
        verdict.type = part.type;
        verdict.expected = part.checksum;
        verdict.required = part.required;
        verdict.origin = part.origin;
        verdict.archive = part.archive;
        verdict.expectedEntry = part.archiveEntryName;
        verdicts.push_back(std::move(verdict));
    }
    
    // No-dumps are informational, a file carrying the name is still claimed
    for (size_t i = 0; i < set.parts.size(); ++i) {
        const auto& part = set.parts[i];
        if (!part.isNoDump()) {
            continue;
        }
        verdicts[i].status = PartStatus::Unknown;
        settled[i] = true;
        
        if (isLocal(part)) {
            for (auto& file : files) {
                if (!file.consumed && file.entry.name == part.archiveEntryName) {
                    file.consumed = true;
                    verdicts[i].matchedEntry = file.entry.name;
                    break;
                }
            }
        } else {
            for (const auto& entry : remoteContents(part.archive)) {
                if (entry.name == part.archiveEntryName) {
                    verdicts[i].matchedEntry = entry.name;
                    break;
                }
            }
        }
    }
    
    // Exact name and content
    for (size_t i = 0; i < set.parts.size(); ++i) {
        if (settled[i]) {
            continue;
        }
        const auto& part = set.parts[i];
        const Checksum& expected = *part.checksum;
        
        if (isLocal(part)) {
            for (auto& file : files) {
                if (!file.consumed && file.entry.name == part.archiveEntryName &&
                    sameContent(file.entry.checksum, expected)) {
                    file.consumed = true;
                    verdicts[i].status = PartStatus::Ok;
                    verdicts[i].matchedEntry = file.entry.name;
                    settled[i] = true;
                    break;
                }
            }
        } else {
            for (const auto& entry : remoteContents(part.archive)) {
                if (entry.name == part.archiveEntryName && sameContent(entry.checksum, expected) &&
                    !isClaimed(part.archive, entry.name)) {
                    claimedRemote.insert({part.archive, entry.name});
                    verdicts[i].status = PartStatus::Ok;
                    verdicts[i].matchedEntry = entry.name;
                    settled[i] = true;
                    break;
                }
            }
        }
    }
    
    // Right content under another name in the expected archive
    for (size_t i = 0; i < set.parts.size(); ++i) {
        if (settled[i]) {
            continue;
        }
        const auto& part = set.parts[i];
        const Checksum& expected = *part.checksum;
        
        if (isLocal(part)) {
            for (auto& file : files) {
                if (!file.consumed && sameContent(file.entry.checksum, expected)) {
                    file.consumed = true;
                    verdicts[i].status = PartStatus::Misnamed;
                    verdicts[i].matchedEntry = file.entry.name;
                    verdicts[i].fix = FixSuggestion{FixAction::Rename, machineId, file.entry.name,
                                                    machineId, part.archiveEntryName};
                    settled[i] = true;
                    break;
                }
            }
        } else {
            for (const auto& entry : remoteContents(part.archive)) {
                if (sameContent(entry.checksum, expected) && !isClaimed(part.archive, entry.name)) {
                    claimedRemote.insert({part.archive, entry.name});
                    verdicts[i].status = PartStatus::Misnamed;
                    verdicts[i].matchedEntry = entry.name;
                    verdicts[i].fix = FixSuggestion{FixAction::Rename, part.archive, entry.name,
                                                    part.archive, part.archiveEntryName};
                    settled[i] = true;
                    break;
                }
            }
        }
    }
    
    // A file with the expected name that cannot be read keeps its part missing
    for (size_t i = 0; i < set.parts.size(); ++i) {
        if (settled[i] || !isLocal(set.parts[i])) {
            continue;
        }
        for (auto& file : files) {
            if (!file.consumed && file.entry.name == set.parts[i].archiveEntryName &&
                !file.entry.isReadable()) {
                file.consumed = true;
                verdicts[i].status = PartStatus::Missing;
                verdicts[i].cause = "unreadable: " + file.entry.error;
                settled[i] = true;
                break;
            }
        }
    }
    
    // One physical file cannot satisfy two logical parts of the same archive
    for (size_t i = 0; i < set.parts.size(); ++i) {
        if (settled[i]) {
            continue;
        }
        const std::string& archive = set.parts[i].archive;
        const Checksum& expected = *set.parts[i].checksum;
        
        for (size_t j = 0; j < set.parts.size(); ++j) {
            const bool claimed = verdicts[j].status == PartStatus::Ok ||
                                 verdicts[j].status == PartStatus::Misnamed;
            if (j == i || !claimed || set.parts[j].archive != archive ||
                !sameContent(set.parts[j].checksum, expected)) {
                continue;
            }
            verdicts[i].status = PartStatus::DuplicateContentUnresolved;
            verdicts[i].matchedEntry = verdicts[j].matchedEntry;
            verdicts[i].fix = FixSuggestion{FixAction::Copy, archive, verdicts[j].expectedEntry,
                                            archive, verdicts[i].expectedEntry};
            verdicts[i].cause = "content also required as '" + verdicts[j].name + "'";
            settled[i] = true;
            break;
        }
    }
    
    // Somewhere else in the collection
    for (size_t i = 0; i < set.parts.size(); ++i) {
        if (settled[i]) {
            continue;
        }
        const auto& part = set.parts[i];
        const Checksum& expected = *part.checksum;
        
        std::optional<ContentMatch> donor;
        if (!isLocal(part)) {
            for (const auto& file : files) {
                if (sameContent(file.entry.checksum, expected)) {
                    donor = ContentMatch{machineId, file.entry.name};
                    break;
                }
            }
        }
        if (!donor && collection) {
            for (const auto& match : collection->locate(expected)) {
                if (match.archive != part.archive) {
                    donor = match;
                    break;
                }
            }
        }
        
        if (donor) {
            verdicts[i].status = PartStatus::FixableFromElsewhere;
            verdicts[i].matchedEntry = donor->archive + "/" + donor->entry;
            verdicts[i].fix = FixSuggestion{FixAction::Copy, donor->archive, donor->entry,
                                            part.archive, part.archiveEntryName};
            continue;
        }
        
        verdicts[i].status = PartStatus::Missing;
        if (part.unresolved) {
            verdicts[i].cause = "merge target unresolved";
        }
    }
    
    for (const auto& sample : set.samples) {
        SampleVerdict verdict;
        verdict.name = sample.name;
        verdict.archive = sample.archive;
        
        if (sample.archive == machineId) {
            for (auto& file : files) {
                if (!file.consumed && isSampleEntry(file.entry.name, sample.name)) {
                    file.consumed = true;
                    verdict.present = true;
                    verdict.matchedEntry = file.entry.name;
                    break;
                }
            }
        } else {
            for (const auto& entry : remoteContents(sample.archive)) {
                if (isSampleEntry(entry.name, sample.name)) {
                    verdict.present = true;
                    verdict.matchedEntry = entry.name;
                    break;
                }
            }
        }
        
        report.samples.push_back(std::move(verdict));
    }
    
    report.unneeded = leftovers(machineId, files);
    
    bool complete = true;
    bool fixable = true;
    for (const auto& verdict : verdicts) {
        if (!verdict.required || !verdict.expected) {
            continue;
        }
        if (verdict.status != PartStatus::Ok) {
            complete = false;
        }
        if (verdict.status != PartStatus::Ok &&
            verdict.status != PartStatus::Misnamed &&
            verdict.status != PartStatus::FixableFromElsewhere) {
            fixable = false;
        }
    }
    
    if (complete) {
        report.status = MachineStatus::Complete;
    } else if (fixable) {
        report.status = MachineStatus::Fixable;
    } else {
        report.status = MachineStatus::Incomplete;
    }
    
    spdlog::debug("{}: {} ({} parts, {} unneeded)", machineId, machineStatusName(report.status),
                  report.parts.size(), report.unneeded.size());
    return report;
}

} // namespace romaudit
