/**
 * ROM Audit - Resolution Engine Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ResolutionEngine.hpp"

#include <algorithm>
#include <deque>
#include <set>

#include <spdlog/spdlog.h>

namespace romaudit {

namespace {
    const char* relationName(bool sample, bool rom) {
        if (sample) return "sampleof";
        return rom ? "romof" : "cloneof";
    }
    
    void appendUnique(std::vector<CatalogIssue>& target, const std::vector<CatalogIssue>& issues) {
        for (const auto& issue : issues) {
            bool known = std::any_of(target.begin(), target.end(), [&issue](const CatalogIssue& existing) {
                return existing.machine == issue.machine &&
                       existing.part == issue.part &&
                       existing.message == issue.message;
            });
            if (!known) {
                target.push_back(issue);
            }
        }
    }
    
    std::string joinChain(const std::string& start, const std::vector<std::string>& chain,
                          const std::string& repeated) {
        std::string result = start;
        for (const auto& id : chain) {
            result += " -> " + id;
        }
        return result + " -> " + repeated;
    }
}

ResolutionEngine::ResolutionEngine(const CatalogStore& store, std::shared_ptr<const ChecksumIndex> index)
    : m_store(store)
    , m_index(std::move(index))
{
    for (const auto& id : m_store.listMachines()) {
        auto machine = m_store.getMachine(id);
        if (machine && !machine->cloneOf.empty() && machine->cloneOf != id) {
            m_clones[machine->cloneOf].push_back(id);
        }
    }
}

std::optional<std::string> ResolutionEngine::nextInChain(const std::string& machineId, ChainKind kind) const {
    switch (kind) {
        case ChainKind::Rom: {
            auto romOf = m_store.resolveParent(machineId, ParentRelation::RomOf);
            if (romOf) {
                return romOf;
            }
            return m_store.resolveParent(machineId, ParentRelation::CloneOf);
        }
        case ChainKind::Clone:
            return m_store.resolveParent(machineId, ParentRelation::CloneOf);
        case ChainKind::Sample:
            return m_store.resolveSampleParent(machineId);
    }
    return std::nullopt;
}

ResolutionEngine::ChainWalk ResolutionEngine::walkChain(const std::string& machineId, ChainKind kind) const {
    ChainWalk walk;
    const bool sample = kind == ChainKind::Sample;
    const char* relation = relationName(sample, kind == ChainKind::Rom);
    
    std::set<std::string> visited{machineId};
    std::string current = machineId;
    const size_t bound = m_store.machineCount() + 1;
    
    while (true) {
        auto parent = nextInChain(current, kind);
        if (!parent) {
            break;
        }
        
        if (*parent == current) {
            // sampleof=self marks the owner of a sample set
            if (sample) {
                break;
            }
            walk.cyclic = true;
            walk.issues.push_back({IssueKind::CatalogIntegrity, true, machineId, "",
                                   "'" + current + "' references itself as " + relation});
            break;
        }
        
        if (visited.count(*parent) > 0 || walk.chain.size() >= bound) {
            walk.issues.push_back({IssueKind::CatalogIntegrity, !sample, machineId, "",
                                   std::string("cyclic ") + relation + " chain: " +
                                   joinChain(machineId, walk.chain, *parent)});
            walk.cyclic = !sample;
            break;
        }
        
        if (!m_store.contains(*parent)) {
            if (sample) {
                // Sample sets are often packaged under a name no machine carries
                walk.chain.push_back(*parent);
            } else {
                walk.issues.push_back({IssueKind::CatalogIntegrity, false, machineId, "",
                                       "'" + current + "' references unknown " + relation +
                                       " '" + *parent + "'"});
            }
            break;
        }
        
        visited.insert(*parent);
        walk.chain.push_back(*parent);
        current = *parent;
    }
    
    return walk;
}

std::optional<std::vector<std::string>> ResolutionEngine::ancestorsOf(const std::string& machineId) const {
    auto walk = walkChain(machineId, ChainKind::Rom);
    if (walk.cyclic) {
        return std::nullopt;
    }
    return walk.chain;
}

std::string ResolutionEngine::cloneRoot(const std::string& machineId) const {
    auto walk = walkChain(machineId, ChainKind::Clone);
    if (walk.cyclic || walk.chain.empty()) {
        return machineId;
    }
    return walk.chain.back();
}

std::vector<std::string> ResolutionEngine::clonesOf(const std::string& machineId) const {
    auto it = m_clones.find(machineId);
    if (it != m_clones.end()) {
        return it->second;
    }
    return {};
}

ResolutionEngine::MergeOwner ResolutionEngine::findMergeOwner(
    const std::string& machineId,
    const ContentPart& part,
    const std::vector<std::string>& ancestors,
    std::vector<CatalogIssue>& issues
) const {
    std::string wanted = part.merge;
    
    for (const auto& ancestor : ancestors) {
        const auto parts = m_store.getPartsOf(ancestor);
        auto it = std::find_if(parts.begin(), parts.end(), [&wanted](const ContentPart& candidate) {
            return candidate.name == wanted;
        });
        if (it == parts.end()) {
            continue;
        }
        
        if (part.checksum && (!it->checksum || !part.checksum->matches(*it->checksum))) {
            issues.push_back({IssueKind::CatalogIntegrity, false, machineId, part.name,
                              "merge target '" + wanted + "' in '" + ancestor +
                              "' has different content"});
            return {machineId, part.name, false};
        }
        
        // The ancestor merges it again from further up
        if (it->isMerged()) {
            wanted = it->merge;
            continue;
        }
        
        return {ancestor, it->name, true};
    }
    
    // The merge name may be misspelled while the content is declared upstream
    if (part.checksum) {
        const auto locations = m_index->lookup(*part.checksum);
        for (const auto& ancestor : ancestors) {
            for (const auto& location : locations) {
                if (location.machine != ancestor) {
                    continue;
                }
                const auto parts = m_store.getPartsOf(ancestor);
                auto it = std::find_if(parts.begin(), parts.end(), [&location](const ContentPart& candidate) {
                    return candidate.name == location.name && !candidate.isMerged();
                });
                if (it != parts.end()) {
                    issues.push_back({IssueKind::CatalogIntegrity, false, machineId, part.name,
                                      "merge target '" + part.merge + "' not found by name, using '" +
                                      location.name + "' of '" + ancestor + "'"});
                    return {ancestor, location.name, true};
                }
            }
        }
    }
    
    issues.push_back({IssueKind::CatalogIntegrity, false, machineId, part.name,
                      "merge target '" + part.merge + "' not found in the ancestors of '" +
                      machineId + "'"});
    return {machineId, part.name, false};
}

ResolutionResult ResolutionEngine::effectiveSet(const std::string& machineId, PackagingPolicy policy) const {
    return resolveMachine(machineId, policy, true);
}

ResolutionResult ResolutionEngine::resolve(const std::string& machineId, PackagingPolicy policy) const {
    auto result = effectiveSet(machineId, policy);
    
    for (const auto& issue : result.issues) {
        spdlog::warn("{}: {}{}", issue.machine,
                     issue.part.empty() ? "" : issue.part + ": ", issue.message);
    }
    
    return result;
}

ResolutionResult ResolutionEngine::resolveMachine(
    const std::string& machineId,
    PackagingPolicy policy,
    bool includeFamily
) const {
    ResolutionResult result;
    
    if (!m_store.contains(machineId)) {
        result.error = ResolutionError::UnknownMachine;
        result.errorMessage = "Machine '" + machineId + "' is not in the catalog";
        return result;
    }
    
    std::vector<CatalogIssue> issues = m_store.getIssuesOf(machineId);
    const auto romWalk = walkChain(machineId, ChainKind::Rom);
    const auto cloneWalk = walkChain(machineId, ChainKind::Clone);
    const auto sampleWalk = walkChain(machineId, ChainKind::Sample);
    appendUnique(issues, romWalk.issues);
    appendUnique(issues, cloneWalk.issues);
    appendUnique(issues, sampleWalk.issues);
    
    bool fatal = romWalk.cyclic || cloneWalk.cyclic;
    
    // Logical names are unique within a machine
    std::vector<ContentPart> parts;
    std::map<std::string, size_t> partsByName;
    for (auto& part : m_store.getPartsOf(machineId)) {
        auto it = partsByName.find(part.name);
        if (it != partsByName.end()) {
            if (parts[it->second].checksum == part.checksum) {
                spdlog::debug("{}: collapsing repeated declaration of {}", machineId, part.name);
            } else {
                issues.push_back({IssueKind::CatalogIntegrity, true, machineId, part.name,
                                  "duplicate logical name '" + part.name + "' with different content"});
                fatal = true;
            }
            continue;
        }
        partsByName[part.name] = parts.size();
        parts.push_back(std::move(part));
    }
    
    if (fatal) {
        result.error = ResolutionError::CatalogIntegrity;
        auto firstFatal = std::find_if(issues.begin(), issues.end(), [](const CatalogIssue& issue) {
            return issue.fatal;
        });
        result.errorMessage = firstFatal->message;
        result.issues = std::move(issues);
        return result;
    }
    
    // Content supplied by referenced devices lives in the devices' archives
    std::vector<ContentPart> deviceParts;
    for (const auto& deviceId : m_store.getDeviceRefsOf(machineId)) {
        if (deviceId == machineId) {
            continue;
        }
        auto partsOfDevice = m_store.getPartsOf(deviceId);
        deviceParts.insert(deviceParts.end(), partsOfDevice.begin(), partsOfDevice.end());
    }
    auto providedByDevice = [&deviceParts](const ContentPart& part) {
        if (part.isMerged()) {
            return false;
        }
        return std::any_of(deviceParts.begin(), deviceParts.end(), [&part](const ContentPart& device) {
            return device.name == part.name && device.checksum == part.checksum;
        });
    };
    
    const std::string familyRoot = cloneRoot(machineId);
    
    EffectiveSet set;
    set.machine = machineId;
    set.policy = policy;
    
    for (const auto& part : parts) {
        if (providedByDevice(part)) {
            spdlog::debug("{}: {} is supplied by a device", machineId, part.name);
            continue;
        }
        
        EffectivePart effective;
        effective.type = part.type;
        effective.name = part.name;
        effective.checksum = part.checksum;
        effective.size = part.size;
        effective.required = !part.isOptional;
        effective.merged = part.isMerged();
        effective.origin = machineId;
        effective.archive = machineId;
        effective.archiveEntryName = part.name;
        
        MergeOwner owner{machineId, part.name, true};
        if (part.isMerged()) {
            owner = findMergeOwner(machineId, part, romWalk.chain, issues);
            effective.unresolved = !owner.resolved;
            effective.origin = owner.machine;
        }
        const bool inherited = owner.resolved && owner.machine != machineId;
        
        switch (policy) {
            case PackagingPolicy::NonMerged:
                break;
            case PackagingPolicy::Split:
                if (inherited) {
                    effective.archive = owner.machine;
                    effective.archiveEntryName = owner.partName;
                }
                break;
            case PackagingPolicy::Merged:
                if (inherited) {
                    // Content owned outside the clone family (a BIOS) stays with its owner
                    effective.archive = cloneRoot(owner.machine) == familyRoot ? familyRoot : owner.machine;
                    effective.archiveEntryName = owner.partName;
                } else {
                    effective.archive = familyRoot;
                }
                break;
        }
        
        set.parts.push_back(std::move(effective));
    }
    
    for (const auto& sample : m_store.getSamplesOf(machineId)) {
        EffectiveSample effective;
        effective.name = sample.name;
        effective.origin = machineId;
        effective.archive = machineId;
        
        if (policy != PackagingPolicy::NonMerged) {
            // Furthest sample parent that provides it
            for (const auto& ancestor : sampleWalk.chain) {
                if (!m_store.contains(ancestor)) {
                    effective.origin = ancestor;
                    effective.archive = ancestor;
                    break;
                }
                const auto samples = m_store.getSamplesOf(ancestor);
                bool declared = std::any_of(samples.begin(), samples.end(), [&sample](const Sample& s) {
                    return s.name == sample.name;
                });
                if (declared) {
                    effective.origin = ancestor;
                    effective.archive = ancestor;
                }
            }
            if (policy == PackagingPolicy::Merged && effective.archive == machineId) {
                effective.archive = familyRoot;
            }
        }
        
        set.samples.push_back(std::move(effective));
    }
    
    if (includeFamily && policy == PackagingPolicy::Merged && familyRoot == machineId) {
        addFamilyParts(set);
    }
    
    set.issues = issues;
    result.issues = std::move(issues);
    result.set = std::move(set);
    return result;
}

void ResolutionEngine::addFamilyParts(EffectiveSet& set) const {
    std::deque<std::string> pending;
    std::set<std::string> visited{set.machine};
    for (const auto& clone : clonesOf(set.machine)) {
        pending.push_back(clone);
    }
    
    while (!pending.empty()) {
        const std::string clone = pending.front();
        pending.pop_front();
        if (!visited.insert(clone).second) {
            continue;
        }
        for (const auto& next : clonesOf(clone)) {
            pending.push_back(next);
        }
        
        auto cloneResult = resolveMachine(clone, PackagingPolicy::Merged, false);
        if (!cloneResult.isSuccess()) {
            spdlog::debug("{}: skipping clone {} ({})", set.machine, clone, cloneResult.errorMessage);
            continue;
        }
        
        for (auto& part : cloneResult.set->parts) {
            // Only content the clone itself owns is added to the family archive
            if (part.archive != set.machine || part.origin != clone) {
                continue;
            }
            
            auto clash = std::find_if(set.parts.begin(), set.parts.end(), [&part](const EffectivePart& existing) {
                return existing.archive == part.archive &&
                       existing.archiveEntryName == part.archiveEntryName;
            });
            if (clash != set.parts.end()) {
                if (clash->checksum != part.checksum) {
                    spdlog::debug("{}: {} of clone {} collides with an entry of the same name",
                                  set.machine, part.name, clone);
                }
                continue;
            }
            
            part.required = false;
            set.parts.push_back(std::move(part));
        }
    }
}

} // namespace romaudit
