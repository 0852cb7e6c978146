/**
 * ROM Audit - Query Engine Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "QueryEngine.hpp"

#include <algorithm>
#include <set>

#include <spdlog/spdlog.h>

namespace romaudit {

QueryEngine::QueryEngine(const CatalogStore& store, const ResolutionEngine& resolver)
    : m_store(store)
    , m_resolver(resolver)
{
}

std::map<Checksum, std::vector<std::string>> QueryEngine::sharedContent() const {
    std::map<Checksum, std::vector<std::string>> shared;
    
    for (const auto& [checksum, locations] : m_resolver.index().distinctContents()) {
        std::set<std::string> machines;
        for (const auto& location : locations) {
            machines.insert(location.machine);
        }
        if (machines.size() >= 2) {
            shared.emplace(checksum, std::vector<std::string>(machines.begin(), machines.end()));
        }
    }
    
    return shared;
}

std::vector<DerivableSet> QueryEngine::derivableSets() const {
    std::vector<DerivableSet> result;
    std::map<std::string, ResolutionResult> resolvedAncestors;
    
    for (const auto& machineId : m_store.listMachines()) {
        auto ancestors = m_resolver.ancestorsOf(machineId);
        if (!ancestors || ancestors->empty()) {
            continue;
        }
        
        auto resolved = m_resolver.effectiveSet(machineId, PackagingPolicy::NonMerged);
        if (!resolved.isSuccess()) {
            continue;
        }
        
        for (const auto& ancestorId : *ancestors) {
            auto cached = resolvedAncestors.find(ancestorId);
            if (cached == resolvedAncestors.end()) {
                cached = resolvedAncestors.emplace(
                    ancestorId, m_resolver.effectiveSet(ancestorId, PackagingPolicy::NonMerged)).first;
            }
            const ResolutionResult& ancestor = cached->second;
            if (!ancestor.isSuccess()) {
                continue;
            }
            
            DerivableSet derivable{machineId, ancestorId, {}};
            size_t sharedParts = 0;
            bool derivableFromAncestor = true;
            
            for (const auto& part : resolved.set->parts) {
                if (part.isNoDump()) {
                    continue;
                }
                bool inAncestor = std::any_of(
                    ancestor.set->parts.begin(), ancestor.set->parts.end(),
                    [&part](const EffectivePart& candidate) {
                        return candidate.checksum && candidate.checksum->matches(*part.checksum);
                    });
                
                if (inAncestor) {
                    ++sharedParts;
                } else if (part.merged) {
                    // Inherited content the ancestor cannot supply
                    derivableFromAncestor = false;
                    break;
                } else {
                    derivable.newParts.push_back(part.name);
                }
            }
            
            if (derivableFromAncestor && sharedParts > 0) {
                result.push_back(std::move(derivable));
            }
        }
    }
    
    std::sort(result.begin(), result.end(), [](const DerivableSet& a, const DerivableSet& b) {
        return a.machine != b.machine ? a.machine < b.machine : a.ancestor < b.ancestor;
    });
    return result;
}

CatalogStats QueryEngine::stats() const {
    CatalogStats stats;
    stats.machines = m_store.machineCount();
    stats.distinctChecksums = m_resolver.index().distinctCount();
    
    for (const auto& machineId : m_store.listMachines()) {
        auto machine = m_store.getMachine(machineId);
        if (machine && machine->isDevice) {
            ++stats.deviceMachines;
        }
        
        for (const auto& part : m_store.getPartsOf(machineId)) {
            ++stats.parts;
            if (part.isNoDump()) {
                ++stats.noDumpParts;
            }
        }
        stats.samples += m_store.getSamplesOf(machineId).size();
        stats.deviceRefs += m_store.getDeviceRefsOf(machineId).size();
    }
    
    return stats;
}

std::optional<RomUsage> QueryEngine::romUsage(
    const std::string& machineId,
    const std::string& partName,
    PackagingPolicy policy
) const {
    auto resolved = m_resolver.resolve(machineId, policy);
    if (!resolved.isSuccess()) {
        spdlog::warn("Cannot resolve {}: {}", machineId, resolved.errorMessage);
        return std::nullopt;
    }
    
    const auto& parts = resolved.set->parts;
    auto it = std::find_if(parts.begin(), parts.end(), [&partName](const EffectivePart& part) {
        return part.name == partName;
    });
    if (it == parts.end() || it->isNoDump()) {
        return std::nullopt;
    }
    
    RomUsage usage;
    usage.machine = machineId;
    usage.name = it->name;
    usage.checksum = *it->checksum;
    usage.origin = it->origin;
    
    const ContentLocation self{machineId, it->name};
    for (const auto& location : m_resolver.index().lookup(*it->checksum)) {
        if (!(location == self)) {
            usage.usedBy.push_back(location);
        }
    }
    
    return usage;
}

std::optional<std::map<std::string, std::vector<std::string>>> QueryEngine::setUsage(
    const std::string& machineId,
    PackagingPolicy policy
) const {
    auto resolved = m_resolver.resolve(machineId, policy);
    if (!resolved.isSuccess()) {
        spdlog::warn("Cannot resolve {}: {}", machineId, resolved.errorMessage);
        return std::nullopt;
    }
    
    std::map<std::string, std::vector<std::string>> usage;
    for (const auto& part : resolved.set->parts) {
        if (part.isNoDump()) {
            continue;
        }
        for (const auto& location : m_resolver.index().lookup(*part.checksum)) {
            if (location.machine == machineId) {
                continue;
            }
            auto& names = usage[location.machine];
            if (std::find(names.begin(), names.end(), part.name) == names.end()) {
                names.push_back(part.name);
            }
        }
    }
    
    for (auto& [machine, names] : usage) {
        std::sort(names.begin(), names.end());
    }
    return usage;
}

nlohmann::json toJson(const CatalogStats& stats) {
    nlohmann::json j;
    j["machines"] = stats.machines;
    j["distinctChecksums"] = stats.distinctChecksums;
    j["noDumpParts"] = stats.noDumpParts;
    j["deviceMachines"] = stats.deviceMachines;
    j["parts"] = stats.parts;
    j["samples"] = stats.samples;
    j["deviceRefs"] = stats.deviceRefs;
    return j;
}

} // namespace romaudit
