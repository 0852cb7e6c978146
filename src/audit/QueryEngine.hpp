/**
 * ROM Audit - Query Engine
 * 
 * Aggregate questions answered from the catalog and checksum index.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ChecksumIndex.hpp"
#include "ResolutionEngine.hpp"

namespace romaudit {

/**
 * A machine whose full set can be built from an ancestor's
 */
struct DerivableSet {
    std::string machine;
    std::string ancestor;
    std::vector<std::string> newParts;  // Clone-specific parts not found in the ancestor
};

struct CatalogStats {
    size_t machines = 0;
    size_t distinctChecksums = 0;
    size_t noDumpParts = 0;
    size_t deviceMachines = 0;
    size_t parts = 0;
    size_t samples = 0;
    size_t deviceRefs = 0;
};

/**
 * Every declaration of the content of one part
 */
struct RomUsage {
    std::string machine;
    std::string name;
    Checksum checksum;
    std::string origin;                 // Machine owning the bytes under the policy
    std::vector<ContentLocation> usedBy;
};

class QueryEngine {
public:
    QueryEngine(const CatalogStore& store, const ResolutionEngine& resolver);
    
    /**
     * Checksums declared by at least two machines, with the sorted machine list
     */
    std::map<Checksum, std::vector<std::string>> sharedContent() const;
    
    /**
     * (machine, ancestor) pairs where the machine's non-merged set is the
     * ancestor's content plus clone-specific new parts only
     */
    std::vector<DerivableSet> derivableSets() const;
    
    CatalogStats stats() const;
    
    /**
     * Where else the content of one part is declared
     * @return nullopt if the machine does not resolve, the part is unknown or a no-dump
     */
    std::optional<RomUsage> romUsage(
        const std::string& machineId,
        const std::string& partName,
        PackagingPolicy policy
    ) const;
    
    /**
     * For each other machine, the parts of this machine it also declares
     * @return nullopt if the machine does not resolve
     */
    std::optional<std::map<std::string, std::vector<std::string>>> setUsage(
        const std::string& machineId,
        PackagingPolicy policy
    ) const;
    
private:
    const CatalogStore& m_store;
    const ResolutionEngine& m_resolver;
};

nlohmann::json toJson(const CatalogStats& stats);

} // namespace romaudit
