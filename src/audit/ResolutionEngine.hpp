/**
 * ROM Audit - Resolution Engine
 * 
 * Computes the effective content set of a machine by following its
 * clone/merge inheritance chains under a packaging policy.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ChecksumIndex.hpp"
#include "PackagingPolicy.hpp"
#include "catalog/CatalogIssue.hpp"
#include "catalog/CatalogStore.hpp"

namespace romaudit {

/**
 * A part required by a machine, with its expected physical location
 */
struct EffectivePart {
    PartType type = PartType::Rom;
    std::string name;                   // Logical name in the resolved machine
    std::optional<Checksum> checksum;   // nullopt = no-dump
    uint64_t size = 0;
    bool required = true;
    bool merged = false;                // Declared with a merge tag
    bool unresolved = false;            // Merge target could not be found
    
    std::string origin;                 // Machine owning the bytes
    std::string archive;                // Archive expected to hold them
    std::string archiveEntryName;       // Entry name expected in that archive
    
    bool isNoDump() const { return !checksum.has_value(); }
};

/**
 * A sample required by a machine
 */
struct EffectiveSample {
    std::string name;
    std::string origin;     // Machine whose sample set supplies it
    std::string archive;
    bool required = true;
};

/**
 * Fully resolved content requirement of one machine
 */
struct EffectiveSet {
    std::string machine;
    PackagingPolicy policy = PackagingPolicy::NonMerged;
    std::vector<EffectivePart> parts;
    std::vector<EffectiveSample> samples;
    std::vector<CatalogIssue> issues;   // Non-fatal issues only
};

enum class ResolutionError {
    None,
    UnknownMachine,
    CatalogIntegrity
};

/**
 * Resolution result
 */
struct ResolutionResult {
    ResolutionError error = ResolutionError::None;
    std::string errorMessage;
    std::vector<CatalogIssue> issues;
    std::optional<EffectiveSet> set;
    
    bool isSuccess() const { return error == ResolutionError::None && set.has_value(); }
};

/**
 * Resolution engine
 * 
 * Stateless apart from lookup tables built at construction; resolve() may
 * be called concurrently.
 */
class ResolutionEngine {
public:
    ResolutionEngine(const CatalogStore& store, std::shared_ptr<const ChecksumIndex> index);
    
    /**
     * Resolve the effective content set of a machine, logging its catalog issues
     */
    ResolutionResult resolve(const std::string& machineId, PackagingPolicy policy) const;
    
    /**
     * Same as resolve() without logging, for callers that resolve in bulk
     */
    ResolutionResult effectiveSet(const std::string& machineId, PackagingPolicy policy) const;
    
    /**
     * Rom inheritance ancestors, nearest first
     * 
     * Follows romof, falling back to cloneof where romof is absent.
     * Stops at the first machine missing from the store.
     * 
     * @return nullopt if the chain is cyclic
     */
    std::optional<std::vector<std::string>> ancestorsOf(const std::string& machineId) const;
    
    /**
     * Top of the cloneof chain (the machine itself for parents)
     */
    std::string cloneRoot(const std::string& machineId) const;
    
    /**
     * Direct clones of a machine, in catalog order
     */
    std::vector<std::string> clonesOf(const std::string& machineId) const;
    
    const CatalogStore& store() const { return m_store; }
    const ChecksumIndex& index() const { return *m_index; }
    
private:
    struct ChainWalk {
        std::vector<std::string> chain;
        std::vector<CatalogIssue> issues;
        bool cyclic = false;
    };
    
    struct MergeOwner {
        std::string machine;
        std::string partName;
        bool resolved = true;
    };
    
    enum class ChainKind { Rom, Clone, Sample };
    
    ChainWalk walkChain(const std::string& machineId, ChainKind kind) const;
    std::optional<std::string> nextInChain(const std::string& machineId, ChainKind kind) const;
    
    MergeOwner findMergeOwner(
        const std::string& machineId,
        const ContentPart& part,
        const std::vector<std::string>& ancestors,
        std::vector<CatalogIssue>& issues
    ) const;
    
    ResolutionResult resolveMachine(
        const std::string& machineId,
        PackagingPolicy policy,
        bool includeFamily
    ) const;
    
    void addFamilyParts(EffectiveSet& set) const;
    
    const CatalogStore& m_store;
    std::shared_ptr<const ChecksumIndex> m_index;
    std::map<std::string, std::vector<std::string>> m_clones;
};

} // namespace romaudit
