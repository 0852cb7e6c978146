/**
 * ROM Audit - Catalog Store
 * 
 * Read-only data access interface over parsed catalog entities.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "CatalogIssue.hpp"
#include "Machine.hpp"

namespace romaudit {

/**
 * Inheritance relation between machines
 */
enum class ParentRelation {
    CloneOf,    // Descriptive/structural parent
    RomOf       // Parent supplying merged content
};

/**
 * Catalog store interface
 * 
 * Relations are id-based: resolveParent() returns the declared reference
 * even when the referenced machine is absent from the store, callers use
 * getMachine() to check existence.
 * 
 * Implementations must be safe for concurrent readers once built.
 */
class CatalogStore {
public:
    virtual ~CatalogStore() = default;
    
    virtual std::optional<Machine> getMachine(const std::string& id) const = 0;
    virtual std::vector<std::string> listMachines() const = 0;
    virtual size_t machineCount() const = 0;
    
    virtual std::vector<ContentPart> getPartsOf(const std::string& machineId) const = 0;
    virtual std::vector<Sample> getSamplesOf(const std::string& machineId) const = 0;
    virtual std::vector<std::string> getDeviceRefsOf(const std::string& machineId) const = 0;
    
    /**
     * Problems recorded for a machine when the catalog was loaded
     */
    virtual std::vector<CatalogIssue> getIssuesOf(const std::string& machineId) const {
        (void)machineId;
        return {};
    }
    
    virtual std::optional<std::string> resolveParent(
        const std::string& machineId,
        ParentRelation relation
    ) const = 0;
    
    virtual std::optional<std::string> resolveSampleParent(const std::string& machineId) const = 0;
    
    bool contains(const std::string& id) const { return getMachine(id).has_value(); }
};

} // namespace romaudit
