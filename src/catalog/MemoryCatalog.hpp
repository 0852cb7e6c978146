/**
 * ROM Audit - In-memory Catalog
 * 
 * CatalogStore backed by hash maps, filled by the DAT importer.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "CatalogStore.hpp"

namespace romaudit {

/**
 * In-memory catalog store
 * 
 * Filled once through addMachine(), then shared read-only.
 */
class MemoryCatalog : public CatalogStore {
public:
    MemoryCatalog() = default;
    
    /**
     * Add a machine with its parts
     * @return false if a machine with the same name already exists
     *         (the first definition is kept)
     */
    bool addMachine(MachineRecord record);
    
    std::optional<Machine> getMachine(const std::string& id) const override;
    std::vector<std::string> listMachines() const override { return m_order; }
    size_t machineCount() const override { return m_order.size(); }
    
    std::vector<ContentPart> getPartsOf(const std::string& machineId) const override;
    std::vector<Sample> getSamplesOf(const std::string& machineId) const override;
    std::vector<std::string> getDeviceRefsOf(const std::string& machineId) const override;
    std::vector<CatalogIssue> getIssuesOf(const std::string& machineId) const override;
    
    std::optional<std::string> resolveParent(
        const std::string& machineId,
        ParentRelation relation
    ) const override;
    
    std::optional<std::string> resolveSampleParent(const std::string& machineId) const override;
    
private:
    const MachineRecord* find(const std::string& id) const;
    
    std::unordered_map<std::string, MachineRecord> m_machines;
    std::vector<std::string> m_order;
};

} // namespace romaudit
