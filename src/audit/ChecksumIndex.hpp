/**
 * ROM Audit - Checksum Index
 * 
 * Catalog-wide map from content checksum to every part declaring it.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include "catalog/CatalogStore.hpp"
#include "catalog/Checksum.hpp"

namespace romaudit {

/**
 * A (machine, logical name) pair declaring some content
 */
struct ContentLocation {
    std::string machine;
    std::string name;
    
    bool operator==(const ContentLocation& other) const {
        return machine == other.machine && name == other.name;
    }
    bool operator<(const ContentLocation& other) const {
        return machine != other.machine ? machine < other.machine : name < other.name;
    }
};

/**
 * Immutable checksum index
 * 
 * Built once from a catalog and shared read-only between threads.
 * No-dump parts are not indexed. Content declared several times, in one
 * machine or across machines, keeps every declaration.
 */
class ChecksumIndex {
public:
    static std::shared_ptr<const ChecksumIndex> build(const CatalogStore& store);
    
    /**
     * Every declaration whose checksum matches the given one
     * 
     * Partial checksums match on the values both sides know, so a
     * CRC-only declaration is found by a full checksum and vice versa.
     * 
     * @return Sorted, duplicate-free locations
     */
    std::vector<ContentLocation> lookup(const Checksum& checksum) const;
    
    bool contains(const Checksum& checksum) const;
    
    const std::map<Checksum, std::vector<ContentLocation>>& contents() const { return m_contents; }
    
    /**
     * Declarations grouped by content
     * 
     * A partial checksum joins the full checksum it matches when exactly one
     * full checksum does; otherwise it stays a group of its own.
     */
    const std::map<Checksum, std::vector<ContentLocation>>& distinctContents() const { return m_distinct; }
    
    size_t distinctCount() const { return m_distinct.size(); }
    size_t declarationCount() const { return m_declarations; }
    
private:
    ChecksumIndex() = default;
    
    std::vector<const Checksum*> candidates(const Checksum& checksum) const;
    
    std::map<Checksum, std::vector<ContentLocation>> m_contents;
    std::map<Checksum, std::vector<ContentLocation>> m_distinct;
    std::unordered_map<std::string, std::vector<const Checksum*>> m_bySha1;
    std::unordered_map<uint32_t, std::vector<const Checksum*>> m_byCrc;
    size_t m_declarations = 0;
};

} // namespace romaudit
