/**
 * ROM Audit - Checksum Index Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ChecksumIndex.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace romaudit {

std::shared_ptr<const ChecksumIndex> ChecksumIndex::build(const CatalogStore& store) {
    std::shared_ptr<ChecksumIndex> index(new ChecksumIndex());
    
    for (const auto& machineId : store.listMachines()) {
        for (const auto& part : store.getPartsOf(machineId)) {
            if (part.isNoDump() || part.checksum->isEmpty()) {
                continue;
            }
            index->m_contents[*part.checksum].push_back({machineId, part.name});
            ++index->m_declarations;
        }
    }
    
    // Keys of a std::map never move, so the secondary maps can point at them
    for (auto& [checksum, locations] : index->m_contents) {
        std::sort(locations.begin(), locations.end());
        if (checksum.hasSha1()) {
            index->m_bySha1[checksum.sha1].push_back(&checksum);
        }
        if (checksum.hasCrc()) {
            index->m_byCrc[*checksum.crc].push_back(&checksum);
        }
    }
    
    for (const auto& [checksum, locations] : index->m_contents) {
        const Checksum* group = &checksum;
        if (!checksum.hasCrc() || !checksum.hasSha1()) {
            const Checksum* full = nullptr;
            size_t fullMatches = 0;
            for (const Checksum* key : index->candidates(checksum)) {
                if (key->hasCrc() && key->hasSha1() && key->matches(checksum)) {
                    full = key;
                    ++fullMatches;
                }
            }
            if (fullMatches == 1) {
                group = full;
            }
        }
        
        auto& grouped = index->m_distinct[*group];
        grouped.insert(grouped.end(), locations.begin(), locations.end());
    }
    for (auto& [checksum, locations] : index->m_distinct) {
        std::sort(locations.begin(), locations.end());
        locations.erase(std::unique(locations.begin(), locations.end()), locations.end());
    }
    
    spdlog::info("Checksum index built: {} distinct checksums, {} declarations",
                 index->distinctCount(), index->declarationCount());
    return index;
}

std::vector<const Checksum*> ChecksumIndex::candidates(const Checksum& checksum) const {
    std::vector<const Checksum*> result;
    
    if (checksum.hasSha1()) {
        auto it = m_bySha1.find(checksum.sha1);
        if (it != m_bySha1.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }
    if (checksum.hasCrc()) {
        auto it = m_byCrc.find(*checksum.crc);
        if (it != m_byCrc.end()) {
            result.insert(result.end(), it->second.begin(), it->second.end());
        }
    }
    
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

std::vector<ContentLocation> ChecksumIndex::lookup(const Checksum& checksum) const {
    std::vector<ContentLocation> result;
    
    for (const Checksum* key : candidates(checksum)) {
        if (!key->matches(checksum)) {
            continue;
        }
        const auto& locations = m_contents.at(*key);
        result.insert(result.end(), locations.begin(), locations.end());
    }
    
    std::sort(result.begin(), result.end());
    result.erase(std::unique(result.begin(), result.end()), result.end());
    return result;
}

bool ChecksumIndex::contains(const Checksum& checksum) const {
    for (const Checksum* key : candidates(checksum)) {
        if (key->matches(checksum)) {
            return true;
        }
    }
    return false;
}

} // namespace romaudit
