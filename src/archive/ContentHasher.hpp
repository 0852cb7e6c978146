/**
 * ROM Audit - Content Hasher
 * 
 * Computes and memoizes the checksums of archive entries.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <QMutex>

#include "ArchiveReader.hpp"
#include "catalog/Checksum.hpp"

namespace romaudit {

/**
 * Archive entry with its computed content identity
 */
struct HashedEntry {
    std::string name;
    std::string identity;
    std::optional<Checksum> checksum;   // nullopt if the entry could not be read
    std::string error;
    
    bool isReadable() const { return checksum.has_value(); }
};

/**
 * Memoizing hasher shared by every worker of a run
 * 
 * Each entry identity is hashed at most once. Concurrent requests for the
 * same identity wait for the first computation instead of repeating it.
 */
class ContentHasher {
public:
    explicit ContentHasher(ChecksumFunction checksumFunction = defaultChecksumFunction());
    
    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;
    
    HashedEntry hash(const ArchiveEntry& entry);
    std::vector<HashedEntry> hashAll(const std::vector<ArchiveEntry>& entries);
    
    /**
     * Number of times the checksum function actually ran
     */
    size_t computations() const { return m_computations.load(); }
    
    static ChecksumFunction defaultChecksumFunction();
    
private:
    struct Slot {
        QMutex mutex;
        bool done = false;
        std::optional<Checksum> checksum;
        std::string error;
    };
    
    std::shared_ptr<Slot> slotFor(const std::string& identity);
    
    ChecksumFunction m_checksumFunction;
    
    QMutex m_slotsMutex;
    std::unordered_map<std::string, std::shared_ptr<Slot>> m_slots;
    std::atomic<size_t> m_computations{0};
};

} // namespace romaudit
