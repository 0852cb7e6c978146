/**
 * ROM Audit - Archive Reader
 * 
 * Interface for enumerating the entries of a collection's archives.
 * Container decoding is left to implementations.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <QIODevice>

namespace romaudit {

/**
 * One file inside an archive
 */
struct ArchiveEntry {
    std::string name;       // Entry name inside the archive ("/" separated)
    std::string identity;   // Stable identity of the underlying bytes, used for memoization
    uint64_t size = 0;
    
    // Produces a fresh stream for the entry, nullptr if it cannot be opened
    std::function<std::unique_ptr<QIODevice>()> opener;
    
    /**
     * Open the entry for reading
     * @return Opened device, or nullptr if unreadable
     */
    std::unique_ptr<QIODevice> open() const {
        if (!opener) {
            return nullptr;
        }
        auto device = opener();
        if (!device || !device->isOpen()) {
            return nullptr;
        }
        return device;
    }
};

/**
 * Archive reader interface
 * 
 * An archive identifier is the machine name the archive is packaged for.
 */
class ArchiveReader {
public:
    virtual ~ArchiveReader() = default;
    
    /**
     * All archive identifiers in the collection, sorted
     */
    virtual std::vector<std::string> listArchives() const = 0;
    
    virtual bool hasArchive(const std::string& archiveId) const = 0;
    
    /**
     * Entries currently present in an archive, sorted by name
     * 
     * Returns an empty list for unknown archives.
     */
    virtual std::vector<ArchiveEntry> entries(const std::string& archiveId) const = 0;
};

} // namespace romaudit
