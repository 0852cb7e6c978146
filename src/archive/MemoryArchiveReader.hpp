/**
 * ROM Audit - In-memory Archive Reader
 * 
 * Archives held as byte buffers, for embedding callers and tests.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>
#include <string>

#include <QByteArray>

#include "ArchiveReader.hpp"

namespace romaudit {

class MemoryArchiveReader : public ArchiveReader {
public:
    MemoryArchiveReader() = default;
    
    /**
     * Create an empty archive (no-op if it exists)
     */
    void addArchive(const std::string& archiveId);
    
    /**
     * Add or replace an entry, creating the archive when needed
     */
    void addEntry(const std::string& archiveId, const std::string& name, const QByteArray& data);
    
    /**
     * Add an entry whose stream cannot be opened
     */
    void addUnreadableEntry(const std::string& archiveId, const std::string& name);
    
    std::vector<std::string> listArchives() const override;
    bool hasArchive(const std::string& archiveId) const override;
    std::vector<ArchiveEntry> entries(const std::string& archiveId) const override;
    
private:
    struct StoredEntry {
        QByteArray data;
        bool readable = true;
        uint64_t generation = 0;   // Bumped on replacement so identities stay unique
    };
    
    std::map<std::string, std::map<std::string, StoredEntry>> m_archives;
    uint64_t m_nextGeneration = 0;
};

} // namespace romaudit
