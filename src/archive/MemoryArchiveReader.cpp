/**
 * ROM Audit - In-memory Archive Reader Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "MemoryArchiveReader.hpp"

#include <QBuffer>

namespace romaudit {

void MemoryArchiveReader::addArchive(const std::string& archiveId) {
    m_archives[archiveId];
}

void MemoryArchiveReader::addEntry(
    const std::string& archiveId,
    const std::string& name,
    const QByteArray& data
) {
    m_archives[archiveId][name] = StoredEntry{data, true, ++m_nextGeneration};
}

void MemoryArchiveReader::addUnreadableEntry(const std::string& archiveId, const std::string& name) {
    m_archives[archiveId][name] = StoredEntry{QByteArray(), false, ++m_nextGeneration};
}

std::vector<std::string> MemoryArchiveReader::listArchives() const {
    std::vector<std::string> archives;
    archives.reserve(m_archives.size());
    for (const auto& [id, contents] : m_archives) {
        archives.push_back(id);
    }
    return archives;
}

bool MemoryArchiveReader::hasArchive(const std::string& archiveId) const {
    return m_archives.count(archiveId) > 0;
}

std::vector<ArchiveEntry> MemoryArchiveReader::entries(const std::string& archiveId) const {
    std::vector<ArchiveEntry> result;
    
    auto it = m_archives.find(archiveId);
    if (it == m_archives.end()) {
        return result;
    }
    
    for (const auto& [name, stored] : it->second) {
        ArchiveEntry entry;
        entry.name = name;
        entry.identity = "memory:" + archiveId + "/" + name + "#" + std::to_string(stored.generation);
        entry.size = static_cast<uint64_t>(stored.data.size());
        
        if (stored.readable) {
            const QByteArray data = stored.data;
            entry.opener = [data]() -> std::unique_ptr<QIODevice> {
                auto buffer = std::make_unique<QBuffer>();
                buffer->setData(data);
                buffer->open(QIODevice::ReadOnly);
                return buffer;
            };
        } else {
            entry.opener = []() -> std::unique_ptr<QIODevice> { return nullptr; };
        }
        
        result.push_back(std::move(entry));
    }
    
    return result;
}

} // namespace romaudit
