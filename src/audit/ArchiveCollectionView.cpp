/**
 * ROM Audit - Archive Collection View Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ArchiveCollectionView.hpp"

#include <QMutexLocker>

#include <algorithm>

namespace romaudit {

ArchiveCollectionView::ArchiveCollectionView(
    const ArchiveReader& reader,
    ContentHasher& hasher,
    const ResolutionEngine& resolver,
    bool scanWholeCollection
)
    : m_reader(reader)
    , m_hasher(hasher)
    , m_resolver(resolver)
    , m_scanWholeCollection(scanWholeCollection)
{
}

std::vector<HashedEntry> ArchiveCollectionView::archiveContents(const std::string& archiveId) const {
    {
        QMutexLocker locker(&m_cacheMutex);
        auto it = m_cache.find(archiveId);
        if (it != m_cache.end()) {
            return it->second;
        }
    }
    
    // Hash outside the lock, the hasher deduplicates concurrent work itself
    auto contents = m_hasher.hashAll(m_reader.entries(archiveId));
    
    QMutexLocker locker(&m_cacheMutex);
    auto inserted = m_cache.emplace(archiveId, std::move(contents));
    return inserted.first->second;
}

std::vector<std::string> ArchiveCollectionView::candidateArchives(const Checksum& checksum) const {
    if (m_scanWholeCollection) {
        return m_reader.listArchives();
    }
    
    std::vector<std::string> archives;
    for (const auto& location : m_resolver.index().lookup(checksum)) {
        archives.push_back(location.machine);
        archives.push_back(m_resolver.cloneRoot(location.machine));
    }
    
    std::sort(archives.begin(), archives.end());
    archives.erase(std::unique(archives.begin(), archives.end()), archives.end());
    archives.erase(std::remove_if(archives.begin(), archives.end(), [this](const std::string& id) {
        return !m_reader.hasArchive(id);
    }), archives.end());
    return archives;
}

std::vector<ContentMatch> ArchiveCollectionView::locate(const Checksum& checksum) const {
    std::vector<ContentMatch> matches;
    
    for (const auto& archive : candidateArchives(checksum)) {
        for (const auto& entry : archiveContents(archive)) {
            if (entry.checksum && entry.checksum->matches(checksum)) {
                matches.push_back({archive, entry.name});
            }
        }
    }
    
    std::sort(matches.begin(), matches.end());
    return matches;
}

} // namespace romaudit
