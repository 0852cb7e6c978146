/**
 * ROM Audit - Archive Collection View
 * 
 * Collection content view over an ArchiveReader, hashing on demand.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <map>

#include <QMutex>

#include "CollectionView.hpp"
#include "ResolutionEngine.hpp"
#include "archive/ArchiveReader.hpp"

namespace romaudit {

/**
 * Collection view backed by an archive reader
 * 
 * locate() only hashes archives that can plausibly hold the content: the
 * machines the checksum index lists for it and their clone roots. With
 * scanWholeCollection every archive of the reader is searched.
 */
class ArchiveCollectionView : public CollectionContentView {
public:
    ArchiveCollectionView(
        const ArchiveReader& reader,
        ContentHasher& hasher,
        const ResolutionEngine& resolver,
        bool scanWholeCollection = false
    );
    
    std::vector<HashedEntry> archiveContents(const std::string& archiveId) const override;
    std::vector<ContentMatch> locate(const Checksum& checksum) const override;
    
private:
    std::vector<std::string> candidateArchives(const Checksum& checksum) const;
    
    const ArchiveReader& m_reader;
    ContentHasher& m_hasher;
    const ResolutionEngine& m_resolver;
    bool m_scanWholeCollection;
    
    mutable QMutex m_cacheMutex;
    mutable std::map<std::string, std::vector<HashedEntry>> m_cache;
};

} // namespace romaudit
