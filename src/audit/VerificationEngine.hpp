/**
 * ROM Audit - Verification Engine
 * 
 * Matches the files supplied for a machine's archive against the
 * machine's effective content set.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "CollectionView.hpp"
#include "ResolutionEngine.hpp"
#include "VerificationReport.hpp"
#include "archive/ArchiveReader.hpp"
#include "archive/ContentHasher.hpp"

namespace romaudit {

/**
 * Verification engine
 * 
 * Classification of every expected part:
 * 1. exact name and content match: Ok
 * 2. content present in the expected archive under another name: Misnamed
 * 3. content already used by a sibling part: DuplicateContentUnresolved
 * 4. content found in another archive of the collection: FixableFromElsewhere
 * 5. otherwise Missing; no-dump parts are always Unknown
 * 
 * Safe to call concurrently for distinct machines.
 */
class VerificationEngine {
public:
    VerificationEngine(const ResolutionEngine& resolver, ContentHasher& hasher);
    
    /**
     * Verify one machine
     * 
     * @param machineId Machine to verify
     * @param suppliedFiles Current entries of the machine's own archive
     * @param policy Packaging policy of the collection
     * @param collection Other archives of the collection, may be nullptr
     */
    VerificationReport verify(
        const std::string& machineId,
        const std::vector<ArchiveEntry>& suppliedFiles,
        PackagingPolicy policy,
        const CollectionContentView* collection = nullptr
    ) const;
    
private:
    struct LocalFile {
        HashedEntry entry;
        bool consumed = false;
    };
    
    std::vector<UnneededFile> leftovers(
        const std::string& machineId,
        const std::vector<LocalFile>& files
    ) const;
    
    const ResolutionEngine& m_resolver;
    ContentHasher& m_hasher;
};

} // namespace romaudit
