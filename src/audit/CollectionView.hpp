/**
 * ROM Audit - Collection Content View
 * 
 * Read-only access to the hashed contents of a user's collection.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <string>
#include <vector>

#include "archive/ContentHasher.hpp"
#include "catalog/Checksum.hpp"

namespace romaudit {

/**
 * An archive entry holding some content
 */
struct ContentMatch {
    std::string archive;
    std::string entry;
    
    bool operator==(const ContentMatch& other) const {
        return archive == other.archive && entry == other.entry;
    }
    bool operator<(const ContentMatch& other) const {
        return archive != other.archive ? archive < other.archive : entry < other.entry;
    }
};

/**
 * Collection content view interface
 * 
 * Content identity is always computed from bytes. Implementations must be
 * safe to query from several verification workers at once.
 */
class CollectionContentView {
public:
    virtual ~CollectionContentView() = default;
    
    /**
     * Hashed entries of one archive, sorted by name (empty if absent)
     */
    virtual std::vector<HashedEntry> archiveContents(const std::string& archiveId) const = 0;
    
    /**
     * Archive entries holding the given content, sorted
     */
    virtual std::vector<ContentMatch> locate(const Checksum& checksum) const = 0;
};

} // namespace romaudit
