/**
 * ROM Audit - Directory Archive Reader
 * 
 * Reads a collection stored as one directory per archive.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>

#include "ArchiveReader.hpp"

namespace romaudit {

/**
 * Collection laid out as <root>/<archive>/<entry>
 * 
 * Entries of nested directories are named with their relative path.
 * Plain files directly under the root belong to no archive and are
 * reported separately by looseFiles().
 */
class DirectoryArchiveReader : public ArchiveReader {
public:
    explicit DirectoryArchiveReader(std::filesystem::path root);
    
    const std::filesystem::path& root() const { return m_root; }
    bool isValid() const;
    
    std::vector<std::string> listArchives() const override;
    bool hasArchive(const std::string& archiveId) const override;
    std::vector<ArchiveEntry> entries(const std::string& archiveId) const override;
    
    /**
     * Files at the collection root that are not inside any archive
     */
    std::vector<std::string> looseFiles() const;
    
private:
    std::filesystem::path m_root;
};

} // namespace romaudit
