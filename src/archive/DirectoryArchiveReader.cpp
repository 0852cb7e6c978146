/**
 * ROM Audit - Directory Archive Reader Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "DirectoryArchiveReader.hpp"

#include <QFile>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace romaudit {

namespace fs = std::filesystem;

DirectoryArchiveReader::DirectoryArchiveReader(fs::path root)
    : m_root(std::move(root))
{
}

bool DirectoryArchiveReader::isValid() const {
    std::error_code ec;
    return fs::is_directory(m_root, ec);
}

std::vector<std::string> DirectoryArchiveReader::listArchives() const {
    std::vector<std::string> archives;
    
    std::error_code ec;
    for (fs::directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_directory(ec)) {
            archives.push_back(it->path().filename().string());
        }
    }
    if (ec) {
        spdlog::warn("Failed to list collection {}: {}", m_root.string(), ec.message());
    }
    
    std::sort(archives.begin(), archives.end());
    return archives;
}

bool DirectoryArchiveReader::hasArchive(const std::string& archiveId) const {
    if (archiveId.empty()) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(m_root / archiveId, ec);
}

std::vector<ArchiveEntry> DirectoryArchiveReader::entries(const std::string& archiveId) const {
    std::vector<ArchiveEntry> result;
    if (!hasArchive(archiveId)) {
        return result;
    }
    
    const fs::path archiveDir = m_root / archiveId;
    std::error_code ec;
    for (fs::recursive_directory_iterator it(archiveDir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file(ec)) {
            continue;
        }
        
        const fs::path path = it->path();
        std::error_code sizeError;
        
        ArchiveEntry entry;
        entry.name = path.lexically_relative(archiveDir).generic_string();
        entry.identity = fs::absolute(path, sizeError).string();
        entry.size = static_cast<uint64_t>(fs::file_size(path, sizeError));
        if (sizeError) {
            entry.size = 0;
        }
        
        const QString filePath = QString::fromStdString(path.string());
        entry.opener = [filePath]() -> std::unique_ptr<QIODevice> {
            auto file = std::make_unique<QFile>(filePath);
            if (!file->open(QIODevice::ReadOnly)) {
                spdlog::warn("Cannot open {}: {}", filePath.toStdString(),
                             file->errorString().toStdString());
                return nullptr;
            }
            return file;
        };
        
        result.push_back(std::move(entry));
    }
    if (ec) {
        spdlog::warn("Failed to read archive {}: {}", archiveDir.string(), ec.message());
    }
    
    std::sort(result.begin(), result.end(), [](const ArchiveEntry& a, const ArchiveEntry& b) {
        return a.name < b.name;
    });
    return result;
}

std::vector<std::string> DirectoryArchiveReader::looseFiles() const {
    std::vector<std::string> files;
    
    std::error_code ec;
    for (fs::directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file(ec)) {
            files.push_back(it->path().filename().string());
        }
    }
    
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace romaudit
