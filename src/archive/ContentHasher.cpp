/**
 * ROM Audit - Content Hasher Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "ContentHasher.hpp"

#include <QMutexLocker>

#include <spdlog/spdlog.h>

namespace romaudit {

ContentHasher::ContentHasher(ChecksumFunction checksumFunction)
    : m_checksumFunction(std::move(checksumFunction))
{
}

ChecksumFunction ContentHasher::defaultChecksumFunction() {
    return [](QIODevice& device) { return computeChecksum(device); };
}

std::shared_ptr<ContentHasher::Slot> ContentHasher::slotFor(const std::string& identity) {
    QMutexLocker locker(&m_slotsMutex);
    
    auto& slot = m_slots[identity];
    if (!slot) {
        slot = std::make_shared<Slot>();
    }
    return slot;
}

HashedEntry ContentHasher::hash(const ArchiveEntry& entry) {
    HashedEntry result;
    result.name = entry.name;
    result.identity = entry.identity;
    
    auto slot = slotFor(entry.identity);
    QMutexLocker locker(&slot->mutex);
    
    if (!slot->done) {
        auto device = entry.open();
        if (!device) {
            slot->error = "cannot open entry";
        } else {
            slot->checksum = m_checksumFunction(*device);
            ++m_computations;
            if (!slot->checksum) {
                slot->error = "read error";
            }
        }
        
        if (!slot->checksum) {
            spdlog::warn("Unreadable entry {} ({})", entry.identity, slot->error);
        }
        slot->done = true;
    }
    
    result.checksum = slot->checksum;
    result.error = slot->error;
    return result;
}

std::vector<HashedEntry> ContentHasher::hashAll(const std::vector<ArchiveEntry>& entries) {
    std::vector<HashedEntry> result;
    result.reserve(entries.size());
    for (const auto& entry : entries) {
        result.push_back(hash(entry));
    }
    return result;
}

} // namespace romaudit
