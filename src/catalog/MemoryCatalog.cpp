/**
 * ROM Audit - In-memory Catalog Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "MemoryCatalog.hpp"

#include <spdlog/spdlog.h>

namespace romaudit {

namespace {
    std::optional<std::string> nonEmpty(const std::string& value) {
        if (value.empty()) {
            return std::nullopt;
        }
        return value;
    }
}

std::string issueKindName(IssueKind kind) {
    switch (kind) {
        case IssueKind::CatalogIntegrity: return "catalog-integrity";
        case IssueKind::Io: return "io";
        case IssueKind::MalformedEntry: return "malformed-entry";
    }
    return "catalog-integrity";
}

std::string partTypeName(PartType type) {
    switch (type) {
        case PartType::Rom: return "rom";
        case PartType::Disk: return "disk";
    }
    return "rom";
}

bool MemoryCatalog::addMachine(MachineRecord record) {
    const std::string name = record.machine.name;
    
    if (m_machines.count(name) > 0) {
        spdlog::warn("Duplicate machine '{}' in catalog, keeping first definition", name);
        return false;
    }
    
    m_machines.emplace(name, std::move(record));
    m_order.push_back(name);
    return true;
}

const MachineRecord* MemoryCatalog::find(const std::string& id) const {
    auto it = m_machines.find(id);
    if (it != m_machines.end()) {
        return &it->second;
    }
    return nullptr;
}

std::optional<Machine> MemoryCatalog::getMachine(const std::string& id) const {
    if (const auto* record = find(id)) {
        return record->machine;
    }
    return std::nullopt;
}

std::vector<ContentPart> MemoryCatalog::getPartsOf(const std::string& machineId) const {
    if (const auto* record = find(machineId)) {
        return record->parts;
    }
    return {};
}

std::vector<Sample> MemoryCatalog::getSamplesOf(const std::string& machineId) const {
    if (const auto* record = find(machineId)) {
        return record->samples;
    }
    return {};
}

std::vector<std::string> MemoryCatalog::getDeviceRefsOf(const std::string& machineId) const {
    if (const auto* record = find(machineId)) {
        return record->deviceRefs;
    }
    return {};
}

std::vector<CatalogIssue> MemoryCatalog::getIssuesOf(const std::string& machineId) const {
    if (const auto* record = find(machineId)) {
        return record->issues;
    }
    return {};
}

std::optional<std::string> MemoryCatalog::resolveParent(
    const std::string& machineId,
    ParentRelation relation
) const {
    const auto* record = find(machineId);
    if (!record) {
        return std::nullopt;
    }
    
    switch (relation) {
        case ParentRelation::CloneOf:
            return nonEmpty(record->machine.cloneOf);
        case ParentRelation::RomOf:
            return nonEmpty(record->machine.romOf);
    }
    return std::nullopt;
}

std::optional<std::string> MemoryCatalog::resolveSampleParent(const std::string& machineId) const {
    if (const auto* record = find(machineId)) {
        return nonEmpty(record->machine.sampleOf);
    }
    return std::nullopt;
}

} // namespace romaudit
