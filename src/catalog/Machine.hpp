/**
 * ROM Audit - Catalog Entities
 * 
 * Machines and the content parts they declare, as loaded from a DAT.
 * Entities are immutable once the catalog has been built.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "CatalogIssue.hpp"
#include "Checksum.hpp"

namespace romaudit {

/**
 * Kind of content part
 */
enum class PartType {
    Rom,
    Disk
};

/**
 * A named binary part of a machine (ROM or disk image)
 */
struct ContentPart {
    PartType type = PartType::Rom;
    std::string name;                  // Logical name, unique within the machine
    uint64_t size = 0;
    std::optional<Checksum> checksum;  // nullopt = no-dump
    std::string merge;                 // Name of the ancestor part supplying the bytes
    bool isOptional = false;
    bool badDump = false;
    
    bool isNoDump() const { return !checksum.has_value(); }
    bool isMerged() const { return !merge.empty(); }
};

/**
 * Sample, verified by presence only
 */
struct Sample {
    std::string name;
};

/**
 * Machine (a "set")
 */
struct Machine {
    std::string name;
    std::string cloneOf;
    std::string romOf;
    std::string sampleOf;
    
    bool isDevice = false;
    bool isBios = false;
    bool runnable = true;
    
    // Descriptive metadata
    std::string description;
    std::string year;
    std::string manufacturer;
};

/**
 * A machine with everything it declares
 */
struct MachineRecord {
    Machine machine;
    std::vector<ContentPart> parts;
    std::vector<Sample> samples;
    std::vector<std::string> deviceRefs;
    std::vector<CatalogIssue> issues;   // Recorded by the importer
};

std::string partTypeName(PartType type);

} // namespace romaudit
