/**
 * ROM Audit - DAT Importer
 * 
 * Loads Logiqx and MAME XML catalogs into a MemoryCatalog.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <QByteArray>

#include "catalog/CatalogIssue.hpp"
#include "catalog/MemoryCatalog.hpp"

class QXmlStreamReader;

namespace romaudit::dat {

/**
 * Catalog header information
 */
struct DatHeader {
    std::string name;
    std::string description;
    std::string version;
    std::string author;
};

enum class ImportError {
    None,
    FileNotFound,
    ParseError
};

/**
 * Import result
 * 
 * Malformed records do not fail an import. They are skipped or coerced
 * and reported through skippedRecords and issues.
 */
struct ImportResult {
    ImportError error = ImportError::None;
    std::string errorMessage;
    
    DatHeader header;
    size_t machines = 0;
    size_t skippedRecords = 0;
    size_t degradedParts = 0;       // Parts turned into no-dumps by a bad checksum
    size_t duplicateMachines = 0;
    std::vector<CatalogIssue> issues;
    
    bool isSuccess() const { return error == ImportError::None; }
};

/**
 * DAT importer
 * 
 * Supported documents:
 * <datafile>
 *     <header><name>..</name><description>..</description><version>..</version></header>
 *     <game name="x" cloneof="y" romof="y" sampleof="z">
 *         <description>..</description>
 *         <rom name="a.bin" size="1024" crc="0123abcd" sha1="..." merge="a.bin" status="nodump"/>
 *         <disk name="d" sha1="..." merge="d"/>
 *         <sample name="s"/>
 *     </game>
 * </datafile>
 * 
 * and MAME's <mame><machine isdevice="yes" ...><device_ref name=".."/></machine></mame>.
 * Element and attribute names are matched case-insensitively.
 */
class DatImporter {
public:
    static ImportResult importFile(const std::filesystem::path& path, MemoryCatalog& catalog);
    static ImportResult importContent(const QByteArray& content, MemoryCatalog& catalog);
    
private:
    static ImportResult importFrom(QXmlStreamReader& reader, MemoryCatalog& catalog);
};

} // namespace romaudit::dat
