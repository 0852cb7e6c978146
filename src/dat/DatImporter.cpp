/**
 * ROM Audit - DAT Importer Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "DatImporter.hpp"

#include <QFile>
#include <QXmlStreamReader>

#include <map>

#include <spdlog/spdlog.h>

namespace romaudit::dat {

namespace {
    using Attributes = std::map<std::string, std::string>;
    
    std::string lowerName(const QXmlStreamReader& reader) {
        return reader.name().toString().toLower().toStdString();
    }
    
    Attributes readAttributes(const QXmlStreamReader& reader) {
        Attributes attributes;
        for (const auto& attr : reader.attributes()) {
            attributes[attr.name().toString().toLower().toStdString()] =
                attr.value().toString().trimmed().toStdString();
        }
        return attributes;
    }
    
    std::string attribute(const Attributes& attributes, const char* key) {
        auto it = attributes.find(key);
        return it != attributes.end() ? it->second : std::string();
    }
    
    bool isYes(const std::string& value) {
        return QString::fromStdString(value).compare("yes", Qt::CaseInsensitive) == 0;
    }
    
    std::string readText(QXmlStreamReader& reader) {
        return reader.readElementText(QXmlStreamReader::SkipChildElements).trimmed().toStdString();
    }
    
    void recordIssue(ImportResult& result, MachineRecord* record, const std::string& machine,
                     const std::string& part, const std::string& message) {
        CatalogIssue issue{IssueKind::MalformedEntry, false, machine, part, message};
        spdlog::warn("Malformed catalog entry {}{}{}: {}", machine, part.empty() ? "" : "/", part, message);
        if (record) {
            record->issues.push_back(issue);
        }
        result.issues.push_back(std::move(issue));
    }
    
    void parseHeader(QXmlStreamReader& reader, DatHeader& header) {
        while (reader.readNextStartElement()) {
            const std::string name = lowerName(reader);
            if (name == "name") {
                header.name = readText(reader);
            } else if (name == "description") {
                header.description = readText(reader);
            } else if (name == "version") {
                header.version = readText(reader);
            } else if (name == "author") {
                header.author = readText(reader);
            } else {
                reader.skipCurrentElement();
            }
        }
    }
    
    void parsePart(QXmlStreamReader& reader, PartType type, MachineRecord& record, ImportResult& result) {
        const Attributes attributes = readAttributes(reader);
        reader.skipCurrentElement();
        
        const std::string& machine = record.machine.name;
        ContentPart part;
        part.type = type;
        part.name = attribute(attributes, "name");
        
        if (part.name.empty()) {
            ++result.skippedRecords;
            recordIssue(result, &record, machine, "", partTypeName(type) + " without name skipped");
            return;
        }
        
        const std::string size = attribute(attributes, "size");
        if (!size.empty()) {
            bool ok = false;
            part.size = QString::fromStdString(size).toULongLong(&ok);
            if (!ok) {
                part.size = 0;
                recordIssue(result, &record, machine, part.name, "unparsable size '" + size + "'");
            }
        }
        
        part.merge = attribute(attributes, "merge");
        part.isOptional = isYes(attribute(attributes, "optional"));
        
        const std::string status = QString::fromStdString(attribute(attributes, "status"))
            .toLower().toStdString();
        part.badDump = status == "baddump";
        
        if (status != "nodump") {
            const std::string crcText = attribute(attributes, "crc");
            const std::string sha1Text = attribute(attributes, "sha1");
            
            Checksum checksum;
            checksum.crc = Checksum::parseCrc(crcText);
            checksum.sha1 = Checksum::normalizeSha1(sha1Text).value_or(std::string());
            
            const bool malformed = (!crcText.empty() && !checksum.hasCrc()) ||
                                   (!sha1Text.empty() && !checksum.hasSha1());
            if (malformed || checksum.isEmpty()) {
                ++result.degradedParts;
                recordIssue(result, &record, machine, part.name,
                            malformed ? "malformed checksum, treated as no-dump"
                                      : "no checksum, treated as no-dump");
            } else {
                part.checksum = checksum;
            }
        }
        
        record.parts.push_back(std::move(part));
    }
    
    void parseMachine(QXmlStreamReader& reader, MemoryCatalog& catalog, ImportResult& result) {
        const Attributes attributes = readAttributes(reader);
        
        MachineRecord record;
        Machine& machine = record.machine;
        machine.name = attribute(attributes, "name");
        machine.cloneOf = attribute(attributes, "cloneof");
        machine.romOf = attribute(attributes, "romof");
        machine.sampleOf = attribute(attributes, "sampleof");
        machine.isDevice = isYes(attribute(attributes, "isdevice"));
        machine.isBios = isYes(attribute(attributes, "isbios"));
        machine.runnable = QString::fromStdString(attribute(attributes, "runnable"))
            .compare("no", Qt::CaseInsensitive) != 0;
        
        if (machine.name.empty()) {
            reader.skipCurrentElement();
            ++result.skippedRecords;
            recordIssue(result, nullptr, "<unnamed>", "", "machine without name skipped");
            return;
        }
        
        while (reader.readNextStartElement()) {
            const std::string name = lowerName(reader);
            
            if (name == "description") {
                machine.description = readText(reader);
            } else if (name == "year") {
                machine.year = readText(reader);
            } else if (name == "manufacturer") {
                machine.manufacturer = readText(reader);
            } else if (name == "rom") {
                parsePart(reader, PartType::Rom, record, result);
            } else if (name == "disk") {
                parsePart(reader, PartType::Disk, record, result);
            } else if (name == "sample") {
                const std::string sample = attribute(readAttributes(reader), "name");
                reader.skipCurrentElement();
                if (!sample.empty()) {
                    record.samples.push_back({sample});
                }
            } else if (name == "device_ref") {
                const std::string device = attribute(readAttributes(reader), "name");
                reader.skipCurrentElement();
                if (!device.empty()) {
                    record.deviceRefs.push_back(device);
                }
            } else {
                reader.skipCurrentElement();
            }
        }
        
        if (reader.hasError()) {
            return;
        }
        
        if (catalog.addMachine(std::move(record))) {
            ++result.machines;
        } else {
            ++result.duplicateMachines;
        }
    }
}

ImportResult DatImporter::importFile(const std::filesystem::path& path, MemoryCatalog& catalog) {
    QFile file(QString::fromStdString(path.string()));
    if (!file.open(QIODevice::ReadOnly)) {
        ImportResult result;
        result.error = ImportError::FileNotFound;
        result.errorMessage = "Cannot open " + path.string() + ": " + file.errorString().toStdString();
        spdlog::error("{}", result.errorMessage);
        return result;
    }
    
    QXmlStreamReader reader(&file);
    auto result = importFrom(reader, catalog);
    if (result.isSuccess()) {
        spdlog::info("Imported {} machines from {} ({} skipped records, {} degraded parts)",
                     result.machines, path.string(), result.skippedRecords, result.degradedParts);
    }
    return result;
}

ImportResult DatImporter::importContent(const QByteArray& content, MemoryCatalog& catalog) {
    QXmlStreamReader reader(content);
    return importFrom(reader, catalog);
}

ImportResult DatImporter::importFrom(QXmlStreamReader& reader, MemoryCatalog& catalog) {
    ImportResult result;
    
    while (!reader.atEnd()) {
        reader.readNext();
        if (!reader.isStartElement()) {
            continue;
        }
        
        const std::string name = lowerName(reader);
        if (name == "header") {
            parseHeader(reader, result.header);
        } else if (name == "machine" || name == "game") {
            parseMachine(reader, catalog, result);
        }
    }
    
    if (reader.hasError()) {
        result.error = ImportError::ParseError;
        result.errorMessage = "XML error at line " + std::to_string(reader.lineNumber()) +
                              ": " + reader.errorString().toStdString();
        spdlog::error("Failed to parse catalog: {}", result.errorMessage);
    }
    
    return result;
}

} // namespace romaudit::dat
