/**
 * ROM Audit - Verification Report Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "VerificationReport.hpp"

#include <algorithm>

namespace romaudit {

namespace {
    nlohmann::json checksumJson(const std::optional<Checksum>& checksum) {
        if (!checksum) {
            return nullptr;
        }
        nlohmann::json j = nlohmann::json::object();
        if (checksum->hasCrc()) {
            j["crc"] = checksum->crcHex();
        }
        if (checksum->hasSha1()) {
            j["sha1"] = checksum->sha1;
        }
        return j;
    }
}

size_t VerificationReport::countParts(PartStatus wanted) const {
    return static_cast<size_t>(std::count_if(parts.begin(), parts.end(), [wanted](const PartVerdict& part) {
        return part.status == wanted;
    }));
}

std::string partStatusName(PartStatus status) {
    switch (status) {
        case PartStatus::Ok: return "ok";
        case PartStatus::Misnamed: return "misnamed";
        case PartStatus::FixableFromElsewhere: return "fixable-from-elsewhere";
        case PartStatus::Missing: return "missing";
        case PartStatus::Unknown: return "unknown";
        case PartStatus::DuplicateContentUnresolved: return "duplicate-content-unresolved";
    }
    return "missing";
}

std::string machineStatusName(MachineStatus status) {
    switch (status) {
        case MachineStatus::Complete: return "complete";
        case MachineStatus::Fixable: return "fixable";
        case MachineStatus::Incomplete: return "incomplete";
        case MachineStatus::CatalogError: return "catalog-error";
        case MachineStatus::NotInCatalog: return "not-in-catalog";
    }
    return "incomplete";
}

std::string fixActionName(FixAction action) {
    switch (action) {
        case FixAction::Rename: return "rename";
        case FixAction::Copy: return "copy";
    }
    return "rename";
}

nlohmann::json toJson(const FixSuggestion& fix) {
    nlohmann::json j;
    j["action"] = fixActionName(fix.action);
    j["sourceArchive"] = fix.sourceArchive;
    j["sourceEntry"] = fix.sourceEntry;
    j["targetArchive"] = fix.targetArchive;
    j["targetEntry"] = fix.targetEntry;
    return j;
}

nlohmann::json toJson(const VerificationReport& report) {
    nlohmann::json j;
    j["machine"] = report.machine;
    j["policy"] = policyName(report.policy);
    j["status"] = machineStatusName(report.status);
    
    nlohmann::json parts = nlohmann::json::array();
    for (const auto& part : report.parts) {
        nlohmann::json p;
        p["name"] = part.name;
        p["type"] = partTypeName(part.type);
        p["expected"] = checksumJson(part.expected);
        p["required"] = part.required;
        p["origin"] = part.origin;
        p["archive"] = part.archive;
        p["expectedEntry"] = part.expectedEntry;
        p["status"] = partStatusName(part.status);
        if (!part.matchedEntry.empty()) {
            p["matchedEntry"] = part.matchedEntry;
        }
        if (part.fix) {
            p["fix"] = toJson(*part.fix);
        }
        if (!part.cause.empty()) {
            p["cause"] = part.cause;
        }
        parts.push_back(p);
    }
    j["parts"] = parts;
    
    nlohmann::json samples = nlohmann::json::array();
    for (const auto& sample : report.samples) {
        samples.push_back({
            {"name", sample.name},
            {"archive", sample.archive},
            {"present", sample.present}
        });
    }
    j["samples"] = samples;
    
    nlohmann::json unneeded = nlohmann::json::array();
    for (const auto& file : report.unneeded) {
        nlohmann::json u;
        u["name"] = file.name;
        u["checksum"] = checksumJson(file.checksum);
        u["misplaced"] = file.misplaced;
        if (!file.error.empty()) {
            u["error"] = file.error;
        }
        nlohmann::json neededBy = nlohmann::json::array();
        for (const auto& location : file.neededBy) {
            neededBy.push_back({{"machine", location.machine}, {"name", location.name}});
        }
        u["neededBy"] = neededBy;
        unneeded.push_back(u);
    }
    j["unneeded"] = unneeded;
    
    nlohmann::json issues = nlohmann::json::array();
    for (const auto& issue : report.issues) {
        nlohmann::json i;
        i["kind"] = issueKindName(issue.kind);
        i["fatal"] = issue.fatal;
        i["machine"] = issue.machine;
        i["part"] = issue.part;
        i["message"] = issue.message;
        issues.push_back(i);
    }
    j["issues"] = issues;
    
    return j;
}

} // namespace romaudit
