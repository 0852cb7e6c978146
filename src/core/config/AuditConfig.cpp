/**
 * ROM Audit - Audit Configuration Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "AuditConfig.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

namespace romaudit {

bool AuditConfig::isValidVerbosity(const std::string& verbosity) {
    return verbosity == "debug" || verbosity == "info" ||
           verbosity == "warning" || verbosity == "error";
}

AuditConfig AuditConfig::fromJson(const std::string& json) {
    AuditConfig config;
    
    try {
        auto j = nlohmann::json::parse(json);
        
        if (j.contains("datFile")) {
            config.datFile = j["datFile"].get<std::string>();
        }
        if (j.contains("romsDirectory")) {
            config.romsDirectory = j["romsDirectory"].get<std::string>();
        }
        if (j.contains("policy")) {
            config.policy = parsePackagingPolicy(j["policy"].get<std::string>());
        }
        if (j.contains("threads")) {
            config.threads = j["threads"].get<int>();
        }
        if (j.contains("logVerbosity")) {
            config.logVerbosity = j["logVerbosity"].get<std::string>();
        }
        if (j.contains("scanWholeCollection")) {
            config.scanWholeCollection = j["scanWholeCollection"].get<bool>();
        }
        if (j.contains("reportFile")) {
            config.reportFile = j["reportFile"].get<std::string>();
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid configuration: ") + e.what());
    }
    
    if (config.threads < 0) {
        throw ConfigError("threads must not be negative");
    }
    if (!isValidVerbosity(config.logVerbosity)) {
        throw ConfigError("Unknown log verbosity '" + config.logVerbosity + "'");
    }
    
    return config;
}

std::string AuditConfig::toJson() const {
    nlohmann::json j;
    j["datFile"] = datFile.string();
    j["romsDirectory"] = romsDirectory.string();
    j["policy"] = policyName(policy);
    j["threads"] = threads;
    j["logVerbosity"] = logVerbosity;
    j["scanWholeCollection"] = scanWholeCollection;
    j["reportFile"] = reportFile.string();
    return j.dump(2);
}

std::optional<AuditConfig> AuditConfig::load(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        spdlog::debug("No configuration at {}, using defaults", path.string());
        return AuditConfig{};
    }
    
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to open config: {}", path.string());
            return std::nullopt;
        }
        
        std::stringstream buffer;
        buffer << file.rdbuf();
        return fromJson(buffer.str());
    } catch (const std::exception& e) {
        spdlog::error("Failed to load config {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

bool AuditConfig::save(const std::filesystem::path& path) const {
    try {
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        
        std::ofstream file(path);
        if (!file.is_open()) {
            spdlog::error("Failed to write config: {}", path.string());
            return false;
        }
        file << toJson();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Failed to save config {}: {}", path.string(), e.what());
        return false;
    }
}

} // namespace romaudit
