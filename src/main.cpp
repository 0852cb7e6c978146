/**
 * ROM Audit - Verifies ROM collections against DAT catalogs
 * 
 * Copyright (C) 2024
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include <QCoreApplication>
#include <QCommandLineParser>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>

#include "audit/ChecksumIndex.hpp"
#include "audit/QueryEngine.hpp"
#include "audit/ResolutionEngine.hpp"
#include "audit/VerificationRunner.hpp"
#include "archive/DirectoryArchiveReader.hpp"
#include "catalog/MemoryCatalog.hpp"
#include "core/config/AuditConfig.hpp"
#include "core/platform/Platform.hpp"
#include "dat/DatImporter.hpp"

namespace {

std::shared_ptr<spdlog::sinks::stdout_color_sink_mt> g_consoleSink;
std::atomic<romaudit::VerificationRunner*> g_activeRunner{nullptr};

spdlog::level::level_enum levelFromVerbosity(const std::string& verbosity) {
    if (verbosity == "debug") return spdlog::level::debug;
    if (verbosity == "warning") return spdlog::level::warn;
    if (verbosity == "error") return spdlog::level::err;
    return spdlog::level::info;
}

void setupLogging() {
    g_consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    g_consoleSink->set_level(spdlog::level::info);
    
    std::vector<spdlog::sink_ptr> sinks{g_consoleSink};
    
    auto logPath = romaudit::Platform::getCachePath() / "logs" / "romaudit.log";
    try {
        std::filesystem::create_directories(logPath.parent_path());
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            logPath.string(), 1024 * 1024 * 5, 3);
        file_sink->set_level(spdlog::level::debug);
        sinks.push_back(file_sink);
    } catch (const std::exception& e) {
        std::cerr << "File logging disabled: " << e.what() << std::endl;
    }
    
    auto logger = std::make_shared<spdlog::logger>("romaudit", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::debug);
    
    spdlog::set_default_logger(logger);
}

void handleInterrupt(int) {
    if (auto* runner = g_activeRunner.load()) {
        runner->cancel();
    }
}

std::string describeFix(const romaudit::FixSuggestion& fix) {
    if (fix.action == romaudit::FixAction::Rename) {
        return "rename " + fix.sourceArchive + "/" + fix.sourceEntry + " -> " + fix.targetEntry;
    }
    return "copy " + fix.sourceArchive + "/" + fix.sourceEntry + " -> " +
           fix.targetArchive + "/" + fix.targetEntry;
}

void printReport(const romaudit::VerificationReport& report) {
    using romaudit::PartStatus;
    
    std::cout << report.machine << ": " << romaudit::machineStatusName(report.status) << "\n";
    
    for (const auto& part : report.parts) {
        if (part.status == PartStatus::Ok) {
            continue;
        }
        std::cout << "  " << romaudit::partStatusName(part.status) << " " << part.name;
        if (!part.required) {
            std::cout << " (not required)";
        }
        if (part.fix) {
            std::cout << ": " << describeFix(*part.fix);
        }
        if (!part.cause.empty()) {
            std::cout << " [" << part.cause << "]";
        }
        std::cout << "\n";
    }
    for (const auto& sample : report.samples) {
        if (!sample.present) {
            std::cout << "  missing sample " << sample.name << " (" << sample.archive << ")\n";
        }
    }
    for (const auto& file : report.unneeded) {
        std::cout << "  unneeded " << file.name;
        if (file.misplaced && !file.neededBy.empty()) {
            std::cout << " (needed by " << file.neededBy.front().machine << "/"
                      << file.neededBy.front().name << ")";
        }
        std::cout << "\n";
    }
    for (const auto& issue : report.issues) {
        std::cout << "  " << romaudit::issueKindName(issue.kind)
                  << (issue.fatal ? " (fatal)" : "") << ": " << issue.message << "\n";
    }
}

int runVerify(
    const romaudit::AuditConfig& config,
    const romaudit::ResolutionEngine& resolver,
    const std::vector<std::string>& requestedMachines
) {
    if (config.romsDirectory.empty()) {
        spdlog::error("No ROM directory given (--roms or romsDirectory in the config)");
        return 1;
    }
    
    romaudit::DirectoryArchiveReader reader(config.romsDirectory);
    if (!reader.isValid()) {
        spdlog::error("ROM directory does not exist: {}", config.romsDirectory.string());
        return 1;
    }
    
    std::vector<std::string> machines = requestedMachines;
    if (machines.empty()) {
        machines = reader.listArchives();
    }
    
    for (const auto& file : reader.looseFiles()) {
        spdlog::warn("Loose file outside any archive: {}", file);
    }
    
    romaudit::RunnerOptions options;
    options.threads = config.threads;
    options.scanWholeCollection = config.scanWholeCollection;
    
    romaudit::VerificationRunner runner(resolver, reader, options);
    g_activeRunner = &runner;
    std::signal(SIGINT, handleInterrupt);
    
    auto summary = runner.run(machines, config.policy,
        [](const romaudit::VerificationReport& report, size_t done, size_t total) {
            spdlog::debug("[{}/{}] {}: {}", done, total, report.machine,
                          romaudit::machineStatusName(report.status));
        });
    
    std::signal(SIGINT, SIG_DFL);
    g_activeRunner = nullptr;
    
    for (const auto& report : summary.reports) {
        printReport(report);
    }
    
    if (!config.reportFile.empty()) {
        std::ofstream file(config.reportFile);
        if (!file.is_open()) {
            spdlog::error("Failed to write report: {}", config.reportFile.string());
            return 1;
        }
        file << romaudit::toJson(summary).dump(2) << "\n";
        spdlog::info("Report written to {}", config.reportFile.string());
    }
    
    return 0;
}

int runInfo(const romaudit::ResolutionEngine& resolver, const std::vector<std::string>& machines,
            romaudit::PackagingPolicy policy) {
    if (machines.empty()) {
        spdlog::error("info needs at least one --machine");
        return 1;
    }
    
    for (const auto& machineId : machines) {
        auto result = resolver.resolve(machineId, policy);
        if (!result.isSuccess()) {
            std::cout << machineId << ": " << result.errorMessage << "\n";
            continue;
        }
        
        std::cout << machineId << " (" << romaudit::policyName(policy) << ")\n";
        for (const auto& part : result.set->parts) {
            std::cout << "  " << part.name << " "
                      << (part.checksum ? part.checksum->toString() : std::string("nodump"))
                      << " in " << part.archive << "/" << part.archiveEntryName;
            if (part.origin != machineId) {
                std::cout << " from " << part.origin;
            }
            if (!part.required) {
                std::cout << " (not required)";
            }
            if (part.unresolved) {
                std::cout << " (unresolved merge)";
            }
            std::cout << "\n";
        }
        for (const auto& sample : result.set->samples) {
            std::cout << "  sample " << sample.name << " in " << sample.archive << "\n";
        }
    }
    return 0;
}

int runUsage(const romaudit::QueryEngine& queries, const std::vector<std::string>& machines,
             const std::string& rom, romaudit::PackagingPolicy policy) {
    if (machines.size() != 1) {
        spdlog::error("usage needs exactly one --machine");
        return 1;
    }
    const std::string& machineId = machines.front();
    
    if (!rom.empty()) {
        auto usage = queries.romUsage(machineId, rom, policy);
        if (!usage) {
            spdlog::error("No checksum known for {}/{}", machineId, rom);
            return 1;
        }
        std::cout << machineId << "/" << rom << " " << usage->checksum.toString() << "\n";
        for (const auto& location : usage->usedBy) {
            std::cout << "  " << location.machine << "/" << location.name << "\n";
        }
        return 0;
    }
    
    auto usage = queries.setUsage(machineId, policy);
    if (!usage) {
        return 1;
    }
    for (const auto& [machine, parts] : *usage) {
        std::cout << machine << ":";
        for (const auto& part : parts) {
            std::cout << " " << part;
        }
        std::cout << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("romaudit");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("romaudit");
    
    setupLogging();
    
    QCommandLineParser parser;
    parser.setApplicationDescription("Verify ROM collections against DAT catalogs");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("command", "verify (default), info, usage, shared, derivable, stats");
    
    QCommandLineOption datOption(QStringList() << "d" << "dat", "DAT catalog file", "file");
    QCommandLineOption romsOption(QStringList() << "r" << "roms", "Collection directory", "dir");
    QCommandLineOption modeOption(QStringList() << "m" << "mode",
                                  "Packaging policy (split, merged, non-merged)", "mode");
    QCommandLineOption machineOption(QStringList() << "machine", "Machine to process (repeatable)", "name");
    QCommandLineOption romOption(QStringList() << "rom", "Part name for the usage command", "name");
    QCommandLineOption threadsOption(QStringList() << "j" << "threads", "Worker threads", "n");
    QCommandLineOption configOption(QStringList() << "c" << "config", "Configuration file", "file");
    QCommandLineOption reportOption(QStringList() << "report", "Write a JSON report", "file");
    QCommandLineOption verbosityOption(QStringList() << "verbosity",
                                       "Console log level (debug, info, warning, error)", "level");
    QCommandLineOption scanAllOption(QStringList() << "scan-all",
                                     "Search every archive of the collection for missing content");
    
    parser.addOptions({datOption, romsOption, modeOption, machineOption, romOption, threadsOption,
                       configOption, reportOption, verbosityOption, scanAllOption});
    parser.process(app);
    
    // Configuration file, then command line overrides
    std::filesystem::path configPath = romaudit::Platform::getDefaultConfigFile();
    if (parser.isSet(configOption)) {
        configPath = parser.value(configOption).toStdString();
        if (!std::filesystem::exists(configPath)) {
            spdlog::error("Configuration file not found: {}", configPath.string());
            return 1;
        }
    }
    
    auto loaded = romaudit::AuditConfig::load(configPath);
    if (!loaded) {
        return 1;
    }
    romaudit::AuditConfig config = *loaded;
    
    try {
        if (parser.isSet(datOption)) {
            config.datFile = parser.value(datOption).toStdString();
        }
        if (parser.isSet(romsOption)) {
            config.romsDirectory = parser.value(romsOption).toStdString();
        }
        if (parser.isSet(modeOption)) {
            config.policy = romaudit::parsePackagingPolicy(parser.value(modeOption).toStdString());
        }
        if (parser.isSet(threadsOption)) {
            bool ok = false;
            config.threads = parser.value(threadsOption).toInt(&ok);
            if (!ok || config.threads < 0) {
                throw romaudit::ConfigError("Invalid thread count '" +
                                            parser.value(threadsOption).toStdString() + "'");
            }
        }
        if (parser.isSet(reportOption)) {
            config.reportFile = parser.value(reportOption).toStdString();
        }
        if (parser.isSet(verbosityOption)) {
            config.logVerbosity = parser.value(verbosityOption).toStdString();
            if (!romaudit::AuditConfig::isValidVerbosity(config.logVerbosity)) {
                throw romaudit::ConfigError("Unknown log verbosity '" + config.logVerbosity + "'");
            }
        }
        if (parser.isSet(scanAllOption)) {
            config.scanWholeCollection = true;
        }
    } catch (const romaudit::ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    
    g_consoleSink->set_level(levelFromVerbosity(config.logVerbosity));
    
    const QStringList positional = parser.positionalArguments();
    const std::string command = positional.isEmpty() ? "verify" : positional.first().toStdString();
    
    std::vector<std::string> machines;
    for (const auto& name : parser.values(machineOption)) {
        machines.push_back(name.toStdString());
    }
    
    if (config.datFile.empty()) {
        spdlog::error("No DAT file given (--dat or datFile in the config)");
        return 1;
    }
    
    romaudit::MemoryCatalog catalog;
    auto imported = romaudit::dat::DatImporter::importFile(config.datFile, catalog);
    if (!imported.isSuccess()) {
        return 1;
    }
    if (!imported.header.name.empty()) {
        spdlog::info("Catalog: {} {}", imported.header.name, imported.header.version);
    }
    
    auto index = romaudit::ChecksumIndex::build(catalog);
    romaudit::ResolutionEngine resolver(catalog, index);
    romaudit::QueryEngine queries(catalog, resolver);
    
    if (command == "verify") {
        return runVerify(config, resolver, machines);
    }
    if (command == "info") {
        return runInfo(resolver, machines, config.policy);
    }
    if (command == "usage") {
        return runUsage(queries, machines, parser.value(romOption).toStdString(), config.policy);
    }
    if (command == "shared") {
        for (const auto& [checksum, owners] : queries.sharedContent()) {
            std::cout << checksum.toString() << ":";
            for (const auto& owner : owners) {
                std::cout << " " << owner;
            }
            std::cout << "\n";
        }
        return 0;
    }
    if (command == "derivable") {
        for (const auto& derivable : queries.derivableSets()) {
            std::cout << derivable.machine << " <- " << derivable.ancestor
                      << " (" << derivable.newParts.size() << " new parts)\n";
        }
        return 0;
    }
    if (command == "stats") {
        std::cout << romaudit::toJson(queries.stats()).dump(2) << "\n";
        return 0;
    }
    
    spdlog::error("Unknown command '{}'", command);
    return 1;
}
