/**
 * ROM Audit - Verification Runner Implementation
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#include "VerificationRunner.hpp"
#include "ArchiveCollectionView.hpp"
#include "VerificationEngine.hpp"
#include "archive/ContentHasher.hpp"

#include <QFuture>
#include <QMutex>
#include <QMutexLocker>
#include <QThread>
#include <QThreadPool>
#include <QtConcurrent>

#include <algorithm>
#include <optional>

#include <spdlog/spdlog.h>

namespace romaudit {

size_t RunSummary::countMachines(MachineStatus status) const {
    return static_cast<size_t>(std::count_if(reports.begin(), reports.end(), [status](const VerificationReport& report) {
        return report.status == status;
    }));
}

VerificationRunner::VerificationRunner(
    const ResolutionEngine& resolver,
    const ArchiveReader& reader,
    RunnerOptions options,
    ChecksumFunction checksumFunction
)
    : m_resolver(resolver)
    , m_reader(reader)
    , m_options(options)
    , m_checksumFunction(checksumFunction ? std::move(checksumFunction)
                                          : ContentHasher::defaultChecksumFunction())
{
}

RunSummary VerificationRunner::run(
    const std::vector<std::string>& machineIds,
    PackagingPolicy policy,
    ProgressCallback progress
) {
    m_cancelled = false;
    
    RunSummary summary;
    summary.policy = policy;
    summary.requested = machineIds.size();
    
    QThreadPool pool;
    pool.setMaxThreadCount(m_options.threads > 0 ? m_options.threads : QThread::idealThreadCount());
    
    ContentHasher hasher(m_checksumFunction);
    ArchiveCollectionView collection(m_reader, hasher, m_resolver, m_options.scanWholeCollection);
    VerificationEngine engine(m_resolver, hasher);
    
    spdlog::info("Verifying {} machines ({}, {} threads)", machineIds.size(),
                 policyName(policy), pool.maxThreadCount());
    
    QMutex progressMutex;
    size_t done = 0;
    const size_t total = machineIds.size();
    
    std::vector<QFuture<std::optional<VerificationReport>>> futures;
    futures.reserve(machineIds.size());
    
    for (const auto& machineId : machineIds) {
        futures.push_back(QtConcurrent::run(&pool, [&, machineId]() -> std::optional<VerificationReport> {
            if (m_cancelled) {
                return std::nullopt;
            }
            
            auto report = engine.verify(machineId, m_reader.entries(machineId), policy, &collection);
            
            size_t finished = 0;
            {
                QMutexLocker locker(&progressMutex);
                finished = ++done;
            }
            if (progress) {
                progress(report, finished, total);
            }
            return report;
        }));
    }
    
    for (auto& future : futures) {
        future.waitForFinished();
        auto report = future.result();
        if (report) {
            summary.reports.push_back(std::move(*report));
        }
    }
    
    std::sort(summary.reports.begin(), summary.reports.end(),
              [](const VerificationReport& a, const VerificationReport& b) {
                  return a.machine < b.machine;
              });
    
    summary.cancelled = summary.reports.size() < summary.requested;
    summary.hashComputations = hasher.computations();
    
    spdlog::info("Verification {}: {} complete, {} fixable, {} incomplete, {} errors",
                 summary.cancelled ? "cancelled" : "finished",
                 summary.countMachines(MachineStatus::Complete),
                 summary.countMachines(MachineStatus::Fixable),
                 summary.countMachines(MachineStatus::Incomplete),
                 summary.countMachines(MachineStatus::CatalogError) +
                     summary.countMachines(MachineStatus::NotInCatalog));
    return summary;
}

nlohmann::json toJson(const RunSummary& summary) {
    nlohmann::json j;
    j["policy"] = policyName(summary.policy);
    j["requested"] = summary.requested;
    j["verified"] = summary.reports.size();
    j["cancelled"] = summary.cancelled;
    j["complete"] = summary.countMachines(MachineStatus::Complete);
    j["fixable"] = summary.countMachines(MachineStatus::Fixable);
    j["incomplete"] = summary.countMachines(MachineStatus::Incomplete);
    j["catalogErrors"] = summary.countMachines(MachineStatus::CatalogError);
    j["notInCatalog"] = summary.countMachines(MachineStatus::NotInCatalog);
    
    nlohmann::json reports = nlohmann::json::array();
    for (const auto& report : summary.reports) {
        reports.push_back(toJson(report));
    }
    j["reports"] = reports;
    return j;
}

} // namespace romaudit
