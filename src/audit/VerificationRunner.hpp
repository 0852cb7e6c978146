/**
 * ROM Audit - Verification Runner
 * 
 * Verifies many machines in parallel on a thread pool.
 * 
 * SPDX-License-Identifier: GPL-3.0-or-later
 */

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ResolutionEngine.hpp"
#include "VerificationReport.hpp"
#include "archive/ArchiveReader.hpp"
#include "catalog/Checksum.hpp"

namespace romaudit {

/**
 * Result of a verification run
 * 
 * Reports are sorted by machine name. After a cancellation they cover the
 * machines that completed, each of them valid on its own.
 */
struct RunSummary {
    PackagingPolicy policy = PackagingPolicy::NonMerged;
    size_t requested = 0;
    bool cancelled = false;
    size_t hashComputations = 0;
    std::vector<VerificationReport> reports;
    
    size_t countMachines(MachineStatus status) const;
};

/**
 * Runner options
 */
struct RunnerOptions {
    int threads = 0;                    // 0 = QThread::idealThreadCount()
    bool scanWholeCollection = false;
};

/**
 * Called from worker threads after each machine
 * 
 * Calls may run concurrently; done counts finished machines at the time of
 * the call.
 */
using ProgressCallback = std::function<void(const VerificationReport& report, size_t done, size_t total)>;

class VerificationRunner {
public:
    VerificationRunner(
        const ResolutionEngine& resolver,
        const ArchiveReader& reader,
        RunnerOptions options = {},
        ChecksumFunction checksumFunction = {}
    );
    
    /**
     * Verify the given machines, each against its own archive in the reader
     */
    RunSummary run(
        const std::vector<std::string>& machineIds,
        PackagingPolicy policy,
        ProgressCallback progress = {}
    );
    
    /**
     * Stop scheduling machines; hashes already running finish
     */
    void cancel() { m_cancelled = true; }
    bool isCancelled() const { return m_cancelled.load(); }
    
private:
    const ResolutionEngine& m_resolver;
    const ArchiveReader& m_reader;
    RunnerOptions m_options;
    ChecksumFunction m_checksumFunction;
    std::atomic<bool> m_cancelled{false};
};

nlohmann::json toJson(const RunSummary& summary);

} // namespace romaudit
