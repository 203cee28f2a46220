#pragma once

#include "model/run_params.hpp"
#include "model/run_stats.hpp"
#include "model/types.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class WorkerProcess;

/**
 * @brief Owned state of one simulation run.
 *
 * id and params are fixed at construction. status, log, stats and process are
 * only touched with mutex held; the reader thread, stop requests and status
 * reads all go through it.
 */
struct RunRecord {
    RunRecord(std::string runId, const RunParams& runParams);

    const std::string id;
    const RunParams params;

    std::mutex mutex;
    RunStatus status{RunStatus::Running};
    std::vector<std::string> log;
    RunStats stats;
    std::shared_ptr<WorkerProcess> process; // null once the worker exited or was stopped
};

/** @brief Copy of a run captured under a single acquisition of its mutex. */
struct RunSnapshot {
    std::string id;
    RunStatus status{RunStatus::Running};
    RunParams params;
    std::vector<std::string> logTail;
    std::size_t logSize{0};
    RunStats stats;
};

/**
 * @brief Capture status, params, the last @p tailLines log lines and stats atomically.
 * The stored log is not modified.
 */
RunSnapshot takeSnapshot(RunRecord& record, std::size_t tailLines);

/** @brief Last @p count entries of @p lines (all of them if there are fewer). */
std::vector<std::string> tailOf(const std::vector<std::string>& lines, std::size_t count);
