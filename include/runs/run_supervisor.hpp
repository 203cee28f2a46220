#pragma once

#include "logging/logger.hpp"
#include "model/run_record.hpp"
#include "process/worker_process.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

/** @brief How workers are launched and stopped. */
struct SupervisorOptions {
    std::string workerExecutable;
    std::vector<std::string> workerArgs;
    std::string projectRoot;
    std::vector<std::string> baseEnv;
    std::chrono::milliseconds stopGrace{3000};
};

/**
 * @brief Owns the worker process of one run.
 *
 * start() launches the reader thread, which spawns the worker, folds each
 * output line into the record (log append, stats update, completion check as
 * one locked step) and finalizes status when the output closes. stop() may be
 * called from any thread; it pins the status to Stopped before signalling so
 * the reader's exit handling cannot overwrite it.
 */
class RunSupervisor {
public:
    RunSupervisor(std::shared_ptr<RunRecord> record, SupervisorOptions options, Logger& logger);

    /** @brief Joins the reader thread; callers stop() long-running workers first. */
    ~RunSupervisor();

    RunSupervisor(const RunSupervisor&) = delete;
    RunSupervisor& operator=(const RunSupervisor&) = delete;

    /** @brief Launch the reader thread. Returns immediately; the run proceeds asynchronously. */
    void start();

    /**
     * @brief Best-effort termination: SIGTERM, up to stopGrace for exit, then SIGKILL.
     *
     * Always leaves status Stopped and the process handle cleared, also for
     * runs that already ended.
     */
    void stop();

    /**
     * @brief End a worker that outlives its run (e.g. still running after
     * SIMULATION_COMPLETE). SIGTERM, stopGrace, then SIGKILL; status is left as is.
     */
    void release();

    /** @brief Wait for the reader thread to finish. */
    void join();

    /** @brief True once the reader thread has finalized the run; join() then returns promptly. */
    bool done() const { return done_.load(); }

    const std::string& runId() const { return record_->id; }

private:
    void run();
    void supervise();
    SpawnRequest buildSpawnRequest() const;
    void pumpOutput(WorkerProcess& process);
    void handleLine(const std::string& line);
    void finalize(int exitCode);
    void fail(const std::string& message);
    void releaseWorker(const std::shared_ptr<WorkerProcess>& process);
    void endWorker(const std::shared_ptr<WorkerProcess>& process);

    std::shared_ptr<RunRecord> record_;
    SupervisorOptions options_;
    Logger& logger_;
    std::thread reader_;
    std::atomic<bool> done_{false};
};
