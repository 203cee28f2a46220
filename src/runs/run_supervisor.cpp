#include "runs/run_supervisor.hpp"

#include "process/worker_env.hpp"
#include "telemetry/stats_aggregator.hpp"

#include <exception>
#include <stdexcept>
#include <mutex>
#include <utility>

namespace {
const char* kStopRequestedLine = "[system] stop requested by user";
const char* kHaltedLine = "[system] simulation halted by user";
const char* kBackendErrorPrefix = "[backend error] ";
} // namespace

RunSupervisor::RunSupervisor(std::shared_ptr<RunRecord> record, SupervisorOptions options, Logger& logger)
    : record_(std::move(record)), options_(std::move(options)), logger_(logger) {}

RunSupervisor::~RunSupervisor() {
    join();
}

void RunSupervisor::start() {
    reader_ = std::thread(&RunSupervisor::run, this);
}

void RunSupervisor::join() {
    if (reader_.joinable()) {
        reader_.join();
    }
}

SpawnRequest RunSupervisor::buildSpawnRequest() const {
    SpawnRequest request;
    request.executable = options_.workerExecutable;
    request.args = options_.workerArgs;
    request.env = buildWorkerEnvironment(record_->params, options_.baseEnv);
    request.workingDir = options_.projectRoot;
    return request;
}

void RunSupervisor::run() {
    supervise();
    done_.store(true);
}

// Reader thread body: spawn, pump, finalize. Nothing escapes this function.
void RunSupervisor::supervise() {
    std::shared_ptr<WorkerProcess> process;
    try {
        process = std::make_shared<WorkerProcess>();
        std::string err;
        if (!process->spawn(buildSpawnRequest(), err)) {
            process.reset();
            fail(err);
            return;
        }
        logEvent(logger_, record_->id,
                 "Worker spawned pid=" + std::to_string(process->pid()) +
                 " simTime=" + std::to_string(record_->params.simTime) +
                 " minGreen=" + std::to_string(record_->params.minGreen) +
                 " maxGreen=" + std::to_string(record_->params.maxGreen));

        bool stoppedEarly = false;
        {
            std::lock_guard<std::mutex> lock(record_->mutex);
            if (record_->status == RunStatus::Stopped) {
                stoppedEarly = true;
            } else {
                record_->process = process;
            }
        }
        if (stoppedEarly) {
            // stop() ran before the worker existed; it never saw a handle to signal.
            logEvent(logger_, record_->id, "Stop arrived before spawn completed, killing worker");
            process->kill();
        }

        pumpOutput(*process);
        int exitCode = process->waitExit();
        finalize(exitCode);
    } catch (const std::exception& ex) {
        releaseWorker(process);
        fail(ex.what());
    } catch (...) {
        releaseWorker(process);
        fail("unknown error");
    }
}

void RunSupervisor::pumpOutput(WorkerProcess& process) {
    std::string line;
    std::string err;
    while (true) {
        ReadStatus rs = process.readLine(line, err);
        if (rs == ReadStatus::Eof) {
            return;
        }
        if (rs == ReadStatus::Error) {
            throw std::runtime_error(err);
        }
        handleLine(line);
    }
}

void RunSupervisor::handleLine(const std::string& line) {
    bool completed = false;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        record_->log.push_back(line);
        LineOutcome outcome = applyLine(line, record_->stats, record_->params);
        record_->stats = outcome.stats;
        if (outcome.complete && !isTerminal(record_->status)) {
            record_->status = RunStatus::Finished;
            completed = true;
        }
    }
    if (completed) {
        logEvent(logger_, record_->id, "Worker reported SIMULATION_COMPLETE");
    }
}

void RunSupervisor::finalize(int exitCode) {
    RunStatus finalStatus;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        if (record_->status == RunStatus::Stopped) {
            record_->log.push_back(kHaltedLine);
        } else if (!isTerminal(record_->status)) {
            record_->status = exitCode == 0 ? RunStatus::Finished : RunStatus::Error;
        }
        record_->process.reset();
        finalStatus = record_->status;
    }
    logEvent(logger_, record_->id,
             "Worker exited code=" + std::to_string(exitCode) + " status=" + runStatusName(finalStatus));
}

void RunSupervisor::fail(const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        record_->log.push_back(kBackendErrorPrefix + message);
        if (record_->status != RunStatus::Stopped) {
            record_->status = RunStatus::Error;
        }
        record_->process.reset();
    }
    logEvent(logger_, record_->id, "Backend error: " + message);
}

void RunSupervisor::releaseWorker(const std::shared_ptr<WorkerProcess>& process) {
    if (!process || process->pid() <= 0 || process->hasExited()) {
        return;
    }
    process->kill();
    process->waitExit();
}

void RunSupervisor::stop() {
    std::shared_ptr<WorkerProcess> process;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        if (record_->process && record_->process->isAlive()) {
            record_->log.push_back(kStopRequestedLine);
            process = record_->process;
        }
        record_->status = RunStatus::Stopped;
        record_->process.reset();
    }
    if (!process) {
        logEvent(logger_, record_->id, "Stop requested, no live worker");
        return;
    }
    logEvent(logger_, record_->id, "Stop requested, SIGTERM to pid=" + std::to_string(process->pid()));
    endWorker(process);
}

void RunSupervisor::release() {
    std::shared_ptr<WorkerProcess> process;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        if (record_->process && record_->process->isAlive()) {
            process = record_->process;
        }
    }
    if (!process) {
        return;
    }
    logEvent(logger_, record_->id, "Releasing lingering worker, SIGTERM to pid=" + std::to_string(process->pid()));
    endWorker(process);
}

void RunSupervisor::endWorker(const std::shared_ptr<WorkerProcess>& process) {
    process->terminate();
    if (!process->waitForExit(options_.stopGrace)) {
        process->kill();
        logEvent(logger_, record_->id, "Force killed worker pid=" + std::to_string(process->pid()));
    }
}
