#include "runs/run_service.hpp"

#include "process/worker_env.hpp"

#include <chrono>
#include <unistd.h>
#include <utility>

RunService::RunService(const Config& config)
    : RunService(config, environmentFrom(environ)) {}

RunService::RunService(const Config& config, std::vector<std::string> baseEnv)
    : config_(config), baseEnv_(std::move(baseEnv)) {
    if (!config_.serviceLogPath.empty()) {
        logger_.openFile(config_.serviceLogPath);
    }
    logEvent(logger_, "", "Run service started, worker=" + config_.workerExecutable +
                          " root=" + config_.projectRoot);
}

RunService::~RunService() {
    shutdown();
}

StartResult RunService::start(const RunParams& params) {
    std::string runId = registry_.create(params);
    std::shared_ptr<RunRecord> record = registry_.find(runId);

    SupervisorOptions options;
    options.workerExecutable = config_.workerExecutable;
    options.workerArgs = config_.workerArgs;
    options.projectRoot = config_.projectRoot;
    options.baseEnv = baseEnv_;
    options.stopGrace = std::chrono::milliseconds(config_.stopGraceMs);

    StartResult result;
    result.runId = runId;
    {
        std::lock_guard<std::mutex> lock(record->mutex);
        result.status = record->status;
    }

    reapFinished();
    auto supervisor = std::make_shared<RunSupervisor>(record, std::move(options), logger_);
    {
        std::lock_guard<std::mutex> lock(supervisorsMutex_);
        supervisors_.emplace(runId, supervisor);
    }
    logEvent(logger_, runId, "Run created");
    supervisor->start();
    return result;
}

bool RunService::status(const std::string& runId, RunSnapshot& out) const {
    std::shared_ptr<RunRecord> record = registry_.find(runId);
    if (!record) {
        return false;
    }
    out = takeSnapshot(*record, static_cast<std::size_t>(config_.logTailLines));
    return true;
}

bool RunService::stop(const std::string& runId, StopResult& out) {
    std::shared_ptr<RunRecord> record = registry_.find(runId);
    if (!record) {
        return false;
    }
    std::shared_ptr<RunSupervisor> supervisor = supervisorFor(runId);
    if (supervisor) {
        supervisor->stop();
    } else {
        // Supervisor already reclaimed; its worker has been reaped.
        {
            std::lock_guard<std::mutex> lock(record->mutex);
            record->status = RunStatus::Stopped;
            record->process.reset();
        }
        logEvent(logger_, runId, "Stop requested, no live worker");
    }
    out.runId = runId;
    out.status = RunStatus::Stopped;
    return true;
}

std::shared_ptr<RunSupervisor> RunService::supervisorFor(const std::string& runId) const {
    std::lock_guard<std::mutex> lock(supervisorsMutex_);
    auto it = supervisors_.find(runId);
    return it == supervisors_.end() ? nullptr : it->second;
}

std::size_t RunService::reapFinished() {
    std::vector<std::shared_ptr<RunSupervisor>> finished;
    {
        std::lock_guard<std::mutex> lock(supervisorsMutex_);
        for (auto it = supervisors_.begin(); it != supervisors_.end();) {
            if (it->second->done()) {
                finished.push_back(std::move(it->second));
                it = supervisors_.erase(it);
            } else {
                ++it;
            }
        }
    }
    // Joined outside the map lock; a concurrent stop() may still hold a reference.
    for (auto& supervisor : finished) {
        supervisor->join();
    }
    return finished.size();
}

std::size_t RunService::activeSupervisors() const {
    std::lock_guard<std::mutex> lock(supervisorsMutex_);
    return supervisors_.size();
}

void RunService::shutdown() {
    std::unordered_map<std::string, std::shared_ptr<RunSupervisor>> owned;
    {
        std::lock_guard<std::mutex> lock(supervisorsMutex_);
        owned.swap(supervisors_);
    }
    if (owned.empty()) {
        return;
    }
    for (auto& entry : owned) {
        std::shared_ptr<RunRecord> record = registry_.find(entry.first);
        bool running = false;
        if (record) {
            std::lock_guard<std::mutex> lock(record->mutex);
            running = !isTerminal(record->status);
        }
        if (running) {
            entry.second->stop();
        } else {
            // Finished through SIMULATION_COMPLETE but the worker is still up.
            entry.second->release();
        }
    }
    for (auto& entry : owned) {
        entry.second->join();
    }
    logEvent(logger_, "", "Run service shut down, runs=" + std::to_string(registry_.size()));
}
