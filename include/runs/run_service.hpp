#pragma once

#include "logging/logger.hpp"
#include "model/config.hpp"
#include "model/run_params.hpp"
#include "model/run_record.hpp"
#include "runs/run_registry.hpp"
#include "runs/run_supervisor.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

struct StartResult {
    std::string runId;
    RunStatus status{RunStatus::Running};
};

struct StopResult {
    std::string runId;
    RunStatus status{RunStatus::Stopped};
};

/**
 * @brief Operations the web layer calls: start, status, stop.
 *
 * Constructed once at process start and passed by reference to request
 * handlers. Owns the registry, the service log and one RunSupervisor per run.
 */
class RunService {
public:
    /** @brief Workers inherit this process's environment. */
    explicit RunService(const Config& config);

    /** @brief Workers start from @p baseEnv instead of this process's environment. */
    RunService(const Config& config, std::vector<std::string> baseEnv);

    /** @brief Stops runs that are still going and joins every reader thread. */
    ~RunService();

    RunService(const RunService&) = delete;
    RunService& operator=(const RunService&) = delete;

    /**
     * @brief Register a run and launch its worker asynchronously.
     * @return identifier and the initial status (Running).
     */
    StartResult start(const RunParams& params);

    /**
     * @brief Consistent snapshot with the last logTailLines log lines.
     * @return false when @p runId is unknown.
     */
    bool status(const std::string& runId, RunSnapshot& out) const;

    /**
     * @brief Request termination of a run; idempotent for runs that already ended.
     * @return false when @p runId is unknown.
     */
    bool stop(const std::string& runId, StopResult& out);

    /**
     * @brief Stop runs still Running, end workers that outlive a finished run,
     * and wait for all reader threads.
     */
    void shutdown();

    /**
     * @brief Join and drop supervisors whose reader thread has finished.
     * Called by start(); records stay in the registry.
     * @return number of supervisors reclaimed.
     */
    std::size_t reapFinished();

    /** @brief Supervisors not yet reclaimed. */
    std::size_t activeSupervisors() const;

    const RunRegistry& registry() const { return registry_; }

private:
    std::shared_ptr<RunSupervisor> supervisorFor(const std::string& runId) const;

    Config config_;
    std::vector<std::string> baseEnv_;
    Logger logger_;
    RunRegistry registry_;
    mutable std::mutex supervisorsMutex_;
    std::unordered_map<std::string, std::shared_ptr<RunSupervisor>> supervisors_;
};
