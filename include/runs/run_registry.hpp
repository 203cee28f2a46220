#pragma once

#include "model/run_params.hpp"
#include "model/run_record.hpp"
#include "util/random.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

/**
 * @brief Thread-safe map from run identifier to RunRecord.
 *
 * The registry mutex only guards the map itself; each record carries its own
 * mutex for status/log/stats/process so distinct runs never contend.
 * Records are kept for the lifetime of the registry.
 */
class RunRegistry {
public:
    RunRegistry();

    /** @brief Deterministic identifiers, for tests. */
    explicit RunRegistry(std::uint64_t seed);

    /**
     * @brief Register a new run in Running status with zeroed statistics.
     * @return the freshly allocated identifier.
     */
    std::string create(const RunParams& params);

    /** @brief Record for @p id, or nullptr when unknown. */
    std::shared_ptr<RunRecord> find(const std::string& id) const;

    /** @brief Number of registered runs. */
    std::size_t size() const;

    /** @brief Identifiers in creation order. */
    std::vector<std::string> ids() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<RunRecord>> runs_;
    std::vector<std::string> order_;
    RandomGenerator rng_;
};
