#pragma once

#include "model/run_params.hpp"
#include "model/run_stats.hpp"

#include <string>

/** @brief Result of folding one worker line into the statistics. */
struct LineOutcome {
    RunStats stats;
    bool complete{false}; // line was SIMULATION_COMPLETE
};

/**
 * @brief Fold one line of worker output into a copy of the current statistics.
 *
 * Recognized forms (after trimming, prefix match, case sensitive):
 *   "... GREEN TS ..." / "... YELLOW TS ..."      -> phase
 *   "LANE_STATS lane=<n> total=.. car=.. ..."     -> lane total + detail
 *   "Lane <n>: ... Total: <count>"                -> lane total only
 *   "Total vehicles passed: <x>"                  -> totalVehicles
 *   "Total time passed: <x>"                      -> totalTime, recompute
 *   "No. of vehicles passed per unit time: <x>"   -> throughput, recompute
 *   "SUMMARY total=.. time=.. throughput=.."      -> overwrites, recompute
 *   "SIMULATION_COMPLETE"                         -> complete = true
 * Anything else is inert. A recognized line that fails to parse contributes
 * nothing (the recompute step of the three recompute forms still runs).
 */
LineOutcome applyLine(const std::string& line, const RunStats& current, const RunParams& params);

/** @brief Recompute averageWait, theoreticalCapacity, trafficDensity and congestionLevel. */
void recomputeDerivedMetrics(RunStats& stats, const RunParams& params);

/** @brief Round to the given number of decimal places, ties to even. */
double roundTo(double value, int decimals);
