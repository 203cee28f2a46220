#pragma once

#include "model/types.hpp"

#include <array>
#include <string>

/** @brief Per-vehicle-class counts for one lane, as reported by LANE_STATS. */
struct LaneDetail {
    int total{0};
    int car{0};
    int bus{0};
    int truck{0};
    int rickshaw{0};
    int bike{0};
};

/**
 * @brief Statistics folded from the worker's output.
 *
 * Lane arrays are indexed by lane - 1. Derived fields (averageWait,
 * theoreticalCapacity, trafficDensity, congestionLevel) are only rewritten by
 * recomputeDerivedMetrics().
 */
struct RunStats {
    std::string phase;
    std::array<int, kLaneCount> laneTotals{};
    std::array<LaneDetail, kLaneCount> laneDetails{};
    int totalVehicles{0};
    int totalTime{0};
    double throughput{0.0};
    double averageWait{0.0};
    int theoreticalCapacity{0};
    double trafficDensity{0.0};
    double congestionLevel{0.0};
};

/** @brief Total for a lane number (1..kLaneCount); 0 for anything else. */
int laneTotal(const RunStats& stats, int lane);

/** @brief Count for one vehicle class within a lane detail record. */
int classCount(const LaneDetail& detail, VehicleClass cls);
