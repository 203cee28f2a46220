/**
 * @file test_stats_aggregator.cpp
 * @brief Unit tests for folding worker output lines into RunStats
 */

#include <gtest/gtest.h>

#include "model/run_params.hpp"
#include "model/run_stats.hpp"
#include "telemetry/stats_aggregator.hpp"

#include <string>
#include <vector>

namespace {

RunParams paramsWithSimTime(int simTime) {
    RunParams params;
    params.simTime = simTime;
    return params;
}

RunStats feed(const std::vector<std::string>& lines, const RunParams& params) {
    RunStats stats;
    for (const auto& line : lines) {
        stats = applyLine(line, stats, params).stats;
    }
    return stats;
}

void expectSameStats(const RunStats& a, const RunStats& b) {
    EXPECT_EQ(a.phase, b.phase);
    EXPECT_EQ(a.laneTotals, b.laneTotals);
    for (int i = 0; i < kLaneCount; ++i) {
        EXPECT_EQ(a.laneDetails[i].total, b.laneDetails[i].total);
        EXPECT_EQ(a.laneDetails[i].car, b.laneDetails[i].car);
        EXPECT_EQ(a.laneDetails[i].bike, b.laneDetails[i].bike);
    }
    EXPECT_EQ(a.totalVehicles, b.totalVehicles);
    EXPECT_EQ(a.totalTime, b.totalTime);
    EXPECT_DOUBLE_EQ(a.throughput, b.throughput);
    EXPECT_DOUBLE_EQ(a.averageWait, b.averageWait);
    EXPECT_EQ(a.theoreticalCapacity, b.theoreticalCapacity);
    EXPECT_DOUBLE_EQ(a.trafficDensity, b.trafficDensity);
    EXPECT_DOUBLE_EQ(a.congestionLevel, b.congestionLevel);
}

} // namespace

// =============================================================================
// Grammar rules
// =============================================================================

TEST(StatsAggregator, ReferenceScenario) {
    RunStats stats = feed({"LANE_STATS lane=1 total=10 car=8 bus=1 truck=1 rickshaw=0 bike=0",
                           "Total vehicles passed: 10",
                           "Total time passed: 50"},
                          paramsWithSimTime(100));
    EXPECT_EQ(laneTotal(stats, 1), 10);
    EXPECT_EQ(stats.laneDetails[0].car, 8);
    EXPECT_EQ(stats.laneDetails[0].bus, 1);
    EXPECT_EQ(stats.laneDetails[0].truck, 1);
    EXPECT_EQ(stats.totalVehicles, 10);
    EXPECT_EQ(stats.totalTime, 50);
    EXPECT_DOUBLE_EQ(stats.averageWait, 5.0);
    EXPECT_EQ(stats.theoreticalCapacity, 400);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 2.5);
    EXPECT_DOUBLE_EQ(stats.congestionLevel, 2.5);
}

TEST(StatsAggregator, PhaseLinesAreRecordedVerbatim) {
    RunParams params;
    RunStats stats = feed({"  GREEN TS 2 -> r=5 y=3 g=20  "}, params);
    EXPECT_EQ(stats.phase, "GREEN TS 2 -> r=5 y=3 g=20");

    stats = applyLine("YELLOW TS 2 -> r=5 y=3 g=20", stats, params).stats;
    EXPECT_EQ(stats.phase, "YELLOW TS 2 -> r=5 y=3 g=20");

    // RED lines leave the last green/yellow phase in place.
    stats = applyLine("RED TS 1 -> r=25 y=3 g=20", stats, params).stats;
    EXPECT_EQ(stats.phase, "YELLOW TS 2 -> r=5 y=3 g=20");
}

TEST(StatsAggregator, LaneStatsLastWriteWinsPerLane) {
    RunStats stats = feed({"LANE_STATS lane=1 total=3",
                           "LANE_STATS lane=2 total=7",
                           "LANE_STATS lane=1 total=5",
                           "LANE_STATS lane=4 total=1",
                           "LANE_STATS lane=2 total=2"},
                          RunParams{});
    EXPECT_EQ(laneTotal(stats, 1), 5);
    EXPECT_EQ(laneTotal(stats, 2), 2);
    EXPECT_EQ(laneTotal(stats, 3), 0);
    EXPECT_EQ(laneTotal(stats, 4), 1);
}

TEST(StatsAggregator, LaneStatsMissingFieldsDefaultToZero) {
    RunStats stats = feed({"LANE_STATS lane=3 total=4 car=4"}, RunParams{});
    EXPECT_EQ(stats.laneDetails[2].total, 4);
    EXPECT_EQ(stats.laneDetails[2].car, 4);
    EXPECT_EQ(stats.laneDetails[2].bus, 0);
    EXPECT_EQ(stats.laneDetails[2].rickshaw, 0);
}

TEST(StatsAggregator, LaneOutsideRangeIgnored) {
    RunStats before = feed({"LANE_STATS lane=1 total=3"}, RunParams{});
    RunStats after = applyLine("LANE_STATS lane=5 total=9", before, RunParams{}).stats;
    expectSameStats(before, after);
    after = applyLine("LANE_STATS lane=0 total=9", before, RunParams{}).stats;
    expectSameStats(before, after);
}

TEST(StatsAggregator, LaneSummaryLineSetsTotal) {
    RunStats stats = feed({"Lane 2: Total: 38"}, RunParams{});
    EXPECT_EQ(laneTotal(stats, 2), 38);
    EXPECT_EQ(laneTotal(stats, 1), 0);
}

TEST(StatsAggregator, TotalVehiclesDoesNotRecompute) {
    RunStats stats = feed({"Total vehicles passed: 40"}, paramsWithSimTime(10));
    EXPECT_EQ(stats.totalVehicles, 40);
    EXPECT_EQ(stats.theoreticalCapacity, 0);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 0.0);
}

TEST(StatsAggregator, ThroughputRecomputesDerivedMetrics) {
    RunStats stats = feed({"Total vehicles passed: 20",
                           "No. of vehicles passed per unit time: 0.333"},
                          paramsWithSimTime(10));
    EXPECT_DOUBLE_EQ(stats.throughput, 0.333);
    EXPECT_EQ(stats.theoreticalCapacity, 40);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 50.0);
}

TEST(StatsAggregator, SummaryOverwritesPresentKeysOnly) {
    RunStats stats = feed({"Total time passed: 60",
                           "SUMMARY total=30 throughput=0.5"},
                          paramsWithSimTime(60));
    EXPECT_EQ(stats.totalVehicles, 30);
    EXPECT_EQ(stats.totalTime, 60);
    EXPECT_DOUBLE_EQ(stats.throughput, 0.5);
    EXPECT_DOUBLE_EQ(stats.averageWait, 2.0);
    EXPECT_EQ(stats.theoreticalCapacity, 240);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 12.5);
}

TEST(StatsAggregator, AverageWaitRoundedToTwoDecimals) {
    RunStats stats = feed({"Total vehicles passed: 3", "Total time passed: 10"}, RunParams{});
    EXPECT_DOUBLE_EQ(stats.averageWait, 3.33);
}

TEST(StatsAggregator, CompletionLineFlagged) {
    RunStats stats;
    LineOutcome outcome = applyLine("SIMULATION_COMPLETE", stats, RunParams{});
    EXPECT_TRUE(outcome.complete);
    EXPECT_FALSE(applyLine("Total time passed: 3", stats, RunParams{}).complete);
}

TEST(StatsAggregator, UnrecognizedLinesIgnored) {
    RunStats before = feed({"LANE_STATS lane=1 total=3"}, RunParams{});
    for (const char* line : {"", "   ", "pygame 2.5.0", "Traceback (most recent call last):"}) {
        LineOutcome outcome = applyLine(line, before, RunParams{});
        expectSameStats(before, outcome.stats);
        EXPECT_FALSE(outcome.complete);
    }
}

// =============================================================================
// Malformed input
// =============================================================================

TEST(StatsAggregator, MalformedLaneStatsLeavesStatsUnchanged) {
    RunStats before = feed({"LANE_STATS lane=1 total=3", "Total vehicles passed: 3"}, RunParams{});
    for (const char* line : {"LANE_STATS lane=1 total=abc",
                             "LANE_STATS lane=x total=4",
                             "LANE_STATS lane=1 garbage",
                             "LANE_STATS lane=1 total=4=5"}) {
        RunStats after = applyLine(line, before, RunParams{}).stats;
        expectSameStats(before, after);
    }
}

TEST(StatsAggregator, MalformedSummaryChangesNothingButDerived) {
    RunParams params = paramsWithSimTime(10);
    RunStats before = feed({"Total vehicles passed: 8", "Total time passed: 16"}, params);
    RunStats after = applyLine("SUMMARY total=99 time=oops", before, params).stats;
    expectSameStats(before, after);
}

TEST(StatsAggregator, MalformedScalarsLeaveValues) {
    RunParams params = paramsWithSimTime(10);
    RunStats before = feed({"Total vehicles passed: 8", "Total time passed: 16"}, params);
    expectSameStats(before, applyLine("Total vehicles passed: many", before, params).stats);
    expectSameStats(before, applyLine("Total time passed: -4", before, params).stats);
    expectSameStats(before, applyLine("No. of vehicles passed per unit time: fast", before, params).stats);
    expectSameStats(before, applyLine("Lane 1: Total: lots", before, params).stats);
}

TEST(StatsAggregator, InputStatsAreNotModified) {
    RunStats current;
    RunParams params;
    LineOutcome outcome = applyLine("Total vehicles passed: 10", current, params);
    EXPECT_EQ(outcome.stats.totalVehicles, 10);
    EXPECT_EQ(current.totalVehicles, 0);
}

// =============================================================================
// Derived metric properties
// =============================================================================

TEST(StatsAggregator, AverageWaitZeroWithoutVehicles) {
    RunStats stats = feed({"Total time passed: 90"}, RunParams{});
    EXPECT_EQ(stats.totalVehicles, 0);
    EXPECT_DOUBLE_EQ(stats.averageWait, 0.0);
}

TEST(StatsAggregator, DensityClampedToHundred) {
    RunParams params = paramsWithSimTime(1);
    for (int vehicles : {0, 1, 4, 5, 1000, 2000000000}) {
        RunStats stats;
        stats.totalVehicles = vehicles;
        stats.totalTime = 1;
        recomputeDerivedMetrics(stats, params);
        EXPECT_GE(stats.trafficDensity, 0.0);
        EXPECT_LE(stats.trafficDensity, 100.0);
        EXPECT_GE(stats.averageWait, 0.0);
    }
    RunStats full;
    full.totalVehicles = 1000;
    recomputeDerivedMetrics(full, params);
    EXPECT_DOUBLE_EQ(full.trafficDensity, 100.0);
}

TEST(StatsAggregator, CapacityFloorOfOne) {
    RunStats stats;
    stats.totalVehicles = 3;
    recomputeDerivedMetrics(stats, paramsWithSimTime(0));
    EXPECT_EQ(stats.theoreticalCapacity, 1);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 100.0);

    recomputeDerivedMetrics(stats, paramsWithSimTime(-5));
    EXPECT_EQ(stats.theoreticalCapacity, 1);
}

TEST(StatsAggregator, RoundTiesToEven) {
    EXPECT_DOUBLE_EQ(roundTo(2.25, 1), 2.2);
    EXPECT_DOUBLE_EQ(roundTo(0.125, 2), 0.12);
    EXPECT_DOUBLE_EQ(roundTo(0.375, 2), 0.38);
    EXPECT_DOUBLE_EQ(roundTo(2.5, 0), 2.0);
    EXPECT_DOUBLE_EQ(roundTo(3.5, 0), 4.0);
    EXPECT_DOUBLE_EQ(roundTo(3.333333, 2), 3.33);
}

TEST(StatsAggregator, DerivedMetricTiesRoundToEven) {
    RunParams params = paramsWithSimTime(100);
    RunStats stats = applyLine("SUMMARY total=8 time=1", RunStats{}, params).stats;
    EXPECT_DOUBLE_EQ(stats.averageWait, 0.12);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 2.0);

    stats = applyLine("SUMMARY total=1 time=1", RunStats{}, params).stats;
    EXPECT_DOUBLE_EQ(stats.averageWait, 1.0);
    EXPECT_DOUBLE_EQ(stats.trafficDensity, 0.2);
    EXPECT_DOUBLE_EQ(stats.congestionLevel, 0.2);
}
