#include "telemetry/stats_aggregator.hpp"

#include "telemetry/line_parser.hpp"

#include <algorithm>
#include <cmath>
#include <climits>
#include <map>
#include <vector>

namespace {
const char* kLaneStatsPrefix = "LANE_STATS";
const char* kLanePrefix = "Lane ";
const char* kTotalVehiclesPrefix = "Total vehicles passed";
const char* kTotalTimePrefix = "Total time passed";
const char* kThroughputPrefix = "No. of vehicles passed per unit time";
const char* kSummaryPrefix = "SUMMARY";
const char* kCompletePrefix = "SIMULATION_COMPLETE";

bool isPhaseLine(const std::string& line) {
    return line.find("GREEN TS") != std::string::npos ||
           line.find("YELLOW TS") != std::string::npos;
}

/** @brief Vehicle/time counts are non-negative; a fractional part is truncated. */
bool parseCount(const std::string& text, int& out) {
    int val = 0;
    if (!parseIntTruncated(text, val) || val < 0) return false;
    out = val;
    return true;
}

bool parseRate(const std::string& text, double& out) {
    double val = 0.0;
    if (!parseRealStrict(text, val) || val < 0.0) return false;
    out = val;
    return true;
}

/** @brief Key/value tokens following the first word of the line. */
bool tokensAfterKeyword(const std::string& line, std::map<std::string, std::string>& out) {
    auto words = splitWhitespace(line);
    if (words.empty()) return false;
    std::vector<std::string> tokens(words.begin() + 1, words.end());
    return parseKeyValueTokens(tokens, out);
}

/** @brief Integer field with a default of 0 when the key is absent. */
bool intField(const std::map<std::string, std::string>& data, const std::string& key, int& out) {
    auto it = data.find(key);
    if (it == data.end()) {
        out = 0;
        return true;
    }
    return parseIntStrict(it->second, out);
}

bool parseLaneStats(const std::string& line, int& lane, LaneDetail& detail) {
    std::map<std::string, std::string> data;
    if (!tokensAfterKeyword(line, data)) return false;
    LaneDetail parsed;
    int laneIdx = 0;
    if (!intField(data, "lane", laneIdx) ||
        !intField(data, "total", parsed.total) ||
        !intField(data, "car", parsed.car) ||
        !intField(data, "bus", parsed.bus) ||
        !intField(data, "truck", parsed.truck) ||
        !intField(data, "rickshaw", parsed.rickshaw) ||
        !intField(data, "bike", parsed.bike)) {
        return false;
    }
    lane = laneIdx;
    detail = parsed;
    return true;
}

// "Lane 1: Total: 38" -> lane 1, total 38
bool parseLaneTotal(const std::string& line, int& lane, int& total) {
    auto parts = split(line, ':');
    if (parts.size() < 3) return false;
    auto laneWords = splitWhitespace(parts[0]);
    if (laneWords.size() < 2) return false;
    int laneNum = 0;
    int totalVal = 0;
    if (!parseIntStrict(laneWords[1], laneNum) || !parseIntStrict(parts[2], totalVal)) {
        return false;
    }
    lane = laneNum;
    total = totalVal;
    return true;
}

struct SummaryValues {
    bool hasTotal{false};
    bool hasTime{false};
    bool hasThroughput{false};
    int total{0};
    int time{0};
    double throughput{0.0};
};

bool parseSummary(const std::string& line, SummaryValues& out) {
    std::map<std::string, std::string> data;
    if (!tokensAfterKeyword(line, data)) return false;
    SummaryValues parsed;
    auto it = data.find("total");
    if (it != data.end()) {
        if (!parseCount(it->second, parsed.total)) return false;
        parsed.hasTotal = true;
    }
    it = data.find("time");
    if (it != data.end()) {
        if (!parseCount(it->second, parsed.time)) return false;
        parsed.hasTime = true;
    }
    it = data.find("throughput");
    if (it != data.end()) {
        if (!parseRate(it->second, parsed.throughput)) return false;
        parsed.hasThroughput = true;
    }
    out = parsed;
    return true;
}
} // namespace

double roundTo(double value, int decimals) {
    double scale = std::pow(10.0, decimals);
    // Ties go to the even neighbour (default FE_TONEAREST): 0.125 -> 0.12, 0.25 -> 0.2.
    return std::nearbyint(value * scale) / scale;
}

void recomputeDerivedMetrics(RunStats& stats, const RunParams& params) {
    double avgWait = 0.0;
    if (stats.totalVehicles > 0) {
        avgWait = std::max(0.0, static_cast<double>(stats.totalTime) / stats.totalVehicles);
    }
    stats.averageWait = roundTo(avgWait, 2);

    long long capacity = static_cast<long long>(params.simTime) * 4;
    if (capacity < 1) capacity = 1;
    stats.theoreticalCapacity = static_cast<int>(std::min<long long>(capacity, INT_MAX));

    double densityRatio = std::min(1.0, static_cast<double>(stats.totalVehicles) / capacity);
    stats.trafficDensity = roundTo(densityRatio * 100.0, 1);
    stats.congestionLevel = stats.trafficDensity;
}

LineOutcome applyLine(const std::string& rawLine, const RunStats& current, const RunParams& params) {
    LineOutcome outcome;
    outcome.stats = current;
    RunStats& stats = outcome.stats;

    std::string line = trim(rawLine);
    if (line.empty()) {
        return outcome;
    }

    // RED lines are never stored so the displayed phase does not flicker between cycles.
    if (isPhaseLine(line)) {
        stats.phase = line;
    }

    if (startsWith(line, kLaneStatsPrefix)) {
        int lane = 0;
        LaneDetail detail;
        if (parseLaneStats(line, lane, detail) && isValidLane(lane)) {
            stats.laneTotals[lane - 1] = detail.total;
            stats.laneDetails[lane - 1] = detail;
        }
    }

    if (startsWith(line, kLanePrefix) && line.find("Total:") != std::string::npos) {
        int lane = 0;
        int total = 0;
        if (parseLaneTotal(line, lane, total) && isValidLane(lane)) {
            stats.laneTotals[lane - 1] = total;
        }
    }

    if (startsWith(line, kTotalVehiclesPrefix)) {
        std::string value;
        int parsed = 0;
        if (valueAfterColon(line, value) && parseCount(value, parsed)) {
            stats.totalVehicles = parsed;
        }
    }

    if (startsWith(line, kTotalTimePrefix)) {
        std::string value;
        int parsed = 0;
        if (valueAfterColon(line, value) && parseCount(value, parsed)) {
            stats.totalTime = parsed;
        }
        recomputeDerivedMetrics(stats, params);
    }

    if (startsWith(line, kThroughputPrefix)) {
        std::string value;
        double parsed = 0.0;
        if (valueAfterColon(line, value) && parseRate(value, parsed)) {
            stats.throughput = parsed;
        }
        recomputeDerivedMetrics(stats, params);
    }

    if (startsWith(line, kSummaryPrefix)) {
        SummaryValues summary;
        if (parseSummary(line, summary)) {
            if (summary.hasTotal) stats.totalVehicles = summary.total;
            if (summary.hasTime) stats.totalTime = summary.time;
            if (summary.hasThroughput) stats.throughput = summary.throughput;
        }
        recomputeDerivedMetrics(stats, params);
    }

    if (startsWith(line, kCompletePrefix)) {
        outcome.complete = true;
    }
    return outcome;
}
