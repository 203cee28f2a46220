#pragma once

#include "model/run_record.hpp"

#include <ostream>
#include <string>

/** @brief Fixed-point text with the given number of decimals, e.g. 2.5 -> "2.50". */
std::string formatReal(double value, int decimals);

/**
 * @brief Human-readable report of a run: status, params, phase, lane table,
 * totals and derived metrics.
 */
void writeStatusReport(const RunSnapshot& snapshot, std::ostream& out);

/** @brief Only the statistics block of the report. */
void writeStatsReport(const RunStats& stats, std::ostream& out);
