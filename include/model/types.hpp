#pragma once

#include <string>

/** @brief Number of traffic approaches reported by the worker (lanes 1..4). */
constexpr int kLaneCount = 4;

enum class RunStatus {
    Running,
    Finished,
    Error,
    Stopped
};

enum class VehicleClass {
    Car,
    Bus,
    Truck,
    Rickshaw,
    Bike
};

/** @brief Lowercase status label used in reports and the service log. */
std::string runStatusName(RunStatus status);

/** @brief Finished, Error and Stopped are terminal. */
bool isTerminal(RunStatus status);

/** @brief True for lane numbers the worker can report (1..kLaneCount). */
bool isValidLane(int lane);
