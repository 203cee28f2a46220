#pragma once

/** @brief Simulation parameters handed to the worker through its environment. */
struct RunParams {
    int simTime{120};
    int minGreen{10};
    int maxGreen{60};
};
