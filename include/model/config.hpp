#pragma once

#include "model/run_params.hpp"

#include <string>
#include <vector>

struct Config {
    std::string workerExecutable;
    std::vector<std::string> workerArgs;
    std::string projectRoot;
    int logTailLines;
    int stopGraceMs;
    int pollIntervalMs;
    int defaultSimTime;
    int defaultMinGreen;
    int defaultMaxGreen;
    std::string serviceLogPath; // empty disables the service log
};

/** @brief Built-in defaults used when no config file is found. */
Config defaultConfig();

/** @brief Run parameters built from the configured defaults. */
RunParams defaultParams(const Config& cfg);

/**
 * @brief Load key/value pairs from a config file on top of defaultConfig().
 * @param path path to config file.
 * @param cfg destination structure to fill.
 * @param err error message on failure.
 * @return true if parsed and validated, false otherwise.
 */
bool parseConfigFile(const std::string& path, Config& cfg, std::string& err);

/**
 * @brief Check value ranges and that projectRoot is an existing directory.
 * @return true when valid; err describes the first violation otherwise.
 */
bool validateConfig(const Config& cfg, std::string& err);
