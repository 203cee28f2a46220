#pragma once

#include "model/run_params.hpp"

#include <string>
#include <vector>

/** @brief Copy a NUL-terminated KEY=VALUE array (e.g. environ) into a vector. */
std::vector<std::string> environmentFrom(char** envp);

/** @brief Look up KEY in a KEY=VALUE list; false if absent. */
bool findEnvValue(const std::vector<std::string>& env, const std::string& key, std::string& out);

/**
 * @brief Set KEY=VALUE in the list.
 * @param overwrite when false an existing entry is kept (setdefault semantics).
 */
void setEnvValue(std::vector<std::string>& env, const std::string& key, const std::string& value,
                 bool overwrite = true);

/**
 * @brief Environment for one worker run.
 *
 * Starts from @p base and sets SIM_TIME, MIN_GREEN_TIME and MAX_GREEN_TIME from
 * the run parameters. PYGAME_HIDE_SUPPORT_PROMPT defaults to 1. Without a
 * DISPLAY the SDL video and audio drivers default to "dummy" so the worker
 * renders headless.
 */
std::vector<std::string> buildWorkerEnvironment(const RunParams& params,
                                                const std::vector<std::string>& base);
