#pragma once

#include <string>

/**
 * @brief Log a message along with errno details (perror style, to stderr).
 */
void logErrno(const std::string& message);

/**
 * @brief "message: strerror(err)" for returning system-call failures to callers.
 */
std::string errnoMessage(const std::string& message, int err);
