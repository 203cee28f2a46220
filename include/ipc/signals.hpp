#pragma once

#include <signal.h>

/**
 * @brief Helpers for signal dispositions of the dashboard and its workers.
 */
namespace Signals {
    /**
     * @brief Record delivery of @p signum in a process-wide flag.
     * @param signum signal number (e.g., SIGINT).
     * @return true on success, false on failure.
     */
    bool watch(int signum);

    /** @brief Last watched signal delivered, 0 if none since clearPending(). */
    int pending();

    /** @brief Reset the pending flag. */
    void clearPending();

    /**
     * @brief Ignore a given signal (SIG_IGN).
     * @param signum signal number to ignore.
     */
    void ignore(int signum);

    /**
     * @brief Reinstall SIG_DFL. Async-signal-safe, used between fork and exec.
     * @param signum signal number to reset.
     */
    void restoreDefault(int signum);
}
