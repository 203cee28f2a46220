#pragma once

#include <mutex>
#include <string>

/**
 * @brief Service logger writing text lines to a file descriptor.
 *
 * Shared by the request path and every reader thread; each line is written
 * with a single write() under an internal mutex so lines never interleave.
 */
class Logger {
public:
    /** @brief Default constructor leaves fd closed; logLine() is then a no-op. */
    Logger();

    /**
     * @brief Construct and open a log file immediately.
     * @param path file path to open/create.
     */
    explicit Logger(const std::string& path);

    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Open or create the log file in append mode.
     * @param path file path.
     * @return true on success, false on failure.
     */
    bool openFile(const std::string& path);

    /**
     * @brief Write one log line (implementation will append newline).
     * @param line text to write.
     */
    void logLine(const std::string& line);

    /** @brief True when a file is open. */
    bool isOpen() const;

    /**
     * @brief Close the file descriptor if open.
     */
    void closeFile();

private:
    mutable std::mutex mutex_;
    int fd;
};

/**
 * @brief Format and write one service event.
 *
 * Semicolon-separated for easy CSV import: unixSeconds;runId;text
 * @param logger destination (closed loggers drop the line).
 * @param runId run identifier, or "-" for service-wide events.
 * @param text event text.
 */
void logEvent(Logger& logger, const std::string& runId, const std::string& text);
