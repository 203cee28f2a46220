#pragma once

#include <sys/types.h>

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

/** @brief Everything needed to launch one worker. */
struct SpawnRequest {
    std::string executable;             // path, or a bare name searched in the worker's PATH
    std::vector<std::string> args;      // arguments after argv[0]
    std::vector<std::string> env;       // KEY=VALUE entries
    std::string workingDir;
};

enum class ReadStatus {
    Line,
    Eof,
    Error
};

/**
 * @brief One forked worker process with stdout and stderr merged into a pipe.
 *
 * The worker runs in its own process group; terminate()/kill() signal the whole
 * group so helpers it forked do not keep the pipe open. Only the thread that
 * reads the output calls waitExit(); other threads use isAlive() and
 * waitForExit(), which never reap the child themselves.
 */
class WorkerProcess {
public:
    WorkerProcess();
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    /**
     * @brief Fork and exec the worker.
     *
     * A failing chdir or exec in the child is reported back through a
     * close-on-exec pipe, so a missing executable fails here rather than
     * surfacing as an exit code.
     * @param request executable, arguments, environment and working directory.
     * @param err human-readable reason on failure.
     * @return true once the worker is running.
     */
    bool spawn(const SpawnRequest& request, std::string& err);

    /**
     * @brief Next line of merged output without its trailing newline.
     * A final line lacking a newline is still returned before Eof.
     */
    ReadStatus readLine(std::string& line, std::string& err);

    /** @brief Non-blocking liveness check (spawned, not yet reaped, signalable). */
    bool isAlive();

    /** @brief SIGTERM to the worker's process group. */
    bool terminate();

    /** @brief SIGKILL to the worker's process group. */
    bool kill();

    /** @brief Block until the reader thread has reaped the worker or timeout elapses. */
    bool waitForExit(std::chrono::milliseconds timeout);

    /**
     * @brief Block until the worker exits, reap it and return its exit code.
     * Death by signal N is reported as 128 + N.
     */
    int waitExit();

    /** @brief True after waitExit() reaped the worker. */
    bool hasExited();

    pid_t pid() const { return pid_; }

private:
    void closeOutput();
    bool signalGroup(int signum, const char* what);

    pid_t pid_;
    int outFd_;
    std::string buffer_;
    bool eof_;

    std::mutex mutex_;
    std::condition_variable exitCv_;
    bool exited_;
    int exitCode_;
};

/**
 * @brief Resolve a bare executable name against a PATH value.
 * Names containing '/' are returned unchanged.
 * @return false when no executable candidate exists.
 */
bool resolveExecutable(const std::string& name, const std::string& pathValue, std::string& out);
