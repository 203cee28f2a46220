#include "process/worker_process.hpp"

#include "ipc/signals.hpp"
#include "process/worker_env.hpp"
#include "telemetry/line_parser.hpp"
#include "util/error.hpp"

#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace {
constexpr const char* kDefaultPath = "/usr/local/bin:/usr/bin:/bin";
constexpr size_t kReadChunk = 4096;

enum ChildStage : int {
    StageChdir = 1,
    StageExec = 2
};

struct ChildFailure {
    int stage;
    int err;
};

/** @brief Only async-signal-safe calls: runs in the forked child before exec. */
[[noreturn]] void reportChildFailure(int fd, int stage) {
    ChildFailure failure{stage, errno};
    ssize_t ignored = ::write(fd, &failure, sizeof(failure));
    (void)ignored;
    _exit(127);
}

void closeFd(int& fd) {
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

std::vector<char*> toCArray(std::vector<std::string>& values) {
    std::vector<char*> out;
    out.reserve(values.size() + 1);
    for (auto& s : values) {
        out.push_back(&s[0]);
    }
    out.push_back(nullptr);
    return out;
}
} // namespace

bool resolveExecutable(const std::string& name, const std::string& pathValue, std::string& out) {
    if (name.find('/') != std::string::npos) {
        out = name;
        return true;
    }
    std::string searchPath = pathValue.empty() ? kDefaultPath : pathValue;
    for (const auto& dir : split(searchPath, ':')) {
        std::string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            out = candidate;
            return true;
        }
    }
    return false;
}

WorkerProcess::WorkerProcess()
    : pid_(-1), outFd_(-1), eof_(false), exited_(false), exitCode_(-1) {}

WorkerProcess::~WorkerProcess() {
    closeOutput();
}

void WorkerProcess::closeOutput() {
    closeFd(outFd_);
}

bool WorkerProcess::spawn(const SpawnRequest& request, std::string& err) {
    if (pid_ != -1) {
        err = "worker already spawned";
        return false;
    }
    std::string pathValue;
    findEnvValue(request.env, "PATH", pathValue);
    std::string exePath;
    if (!resolveExecutable(request.executable, pathValue, exePath)) {
        err = "worker executable not found: " + request.executable;
        return false;
    }

    // Everything the child touches is prepared before fork(); the child only
    // makes async-signal-safe calls.
    std::vector<std::string> argvStrings;
    argvStrings.push_back(request.executable);
    argvStrings.insert(argvStrings.end(), request.args.begin(), request.args.end());
    std::vector<std::string> envStrings = request.env;
    std::vector<char*> argv = toCArray(argvStrings);
    std::vector<char*> envp = toCArray(envStrings);
    const char* workDir = request.workingDir.empty() ? nullptr : request.workingDir.c_str();

    int outPipe[2];
    if (::pipe2(outPipe, O_CLOEXEC) == -1) {
        err = errnoMessage("pipe for worker output failed", errno);
        return false;
    }
    int errPipe[2];
    if (::pipe2(errPipe, O_CLOEXEC) == -1) {
        err = errnoMessage("pipe for exec status failed", errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        return false;
    }

    pid_t child = ::fork();
    if (child == -1) {
        err = errnoMessage("fork for worker failed", errno);
        ::close(outPipe[0]);
        ::close(outPipe[1]);
        ::close(errPipe[0]);
        ::close(errPipe[1]);
        return false;
    }
    if (child == 0) {
        ::setpgid(0, 0);
        ::dup2(outPipe[1], STDOUT_FILENO);
        ::dup2(outPipe[1], STDERR_FILENO);
        Signals::restoreDefault(SIGPIPE);
        Signals::restoreDefault(SIGINT);
        Signals::restoreDefault(SIGTERM);
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        if (workDir && ::chdir(workDir) == -1) {
            reportChildFailure(errPipe[1], StageChdir);
        }
        ::execve(exePath.c_str(), argv.data(), envp.data());
        reportChildFailure(errPipe[1], StageExec);
    }

    // Also set from the parent so signalling the group cannot race the child's setpgid.
    if (::setpgid(child, child) == -1 && errno != EACCES && errno != ESRCH) {
        logErrno("setpgid for worker failed");
    }
    ::close(outPipe[1]);
    ::close(errPipe[1]);

    ChildFailure failure{0, 0};
    ssize_t got = 0;
    do {
        got = ::read(errPipe[0], &failure, sizeof(failure));
    } while (got == -1 && errno == EINTR);
    ::close(errPipe[0]);

    if (got == static_cast<ssize_t>(sizeof(failure))) {
        int status = 0;
        while (::waitpid(child, &status, 0) == -1 && errno == EINTR) {
        }
        ::close(outPipe[0]);
        std::string what = failure.stage == StageChdir
                               ? "chdir to " + request.workingDir + " failed"
                               : "exec " + exePath + " failed";
        err = errnoMessage(what, failure.err);
        return false;
    }

    pid_ = child;
    outFd_ = outPipe[0];
    return true;
}

ReadStatus WorkerProcess::readLine(std::string& line, std::string& err) {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return ReadStatus::Line;
        }
        if (eof_ || outFd_ == -1) {
            if (!buffer_.empty()) {
                line.swap(buffer_);
                buffer_.clear();
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                return ReadStatus::Line;
            }
            return ReadStatus::Eof;
        }
        char chunk[kReadChunk];
        ssize_t n = ::read(outFd_, chunk, sizeof(chunk));
        if (n == -1) {
            if (errno == EINTR) continue;
            err = errnoMessage("read worker output failed", errno);
            return ReadStatus::Error;
        }
        if (n == 0) {
            eof_ = true;
            closeOutput();
            continue;
        }
        buffer_.append(chunk, static_cast<size_t>(n));
    }
}

bool WorkerProcess::isAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exited_) return false;
    return ::kill(pid_, 0) == 0;
}

bool WorkerProcess::signalGroup(int signum, const char* what) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (pid_ <= 0 || exited_) return false;
    if (::kill(-pid_, signum) == -1) {
        // Group already gone (or never formed): fall back to the leader itself.
        if (::kill(pid_, signum) == -1) {
            if (errno != ESRCH) {
                logErrno(what);
            }
            return false;
        }
    }
    return true;
}

bool WorkerProcess::terminate() {
    return signalGroup(SIGTERM, "SIGTERM to worker failed");
}

bool WorkerProcess::kill() {
    return signalGroup(SIGKILL, "SIGKILL to worker failed");
}

bool WorkerProcess::waitForExit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pid_ <= 0) return true;
    return exitCv_.wait_for(lock, timeout, [this] { return exited_; });
}

int WorkerProcess::waitExit() {
    if (pid_ <= 0) return exitCode_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (exited_) return exitCode_;
    }
    // Wait without reaping so the pid stays valid for concurrent signalling,
    // then reap under the mutex.
    siginfo_t info {};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) == -1) {
        if (errno != EINTR) {
            logErrno("waitid for worker failed");
            break;
        }
    }
    std::lock_guard<std::mutex> lock(mutex_);
    int status = 0;
    pid_t res = -1;
    do {
        res = ::waitpid(pid_, &status, 0);
    } while (res == -1 && errno == EINTR);
    if (res == -1) {
        logErrno("waitpid for worker failed");
        exitCode_ = -1;
    } else if (WIFEXITED(status)) {
        exitCode_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exitCode_ = 128 + WTERMSIG(status);
    } else {
        exitCode_ = -1;
    }
    exited_ = true;
    exitCv_.notify_all();
    return exitCode_;
}

bool WorkerProcess::hasExited() {
    std::lock_guard<std::mutex> lock(mutex_);
    return exited_;
}
