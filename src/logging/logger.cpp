#include "logging/logger.hpp"

#include "util/error.hpp"

#include <ctime>
#include <fcntl.h>
#include <unistd.h>

Logger::Logger() : fd(-1) {}

Logger::Logger(const std::string& path) : fd(-1) {
    openFile(path);
}

Logger::~Logger() {
    closeFile();
}

bool Logger::openFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
    fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd == -1) {
        logErrno("open log file failed: " + path);
        return false;
    }
    return true;
}

void Logger::logLine(const std::string& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd == -1) {
        return;
    }
    std::string withNewline = line;
    withNewline.push_back('\n');
    ssize_t written = ::write(fd, withNewline.data(), withNewline.size());
    if (written == -1) {
        logErrno("write failed");
    }
}

bool Logger::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fd != -1;
}

void Logger::closeFile() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fd != -1) {
        ::close(fd);
        fd = -1;
    }
}

void logEvent(Logger& logger, const std::string& runId, const std::string& text) {
    std::string line = std::to_string(static_cast<long long>(std::time(nullptr))) + ";"
                     + (runId.empty() ? std::string("-") : runId) + ";"
                     + text;
    logger.logLine(line);
}
