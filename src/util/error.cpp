#include "util/error.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

void logErrno(const std::string& message) {
    if (!message.empty()) {
        perror(message.c_str());
    } else {
        perror(nullptr);
    }
}

std::string errnoMessage(const std::string& message, int err) {
    char buf[256];
    // GNU strerror_r may return a static string instead of filling buf.
    const char* text = strerror_r(err, buf, sizeof(buf));
    return message + ": " + text;
}
