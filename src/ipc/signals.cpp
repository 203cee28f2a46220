#include "ipc/signals.hpp"

#include "util/error.hpp"

#include <csignal>

namespace {
volatile std::sig_atomic_t g_pendingSignal = 0;

void recordSignal(int signum) {
    g_pendingSignal = signum;
}

bool installDisposition(int signum, void (*handler)(int)) {
    struct sigaction sa {};
    sa.sa_handler = handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    return sigaction(signum, &sa, nullptr) == 0;
}
} // namespace

namespace Signals {

bool watch(int signum) {
    struct sigaction sa {};
    sa.sa_handler = recordSignal;
    sigemptyset(&sa.sa_mask);
    // Restart reads/waits in the reader threads; the main loop polls pending().
    sa.sa_flags = SA_RESTART;
    if (sigaction(signum, &sa, nullptr) == -1) {
        logErrno("sigaction failed");
        return false;
    }
    return true;
}

int pending() {
    return static_cast<int>(g_pendingSignal);
}

void clearPending() {
    g_pendingSignal = 0;
}

void ignore(int signum) {
    if (!installDisposition(signum, SIG_IGN)) {
        logErrno("sigaction(SIG_IGN) failed");
    }
}

void restoreDefault(int signum) {
    // No logging: called in the forked child where only async-signal-safe calls are allowed.
    (void)installDisposition(signum, SIG_DFL);
}

} // namespace Signals
