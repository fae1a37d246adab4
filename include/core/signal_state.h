#pragma once

#include <csignal>

namespace rtsub {

// Flags written by the signal handler and polled by the main loops.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t received = 0;  // last signal number (for logging)

    void reset() {
        shutdown = 0;
        received = 0;
    }
};

// Process-wide state used by installShutdownSignalHandlers()
SignalState& processSignalState();

// SIGINT / SIGTERM set the shutdown flag; SIGPIPE is ignored
void installShutdownSignalHandlers();

}  // namespace rtsub
