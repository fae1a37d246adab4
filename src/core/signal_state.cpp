#include "core/signal_state.h"

namespace rtsub {

namespace {

SignalState g_signalState;

void onShutdownSignal(int sig) {
    g_signalState.received = sig;
    g_signalState.shutdown = 1;
}

}  // namespace

SignalState& processSignalState() {
    return g_signalState;
}

void installShutdownSignalHandlers() {
    std::signal(SIGINT, onShutdownSignal);
    std::signal(SIGTERM, onShutdownSignal);
    std::signal(SIGPIPE, SIG_IGN);
}

}  // namespace rtsub
