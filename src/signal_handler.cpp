#include "signal_handler.hpp"
#include <csignal>
#include <cstring>

namespace {
    volatile std::sig_atomic_t g_signal_status;
}

void signal_handler(int signal) {
    g_signal_status = signal;
}

void setup_signal_handlers() {
    // No SA_RESTART: a blocking read on stdin must return so serve mode can stop.
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // Signal frames go to a pipe that may have no reader.
    std::signal(SIGPIPE, SIG_IGN);
}

bool stop_requested() {
    return g_signal_status != 0;
}
