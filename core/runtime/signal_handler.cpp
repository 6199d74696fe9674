#include "signal_handler.hpp"

#include <signal.h>

#include <cstring>

namespace wordserve {
namespace runtime {

std::atomic<bool> SignalHandler::shutdown_requested_{false};

void SignalHandler::install() {
    struct sigaction action;
    std::memset(&action, 0, sizeof(action));
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);
}

bool SignalHandler::is_shutdown_requested() { return shutdown_requested_.load(); }

void SignalHandler::reset() { shutdown_requested_.store(false); }

void SignalHandler::handle_signal(int) {
    // Async-signal-safe: only atomic operations allowed
    shutdown_requested_.store(true);
}

}  // namespace runtime
}  // namespace wordserve
