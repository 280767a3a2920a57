#include "signal_handler.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

namespace hearth {
namespace runtime {

std::atomic<int> SignalHandler::last_signal_{0};

bool SignalHandler::install(std::string &error) {
    struct sigaction action {};
    action.sa_handler = handle_signal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;

    for (int signal : {SIGINT, SIGTERM}) {
        if (sigaction(signal, &action, nullptr) != 0) {
            error = "Failed to install handler for " + signal_name(signal) + ": " + std::strerror(errno);
            return false;
        }
    }
    return true;
}

bool SignalHandler::is_shutdown_requested() { return last_signal_.load() != 0; }

int SignalHandler::last_signal() { return last_signal_.load(); }

std::string SignalHandler::signal_name(int signal) {
    switch (signal) {
        case SIGINT:
            return "SIGINT";
        case SIGTERM:
            return "SIGTERM";
        default:
            return "signal " + std::to_string(signal);
    }
}

void SignalHandler::reset() { last_signal_.store(0); }

void SignalHandler::handle_signal(int signal) {
    // Async-signal-safe: only atomic operations allowed
    last_signal_.store(signal);
}

}  // namespace runtime
}  // namespace hearth
