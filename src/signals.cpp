#include "signals.hpp"

#include <atomic>
#include <csignal>

namespace cen {

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) {
    g_shutdown.store(true);
}

}  // namespace

void install_signal_handlers() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool shutdown_requested() {
    return g_shutdown.load();
}

void request_shutdown() {
    g_shutdown.store(true);
}

void reset_shutdown() {
    g_shutdown.store(false);
}

}  // namespace cen
