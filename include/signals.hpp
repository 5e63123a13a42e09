#pragma once

namespace cen {

// SIGINT/SIGTERM set the shutdown flag; SIGPIPE is ignored so a vanished
// helper process surfaces as a write error instead of killing us.
void install_signal_handlers();

bool shutdown_requested();
void request_shutdown();
void reset_shutdown();

}  // namespace cen
