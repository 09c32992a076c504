#pragma once

namespace vcomp {
namespace utils {

// Route SIGINT/SIGTERM to the cancel flag and ignore SIGPIPE so a closed
// output pipe shows up as a failed write
void install_signal_handlers();

bool is_cancel_requested();

// Cancel without a signal, e.g. when the stream reader goes away
void request_cancel();

// Signal that raised the request, 0 when it came from request_cancel()
int cancel_signal();

// Called by EngineRunner as each engine run starts
void reset_cancel();

} // namespace utils
} // namespace vcomp
