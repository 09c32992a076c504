#include "cancel_flag.hpp"

#include <atomic>
#include <csignal>

namespace vcomp {
namespace utils {

namespace {
constexpr int kNoRequest = -1;

// kNoRequest, 0 for a programmatic request, otherwise the signal number
std::atomic<int> g_cancel_reason{kNoRequest};

void handle_signal(int sig) {
    g_cancel_reason.store(sig, std::memory_order_relaxed);
}
} // namespace

void install_signal_handlers() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);
    std::signal(SIGPIPE, SIG_IGN);
}

bool is_cancel_requested() {
    return g_cancel_reason.load(std::memory_order_relaxed) != kNoRequest;
}

void request_cancel() {
    int expected = kNoRequest;
    g_cancel_reason.compare_exchange_strong(expected, 0, std::memory_order_relaxed);
}

int cancel_signal() {
    int reason = g_cancel_reason.load(std::memory_order_relaxed);
    return reason > 0 ? reason : 0;
}

void reset_cancel() {
    g_cancel_reason.store(kNoRequest, std::memory_order_relaxed);
}

} // namespace utils
} // namespace vcomp
