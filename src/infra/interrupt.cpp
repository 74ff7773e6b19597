#include "interrupt.hpp"

namespace dbxfer::infra {

std::atomic<bool> g_interrupted{false};
std::atomic<int> g_interrupt_signal{0};

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupt_signal.store(sig, std::memory_order_relaxed);
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    // запись в pipe завершившегося процесса не должна убивать нас
    std::signal(SIGPIPE, SIG_IGN);
}

void reset_interrupted() {
    g_interrupt_signal.store(0, std::memory_order_relaxed);
    g_interrupted.store(false, std::memory_order_relaxed);
}

} // namespace dbxfer::infra
