#pragma once

#include <atomic>
#include <csignal>

namespace dbxfer::infra {

extern std::atomic<bool> g_interrupted;
extern std::atomic<int> g_interrupt_signal;

// SIGINT/SIGTERM только выставляют флаг; отмену передачи выполняет главный поток.
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

inline int interrupt_signal() {
    return g_interrupt_signal.load(std::memory_order_relaxed);
}

void reset_interrupted();

} // namespace dbxfer::infra
