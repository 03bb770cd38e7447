#pragma once

#include <atomic>
#include <csignal>

namespace mlprogress::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM только выставляют флаг, реакция в основном коде
void install_signal_handler();

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

} // namespace mlprogress::infra
