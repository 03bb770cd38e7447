#include "interrupt.hpp"

namespace mlprogress::infra {

std::atomic<bool> g_interrupted{false};

static void signal_handler(int sig) {
    // В обработчике сигнала нельзя логировать: spdlog берёт мьютексы
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
    }
}

void install_signal_handler() {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

} // namespace mlprogress::infra
