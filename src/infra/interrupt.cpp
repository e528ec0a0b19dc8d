#include "interrupt.hpp"

namespace cverify::infra {

std::atomic<bool> g_interrupted{false};

namespace {

std::atomic<std::atomic<bool>*> g_cancel_flag{nullptr};

// Только lock-free атомики: spdlog из обработчика сигнала вызывать нельзя
void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        g_interrupted.store(true, std::memory_order_relaxed);
        if (auto* flag = g_cancel_flag.load(std::memory_order_relaxed)) {
            flag->store(true, std::memory_order_relaxed);
        }
    }
}

} // namespace

void install_signal_handler(std::atomic<bool>& cancel_flag) {
    g_cancel_flag.store(&cancel_flag, std::memory_order_relaxed);
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
}

void uninstall_signal_handler() {
    // Сначала указатель: сигнал между двумя вызовами уже не тронет флаг
    g_cancel_flag.store(nullptr, std::memory_order_relaxed);
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
}

auto registered_cancel_flag() -> std::atomic<bool>* {
    return g_cancel_flag.load(std::memory_order_relaxed);
}

} // namespace cverify::infra
