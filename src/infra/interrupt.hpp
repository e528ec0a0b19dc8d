#pragma once

#include <atomic>
#include <csignal>

namespace cverify::infra {

extern std::atomic<bool> g_interrupted;

// SIGINT/SIGTERM выставляют g_interrupted и переданный флаг отмены.
// Флаг должен жить, пока не вызван uninstall_signal_handler().
void install_signal_handler(std::atomic<bool>& cancel_flag);

// Забывает флаг отмены и возвращает SIG_DFL
void uninstall_signal_handler();

// Флаг, который сейчас выставит обработчик (nullptr, если не установлен)
[[nodiscard]] auto registered_cancel_flag() -> std::atomic<bool>*;

inline bool is_interrupted() {
    return g_interrupted.load(std::memory_order_relaxed);
}

// Обработчик на время жизни владельца флага.
// Объявляется после флага, чтобы разрушиться раньше него.
class ScopedSignalHandler {
public:
    explicit ScopedSignalHandler(std::atomic<bool>& cancel_flag) {
        install_signal_handler(cancel_flag);
    }
    ~ScopedSignalHandler() { uninstall_signal_handler(); }

    ScopedSignalHandler(const ScopedSignalHandler&) = delete;
    ScopedSignalHandler& operator=(const ScopedSignalHandler&) = delete;
};

} // namespace cverify::infra
