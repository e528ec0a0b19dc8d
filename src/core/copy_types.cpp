#include "copy_types.hpp"
#include <algorithm>

namespace cverify::core {

auto strategy_name(CopyStrategy s) -> std::string_view {
    switch (s) {
        case CopyStrategy::Small:    return "small";
        case CopyStrategy::Streamed: return "streamed";
    }
    return "unknown";
}

auto phase_label(Phase p) -> std::string_view {
    switch (p) {
        case Phase::CopyingAndHashing: return "copying & hashing";
        case Phase::Verifying:         return "verifying integrity";
        case Phase::Hashing:           return "hashing";
    }
    return "unknown";
}

auto effective_buffer_size(const CopyRequest& request) -> std::size_t {
    if (!request.buffer_size_bytes) {
        return kDefaultBufferSize;
    }
    return std::clamp(*request.buffer_size_bytes, kMinBufferSize, kMaxBufferSize);
}

// =============== ManualPauseGate ===============

void ManualPauseGate::pause() {
    std::lock_guard lock(mutex_);
    paused_ = true;
}

void ManualPauseGate::resume() {
    {
        std::lock_guard lock(mutex_);
        paused_ = false;
    }
    cv_.notify_all();
}

auto ManualPauseGate::is_paused() const -> bool {
    std::lock_guard lock(mutex_);
    return paused_;
}

void ManualPauseGate::wait_while_paused(const std::atomic<bool>& cancelled) {
    std::unique_lock lock(mutex_);
    // Флаг отмены выставляется без уведомления cv, поэтому опрашиваем его
    while (paused_ && !cancelled.load(std::memory_order_relaxed)) {
        cv_.wait_for(lock, std::chrono::milliseconds(50));
    }
}

} // namespace cverify::core
