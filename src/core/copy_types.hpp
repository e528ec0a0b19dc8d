#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string_view>
#include "../infra/hash/digest.hpp"

namespace cverify::core {

inline constexpr std::size_t kMinBufferSize = 8 * 1024;              // 8 KiB
inline constexpr std::size_t kMaxBufferSize = 10 * 1024 * 1024;      // 10 MiB
inline constexpr std::size_t kDefaultBufferSize = 16 * 1024 * 1024;  // 16 MiB

enum class CopyStrategy {
    Small,     // < 1 MB: одно чтение, одна запись
    Streamed,  // >= 1 MB: цикл по чанкам
};

enum class CopyStatus {
    Completed,
    Cancelled,
};

enum class Phase {
    CopyingAndHashing,
    Verifying,
    Hashing,   // только хеширование, без копии
};

[[nodiscard]] auto strategy_name(CopyStrategy s) -> std::string_view;
[[nodiscard]] auto phase_label(Phase p) -> std::string_view;

struct CopyRequest {
    std::filesystem::path source_path;
    std::filesystem::path destination_path;
    std::optional<std::size_t> buffer_size_bytes; // nullopt -> kDefaultBufferSize
    bool compute_hash = true;
    bool preserve_metadata = true;
};

/// Размер буфера, который реально использует движок.
/// Явное значение зажимается в [8 KiB, 10 MiB], без значения берётся 16 MiB.
[[nodiscard]] auto effective_buffer_size(const CopyRequest& request) -> std::size_t;

struct CopyOutcome {
    CopyStatus status = CopyStatus::Completed;
    CopyStrategy strategy_used = CopyStrategy::Small;
    std::uint64_t bytes_copied = 0;
    std::uint64_t chunks = 0;          // итераций чтения/записи
    std::size_t buffer_size = 0;
    std::optional<infra::Digest> source_digest;
    std::optional<infra::Digest> destination_digest;
    bool verified = false;             // оба дайджеста есть и равны
    bool metadata_preserved = false;
    std::chrono::steady_clock::duration duration{};
    double average_speed = 0.0;        // bytes/sec
    double peak_speed = 0.0;           // bytes/sec
};

struct ProgressEvent {
    Phase phase = Phase::CopyingAndHashing;
    std::string_view file;
    std::uint64_t bytes_done = 0;
    std::uint64_t total_bytes = 0;
    double current_speed = 0.0;        // bytes/sec
    double average_speed = 0.0;        // bytes/sec

    [[nodiscard]] auto percent() const -> int {
        if (total_bytes == 0) return 100;
        return static_cast<int>(bytes_done * 100 / total_bytes);
    }
};

// Получатель событий прогресса. Может вызываться из нескольких операций сразу
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void on_progress(const ProgressEvent& event) = 0;
};

// Пауза, проверяемая между чанками
class PauseGate {
public:
    virtual ~PauseGate() = default;

    // Блокирует, пока пауза включена и операция не отменена
    virtual void wait_while_paused(const std::atomic<bool>& cancelled) = 0;
};

class ManualPauseGate final : public PauseGate {
public:
    void pause();
    void resume();
    [[nodiscard]] auto is_paused() const -> bool;

    void wait_while_paused(const std::atomic<bool>& cancelled) override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool paused_ = false;
};

/// Общее состояние, которое читает цикл копирования.
/// Принадлежит вызывающему и должно пережить операцию.
struct OperationControl {
    std::atomic<bool> cancelled{false};
    PauseGate* const pause_gate;
    ProgressSink* const progress_sink;

    explicit OperationControl(ProgressSink* sink = nullptr, PauseGate* gate = nullptr)
        : pause_gate(gate), progress_sink(sink) {}

    OperationControl(const OperationControl&) = delete;
    OperationControl& operator=(const OperationControl&) = delete;

    void cancel() noexcept { cancelled.store(true, std::memory_order_relaxed); }
    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled.load(std::memory_order_relaxed);
    }

    void report(const ProgressEvent& event) const {
        if (progress_sink) progress_sink->on_progress(event);
    }
};

} // namespace cverify::core
