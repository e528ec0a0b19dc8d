#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <memory>
#include <thread>
#include "../../core/copy_types.hpp"

namespace cverify::infra {

// 1536 -> "1.5 KB", 3*1024*1024 -> "3.0 MB"
[[nodiscard]] auto format_bytes(double bytes) -> std::string;
[[nodiscard]] auto format_speed(double bytes_per_sec) -> std::string;

/// Консольный ProgressSink для CLI.
/// Собирает события от нескольких параллельных операций и раз в 100 мс
/// перерисовывает одну строку состояния в фоновом потоке.
class ProgressMonitor final : public core::ProgressSink {
public:
    struct Stats {
        std::uint64_t total_files = 0;
        std::uint64_t processed_files = 0;
        std::uint64_t total_bytes = 0;
        std::uint64_t processed_bytes = 0;   // байты фазы копирования
        double current_speed = 0.0;          // сумма по активным файлам
        std::string phase;
        std::chrono::steady_clock::time_point start_time{};
    };

    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor() override;

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void set_total(std::uint64_t files, std::uint64_t bytes);
    void on_progress(const core::ProgressEvent& event) override;

    // Файл обработан (успешно или нет); bytes учитываются в processed_bytes
    void file_done(std::string_view file, std::uint64_t bytes);

    // Останавливает отрисовку и печатает итоговую строку
    void stop();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

private:
    struct ActiveFile {
        core::Phase phase = core::Phase::CopyingAndHashing;
        std::uint64_t copied = 0;
        double speed = 0.0;
    };

    void render_() const;
    void start_rendering_thread_();
    void stop_rendering_thread_();

    mutable std::mutex mutex_;
    std::map<std::string, ActiveFile, std::less<>> active_;
    std::uint64_t processed_files_ = 0;
    std::uint64_t finished_bytes_ = 0;
    std::uint64_t total_files_ = 0;
    std::uint64_t total_bytes_ = 0;
    core::Phase last_phase_ = core::Phase::CopyingAndHashing;

    const bool enabled_;
    const std::chrono::steady_clock::time_point start_time_;
    std::atomic<bool> stopped_{false};
    std::unique_ptr<std::jthread> render_thread_;
};

} // namespace cverify::infra
