#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <iostream>
#include <cmath>
#include <thread>

namespace cverify::infra {

auto format_bytes(double bytes) -> std::string {
    const char* unit = "B";
    if (bytes >= 1024.0 * 1024 * 1024) { bytes /= 1024.0 * 1024 * 1024; unit = "GB"; }
    else if (bytes >= 1024.0 * 1024) { bytes /= 1024.0 * 1024; unit = "MB"; }
    else if (bytes >= 1024.0) { bytes /= 1024.0; unit = "KB"; }
    else return fmt::format("{:.0f} B", bytes);
    return fmt::format("{:.1f} {}", bytes, unit);
}

auto format_speed(double bytes_per_sec) -> std::string {
    return format_bytes(bytes_per_sec) + "/s";
}

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet)
    , start_time_(std::chrono::steady_clock::now())
{
    if (enabled_) {
        start_rendering_thread_();
    }
}

ProgressMonitor::~ProgressMonitor() {
    stop();
}

void ProgressMonitor::stop() {
    if (stopped_.exchange(true)) return;
    stop_rendering_thread_();
    if (enabled_) {
        render_();
        std::cout << "\n"; // финальный перенос
    }
}

void ProgressMonitor::set_total(std::uint64_t files, std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    total_files_ = files;
    total_bytes_ = bytes;
}

void ProgressMonitor::on_progress(const core::ProgressEvent& event) {
    std::lock_guard lock(mutex_);
    auto it = active_.find(event.file);
    if (it == active_.end()) {
        it = active_.emplace(std::string(event.file), ActiveFile{}).first;
    }
    auto& state = it->second;
    state.phase = event.phase;
    state.speed = event.current_speed;
    // Верификация перечитывает те же байты: в общий объём их не добавляем
    if (event.phase != core::Phase::Verifying) {
        state.copied = event.bytes_done;
    }
    last_phase_ = event.phase;
}

void ProgressMonitor::file_done(std::string_view file, std::uint64_t bytes) {
    std::lock_guard lock(mutex_);
    if (auto it = active_.find(file); it != active_.end()) {
        active_.erase(it);
    }
    ++processed_files_;
    finished_bytes_ += bytes;
}

auto ProgressMonitor::get_stats() const -> Stats {
    std::lock_guard lock(mutex_);
    Stats stats{
        .total_files = total_files_,
        .processed_files = processed_files_,
        .total_bytes = total_bytes_,
        .processed_bytes = finished_bytes_,
        .phase = std::string(core::phase_label(last_phase_)),
        .start_time = start_time_
    };
    for (const auto& [name, state] : active_) {
        stats.processed_bytes += state.copied;
        stats.current_speed += state.speed;
    }
    return stats;
}

void ProgressMonitor::start_rendering_thread_() {
    render_thread_ = std::make_unique<std::jthread>([this](std::stop_token st) {
        while (!st.stop_requested()) {
            render_();
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
}

void ProgressMonitor::stop_rendering_thread_() {
    if (render_thread_) {
        render_thread_->request_stop();
        render_thread_.reset(); // join
    }
}

void ProgressMonitor::render_() const {
    if (!enabled_) return;

    auto stats = get_stats();
    if (stats.total_bytes == 0 && stats.total_files == 0) return;

    const double progress = stats.total_bytes > 0
        ? std::min(1.0, static_cast<double>(stats.processed_bytes) / static_cast<double>(stats.total_bytes))
        : static_cast<double>(stats.processed_files) / static_cast<double>(stats.total_files);
    const int bar_width = 20;
    const int filled = static_cast<int>(progress * bar_width);

    // Средняя скорость с начала (байт/сек) для ETA
    auto now = std::chrono::steady_clock::now();
    auto elapsed_sec = std::chrono::duration<double>(now - stats.start_time).count();
    double bytes_per_sec = elapsed_sec > 0 ? stats.processed_bytes / elapsed_sec : 0.0;

    double eta_sec = 0.0;
    if (bytes_per_sec > 0 && stats.total_bytes > stats.processed_bytes) {
        eta_sec = static_cast<double>(stats.total_bytes - stats.processed_bytes) / bytes_per_sec;
    }

    std::string eta_str = "--:--";
    if (std::isfinite(eta_sec) && eta_sec > 0) {
        int seconds = static_cast<int>(eta_sec);
        int hours = seconds / 3600;
        int minutes = (seconds % 3600) / 60;
        seconds = seconds % 60;
        if (hours > 0) {
            eta_str = fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
        } else {
            eta_str = fmt::format("{:02d}:{:02d}", minutes, seconds);
        }
    }

    std::string bar;
    for (int i = 0; i < bar_width; ++i) {
        bar += i < filled ? "█" : "░";
    }

    // Очистка строки и вывод
    std::cout << "\r\033[K"; // ANSI: очистить строку
    fmt::print(
        "[{}] {:3.0f}% {} | {} | ETA: {} | {}/{} files",
        bar,
        progress * 100.0,
        stats.phase,
        format_speed(stats.current_speed),
        eta_str,
        stats.processed_files,
        stats.total_files
    );
    std::cout << std::flush;
}

} // namespace cverify::infra
