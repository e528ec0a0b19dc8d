#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

namespace cverify::core {

class ThroughputSampler {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr auto kSampleInterval = std::chrono::milliseconds(100);
    static constexpr std::size_t kMaxHistory = 600;

    struct Sample {
        Clock::duration elapsed{};      // от start()
        std::uint64_t total_bytes = 0;
        double current_speed = 0.0;     // bytes/sec за интервал
        double average_speed = 0.0;     // bytes/sec с начала
    };

    explicit ThroughputSampler(Clock::duration interval = kSampleInterval);

    void start(Clock::time_point now = Clock::now());

    // Учитывает delta байт. Возвращает замер, только если с прошлого
    // замера прошло не меньше interval (по часам, а не по чанкам).
    [[nodiscard]] auto record(std::uint64_t delta_bytes, Clock::time_point now = Clock::now())
        -> std::optional<Sample>;

    // Итоговый замер по всему интервалу; пик обновляется, если был хотя бы один байт
    auto finish(Clock::time_point now = Clock::now()) -> Sample;

    [[nodiscard]] auto total_bytes() const -> std::uint64_t { return total_bytes_; }
    [[nodiscard]] auto peak_speed() const -> double { return peak_speed_; }
    [[nodiscard]] auto history() const -> const std::deque<Sample>& { return history_; }

private:
    static auto bytes_per_sec(std::uint64_t bytes, Clock::duration d) -> double;

    Clock::duration interval_;
    Clock::time_point start_{};
    Clock::time_point last_sample_time_{};
    std::uint64_t last_sample_bytes_ = 0;
    std::uint64_t total_bytes_ = 0;
    double peak_speed_ = 0.0;
    std::deque<Sample> history_;
};

} // namespace cverify::core
