#include "throughput_sampler.hpp"
#include <algorithm>

namespace cverify::core {

ThroughputSampler::ThroughputSampler(Clock::duration interval)
    : interval_(interval) {}

void ThroughputSampler::start(Clock::time_point now) {
    start_ = now;
    last_sample_time_ = now;
    last_sample_bytes_ = 0;
    total_bytes_ = 0;
    peak_speed_ = 0.0;
    history_.clear();
}

auto ThroughputSampler::bytes_per_sec(std::uint64_t bytes, Clock::duration d) -> double {
    const double seconds = std::chrono::duration<double>(d).count();
    return seconds > 0.0 ? static_cast<double>(bytes) / seconds : 0.0;
}

auto ThroughputSampler::record(std::uint64_t delta_bytes, Clock::time_point now)
    -> std::optional<Sample>
{
    total_bytes_ += delta_bytes;

    const auto since_last = now - last_sample_time_;
    if (since_last < interval_) {
        return std::nullopt;
    }

    Sample s{
        .elapsed = now - start_,
        .total_bytes = total_bytes_,
        .current_speed = bytes_per_sec(total_bytes_ - last_sample_bytes_, since_last),
        .average_speed = bytes_per_sec(total_bytes_, now - start_)
    };

    peak_speed_ = std::max(peak_speed_, s.current_speed);
    last_sample_time_ = now;
    last_sample_bytes_ = total_bytes_;

    history_.push_back(s);
    if (history_.size() > kMaxHistory) {
        history_.pop_front();
    }
    return s;
}

auto ThroughputSampler::finish(Clock::time_point now) -> Sample {
    const auto since_last = now - last_sample_time_;
    Sample s{
        .elapsed = now - start_,
        .total_bytes = total_bytes_,
        .current_speed = bytes_per_sec(total_bytes_ - last_sample_bytes_, since_last),
        .average_speed = bytes_per_sec(total_bytes_, now - start_)
    };
    // Короткие копии не успевают дать ни одного замера: пик = средняя
    if (total_bytes_ > 0 && history_.empty()) {
        peak_speed_ = s.average_speed;
    }
    return s;
}

} // namespace cverify::core
