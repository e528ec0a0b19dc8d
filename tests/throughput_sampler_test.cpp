#include <gtest/gtest.h>

#include "core/throughput/throughput_sampler.hpp"

using cverify::core::ThroughputSampler;
using namespace std::chrono_literals;

TEST(ThroughputSamplerTest, SamplesOnlyAfterInterval)
{
    ThroughputSampler sampler;
    const auto t0 = ThroughputSampler::Clock::time_point{} + 1s;
    sampler.start(t0);

    // Много чанков за 50 мс: замеров нет
    for (int i = 0; i < 10; ++i) {
        EXPECT_FALSE(sampler.record(1000, t0 + 5ms * i).has_value());
    }

    auto sample = sampler.record(1000, t0 + 100ms);
    ASSERT_TRUE(sample.has_value());
    EXPECT_EQ(sample->total_bytes, 11'000u);
    EXPECT_NEAR(sample->current_speed, 110'000.0, 1.0);
    EXPECT_NEAR(sample->average_speed, 110'000.0, 1.0);
    EXPECT_EQ(sampler.history().size(), 1u);
}

TEST(ThroughputSamplerTest, CurrentSpeedIsPerIntervalAndPeakIsTracked)
{
    ThroughputSampler sampler;
    const auto t0 = ThroughputSampler::Clock::time_point{} + 1s;
    sampler.start(t0);

    ASSERT_TRUE(sampler.record(1'000'000, t0 + 100ms).has_value());  // 10 MB/s
    auto slow = sampler.record(100'000, t0 + 200ms);                  // 1 MB/s
    ASSERT_TRUE(slow.has_value());
    EXPECT_NEAR(slow->current_speed, 1'000'000.0, 1.0);
    EXPECT_NEAR(slow->average_speed, 5'500'000.0, 1.0);
    EXPECT_NEAR(sampler.peak_speed(), 10'000'000.0, 1.0);
}

TEST(ThroughputSamplerTest, FinishWithoutSamplesUsesAverageAsPeak)
{
    ThroughputSampler sampler;
    const auto t0 = ThroughputSampler::Clock::time_point{} + 1s;
    sampler.start(t0);
    EXPECT_FALSE(sampler.record(500, t0 + 10ms).has_value());

    auto last = sampler.finish(t0 + 50ms);
    EXPECT_EQ(last.total_bytes, 500u);
    EXPECT_NEAR(last.average_speed, 10'000.0, 1.0);
    EXPECT_NEAR(sampler.peak_speed(), 10'000.0, 1.0);
}

TEST(ThroughputSamplerTest, ZeroBytesGiveZeroSpeed)
{
    ThroughputSampler sampler;
    const auto t0 = ThroughputSampler::Clock::time_point{} + 1s;
    sampler.start(t0);
    auto last = sampler.finish(t0);
    EXPECT_EQ(last.average_speed, 0.0);
    EXPECT_EQ(sampler.peak_speed(), 0.0);
}

TEST(ThroughputSamplerTest, HistoryIsBounded)
{
    ThroughputSampler sampler;
    auto t = ThroughputSampler::Clock::time_point{} + 1s;
    sampler.start(t);
    for (std::size_t i = 0; i < ThroughputSampler::kMaxHistory + 10; ++i) {
        t += 100ms;
        ASSERT_TRUE(sampler.record(1, t).has_value());
    }
    EXPECT_EQ(sampler.history().size(), ThroughputSampler::kMaxHistory);
}
