#include <gtest/gtest.h>

#include "core/copy_engine/strategy.hpp"
#include "core/copy_types.hpp"

using namespace cverify::core;

TEST(StrategyTest, ThresholdIsOneMegabyteDecimal)
{
    constexpr CopyStrategySelector selector;
    static_assert(selector.threshold() == 1'000'000);

    EXPECT_EQ(selector.select(0), CopyStrategy::Small);
    EXPECT_EQ(selector.select(1), CopyStrategy::Small);
    EXPECT_EQ(selector.select(999'999), CopyStrategy::Small);
    EXPECT_EQ(selector.select(1'000'000), CopyStrategy::Streamed);
    EXPECT_EQ(selector.select(50ull * 1024 * 1024), CopyStrategy::Streamed);
}

TEST(StrategyTest, CustomThreshold)
{
    CopyStrategySelector selector{0};
    EXPECT_EQ(selector.select(0), CopyStrategy::Streamed);
    EXPECT_EQ(selector.select(10), CopyStrategy::Streamed);
}

TEST(BufferSizeTest, DefaultIsSixteenMebibytes)
{
    CopyRequest request{};
    EXPECT_EQ(effective_buffer_size(request), 16u * 1024 * 1024);
}

TEST(BufferSizeTest, ExplicitValueIsClamped)
{
    CopyRequest request{};
    request.buffer_size_bytes = 1;
    EXPECT_EQ(effective_buffer_size(request), kMinBufferSize);

    request.buffer_size_bytes = 64u * 1024 * 1024;
    EXPECT_EQ(effective_buffer_size(request), kMaxBufferSize);

    request.buffer_size_bytes = 64u * 1024;
    EXPECT_EQ(effective_buffer_size(request), 64u * 1024);
}

TEST(CopyTypesTest, PhaseLabels)
{
    EXPECT_EQ(phase_label(Phase::CopyingAndHashing), "copying & hashing");
    EXPECT_EQ(phase_label(Phase::Verifying), "verifying integrity");
}

TEST(CopyTypesTest, ProgressPercent)
{
    ProgressEvent event{.bytes_done = 25, .total_bytes = 100};
    EXPECT_EQ(event.percent(), 25);
    ProgressEvent empty{};
    EXPECT_EQ(empty.percent(), 100);
}
