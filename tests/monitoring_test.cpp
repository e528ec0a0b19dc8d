#include <gtest/gtest.h>

#include "infra/monitoring/monitoring.hpp"

using namespace cverify::infra;
using cverify::core::Phase;
using cverify::core::ProgressEvent;

TEST(FormatTest, Bytes)
{
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(3.0 * 1024 * 1024), "3.0 MB");
    EXPECT_EQ(format_speed(2.0 * 1024 * 1024 * 1024), "2.0 GB/s");
}

TEST(ProgressMonitorTest, AggregatesActiveAndFinishedFiles)
{
    ProgressMonitor monitor(false);
    monitor.set_total(2, 3000);

    monitor.on_progress(ProgressEvent{.phase = Phase::CopyingAndHashing, .file = "a",
                                      .bytes_done = 500, .total_bytes = 1000, .current_speed = 10.0});
    monitor.on_progress(ProgressEvent{.phase = Phase::CopyingAndHashing, .file = "b",
                                      .bytes_done = 700, .total_bytes = 2000, .current_speed = 5.0});

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_bytes, 1200u);
    EXPECT_DOUBLE_EQ(stats.current_speed, 15.0);
    EXPECT_EQ(stats.processed_files, 0u);

    monitor.file_done("a", 1000);
    stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_files, 1u);
    EXPECT_EQ(stats.processed_bytes, 1700u);
    EXPECT_EQ(stats.total_files, 2u);
}

TEST(ProgressMonitorTest, VerificationDoesNotCountTwice)
{
    ProgressMonitor monitor(false);
    monitor.set_total(1, 1000);
    monitor.on_progress(ProgressEvent{.phase = Phase::CopyingAndHashing, .file = "a",
                                      .bytes_done = 1000, .total_bytes = 1000});
    monitor.on_progress(ProgressEvent{.phase = Phase::Verifying, .file = "a",
                                      .bytes_done = 300, .total_bytes = 1000});

    auto stats = monitor.get_stats();
    EXPECT_EQ(stats.processed_bytes, 1000u);
    EXPECT_EQ(stats.phase, "verifying integrity");
}

TEST(ProgressMonitorTest, QuietDisablesRendering)
{
    ProgressMonitor monitor(true, true);
    EXPECT_FALSE(monitor.is_enabled());
    monitor.stop();
}
