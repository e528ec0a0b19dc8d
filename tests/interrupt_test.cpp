#include <gtest/gtest.h>
#include <atomic>
#include <csignal>

#include "infra/interrupt.hpp"

using namespace cverify::infra;

TEST(InterruptTest, SigintSetsRegisteredCancelFlag)
{
    std::atomic<bool> cancelled{false};
    {
        ScopedSignalHandler signals(cancelled);
        EXPECT_EQ(registered_cancel_flag(), &cancelled);

        std::raise(SIGINT);
        EXPECT_TRUE(cancelled.load());
        EXPECT_TRUE(is_interrupted());
    }
    g_interrupted.store(false);
}

TEST(InterruptTest, GuardForgetsFlagBeforeItDies)
{
    {
        std::atomic<bool> cancelled{false};
        ScopedSignalHandler signals(cancelled);
        ASSERT_NE(registered_cancel_flag(), nullptr);
    }
    EXPECT_EQ(registered_cancel_flag(), nullptr);
}

TEST(InterruptTest, UninstallClearsFlag)
{
    std::atomic<bool> cancelled{false};
    install_signal_handler(cancelled);
    uninstall_signal_handler();
    EXPECT_EQ(registered_cancel_flag(), nullptr);
    EXPECT_FALSE(cancelled.load());
}
