#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <vector>

#include "infra/thread_pool/thread_pool.hpp"
#include "core/copy_verify_operation.hpp"
#include "test_helpers.hpp"

using cverify::infra::ThreadPool;

TEST(ThreadPoolTest, RunsAllTasks)
{
    ThreadPool pool{4};
    std::atomic<int> counter{0};
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue_with_future([&counter, i] {
            counter.fetch_add(1);
            return i * 2;
        }));
    }
    int sum = 0;
    for (auto& f : futures) sum += f.get();

    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(sum, 9900);
}

TEST(ThreadPoolTest, WaitBlocksUntilIdle)
{
    ThreadPool pool{2};
    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        (void)pool.enqueue_with_future([&done] {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            done.fetch_add(1);
        });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 10);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool{0};
    EXPECT_EQ(pool.size(), 1u);
}

class ConcurrentCopyTest : public cverify::test::TempDirTest {};

TEST_F(ConcurrentCopyTest, IndependentOperationsRunInParallel)
{
    constexpr int kFiles = 6;
    std::vector<std::string> expected;
    for (int i = 0; i < kFiles; ++i) {
        auto data = cverify::test::write_random_file(
            path(fmt::format("src{}.bin", i)), 600'000 + static_cast<std::size_t>(i) * 300'000,
            static_cast<std::uint32_t>(i));
        expected.push_back(cverify::test::reference_sha256_hex(data));
    }

    const cverify::core::CopyVerifyOperation operation;
    cverify::core::OperationControl control;
    ThreadPool pool{3};

    std::vector<std::future<cverify::infra::Result<cverify::core::CopyOutcome>>> futures;
    for (int i = 0; i < kFiles; ++i) {
        cverify::core::CopyRequest req{
            .source_path = path(fmt::format("src{}.bin", i)),
            .destination_path = path(fmt::format("out/dst{}.bin", i))
        };
        futures.push_back(pool.enqueue_with_future([&operation, &control, req] {
            return operation.execute(req, control);
        }));
    }

    for (int i = 0; i < kFiles; ++i) {
        auto res = futures[static_cast<std::size_t>(i)].get();
        ASSERT_TRUE(res.has_value()) << res.error().message;
        EXPECT_TRUE(res->verified);
        EXPECT_EQ(res->destination_digest->hex(), expected[static_cast<std::size_t>(i)]);
    }
}
