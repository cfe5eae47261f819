/**
 * @file test_worker_pool.cpp
 * @brief Unit tests for the serve loop thread pool
 */

#include "algoscope/utils/worker_pool.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>

using algoscope::utils::WorkerPool;

class WorkerPoolTest : public ::testing::Test {};

TEST_F(WorkerPoolTest, UsesRequestedThreadCount) {
    WorkerPool pool(3);
    EXPECT_EQ(pool.ThreadCount(), 3u);
}

TEST_F(WorkerPoolTest, ZeroPicksAtLeastOneThread) {
    WorkerPool pool(0);
    EXPECT_GE(pool.ThreadCount(), 1u);
}

TEST_F(WorkerPoolTest, SubmitReturnsResult) {
    WorkerPool pool(2);
    auto future = pool.Submit([] { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);

    auto text = pool.Submit([] { return std::string("done"); });
    EXPECT_EQ(text.get(), "done");
}

TEST_F(WorkerPoolTest, ExceptionsReachTheFuture) {
    WorkerPool pool(1);
    auto future = pool.Submit([]() -> int { throw std::runtime_error("task failed"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // The worker survives a throwing task
    EXPECT_EQ(pool.Submit([] { return 1; }).get(), 1);
}

TEST_F(WorkerPoolTest, RunsManyTasks) {
    WorkerPool pool(4);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.Submit([&counter] { ++counter; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), 100);
    EXPECT_EQ(pool.QueuedCount(), 0u);
}

TEST_F(WorkerPoolTest, ShutdownDrainsQueuedTasks) {
    std::atomic<int> counter{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            pool.Submit([&counter] {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
                ++counter;
            });
        }
        pool.Shutdown();
        EXPECT_EQ(counter.load(), 10);
        EXPECT_EQ(pool.ThreadCount(), 0u);
    }
    EXPECT_EQ(counter.load(), 10);
}

TEST_F(WorkerPoolTest, SubmitAfterShutdownThrows) {
    WorkerPool pool(2);
    pool.Shutdown();
    pool.Shutdown();
    EXPECT_THROW(pool.Submit([] { return 0; }), std::runtime_error);
}
