#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>
#include <gtest/gtest.h>

#include "infra/thread_pool/thread_pool.hpp"

using dcopy::infra::ThreadPool;

TEST(ThreadPoolTest, FuturesReturnResults)
{
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;
    for (int i = 0; i < 16; ++i) {
        futures.push_back(pool.enqueue_with_future([](int x) { return x * x; }, i));
    }
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, WaitBlocksUntilQueueDrained)
{
    ThreadPool pool(3);
    std::atomic<int> done{0};
    for (int i = 0; i < 50; ++i) {
        (void)pool.enqueue_with_future([&done] {
            std::this_thread::sleep_for(std::chrono::microseconds(200));
            done.fetch_add(1);
        });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_EQ(pool.enqueue_with_future([] { return 7; }).get(), 7);
}

TEST(ThreadPoolTest, DestructorFinishesQueuedTasks)
{
    std::atomic<int> done{0};
    {
        ThreadPool pool(2);
        for (int i = 0; i < 20; ++i) {
            (void)pool.enqueue_with_future([&done] { done.fetch_add(1); });
        }
    }
    EXPECT_EQ(done.load(), 20);
}
