#include <gtest/gtest.h>

#include <atomic>
#include <stdexcept>
#include <vector>
#include "infra/thread_pool/thread_pool.hpp"

using dbxfer::infra::ThreadPool;

TEST(ThreadPoolTest, FuturesKeepSubmissionOrder)
{
    ThreadPool pool(4);
    std::vector<std::future<int>> results;
    for (int i = 0; i < 100; ++i) {
        results.push_back(pool.submit([i] { return i * i; }));
    }
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(results[i].get(), i * i);
    }
}

TEST(ThreadPoolTest, ArgumentsAreForwarded)
{
    ThreadPool pool(2);
    auto f = pool.submit([](int a, const std::string& b) { return b + std::to_string(a); }, 7, std::string("n"));
    EXPECT_EQ(f.get(), "n7");
}

TEST(ThreadPoolTest, ExceptionReachesFuture)
{
    ThreadPool pool(1);
    auto f = pool.submit([]() -> int { throw std::runtime_error("bad"); });
    EXPECT_THROW(f.get(), std::runtime_error);
}

TEST(ThreadPoolTest, WaitDrainsQueue)
{
    std::atomic<int> done{0};
    ThreadPool pool(3);
    for (int i = 0; i < 50; ++i) {
        (void)pool.submit([&done] { done.fetch_add(1); });
    }
    pool.wait();
    EXPECT_EQ(done.load(), 50);
}

TEST(ThreadPoolTest, ZeroThreadsMeansOne)
{
    ThreadPool pool(0);
    EXPECT_EQ(pool.size(), 1u);
    EXPECT_GE(ThreadPool::default_thread_count(), 1u);
    EXPECT_LE(ThreadPool::default_thread_count(), 8u);
}
