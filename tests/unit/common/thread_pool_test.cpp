/// @file thread_pool_test.cpp
/// @brief Tests for SkyRCA thread pool

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include "common/thread_pool.h"

namespace skyrca {
namespace {

TEST(ThreadPoolTest, BasicExecution) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() { return 42; });

    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);

    std::vector<std::future<int>> futures;
    for (int i = 0; i < 10; ++i) {
        futures.push_back(pool.Submit([i]() { return i * 2; }));
    }

    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(futures[i].get(), i * 2);
    }
}

TEST(ThreadPoolTest, Wait) {
    ThreadPool pool(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 10; ++i) {
        pool.Submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            counter.fetch_add(1);
        });
    }

    pool.Wait();

    EXPECT_EQ(counter.load(), 10);
    EXPECT_EQ(pool.PendingTasks(), 0u);
}

TEST(ThreadPoolTest, ExceptionHandling) {
    ThreadPool pool(2);

    auto future = pool.Submit([]() -> int {
        throw std::runtime_error("Test exception");
    });

    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, Size) {
    ThreadPool pool(8);
    EXPECT_EQ(pool.Size(), 8u);
}

TEST(ThreadPoolTest, DefaultSize) {
    ThreadPool pool;
    EXPECT_GT(pool.Size(), 0u);
}

TEST(ParallelMapTest, PreservesIndexOrder) {
    auto results = ParallelMap(50, 4, [](size_t i) {
        // Later indices finish first
        std::this_thread::sleep_for(std::chrono::microseconds(50 * (50 - i)));
        return std::to_string(i);
    });

    ASSERT_EQ(results.size(), 50u);
    for (size_t i = 0; i < results.size(); ++i) {
        EXPECT_EQ(results[i], std::to_string(i));
    }
}

TEST(ParallelMapTest, SerialMatchesParallel) {
    auto square = [](size_t i) { return static_cast<int>(i * i); };

    EXPECT_EQ(ParallelMap(20, 1, square), ParallelMap(20, 8, square));
}

TEST(ParallelMapTest, EmptyRange) {
    auto results = ParallelMap(0, 4, [](size_t i) { return i; });
    EXPECT_TRUE(results.empty());
}

}  // namespace
}  // namespace skyrca
