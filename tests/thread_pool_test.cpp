#include <sfera/core/thread_pool.hpp>
#include <gtest/gtest.h>
#include <atomic>
#include <string>

using sfera::ThreadPool;

TEST(ThreadPoolTest, SubmitReturnsResult) {
    ThreadPool pool(2);
    std::future<int> answer = pool.submit([]() { return 6 * 7; });
    std::future<std::string> text = pool.submit([]() { return std::string("done"); });
    
    EXPECT_EQ(42, answer.get());
    EXPECT_EQ("done", text.get());
}

TEST(ThreadPoolTest, SubmitCarriesExceptions) {
    ThreadPool pool(1);
    std::future<int> failing = pool.submit([]() -> int {
        throw std::runtime_error("store unavailable");
    });
    
    EXPECT_THROW(failing.get(), std::runtime_error);
}

TEST(ThreadPoolTest, ShutdownRunsQueuedTasks) {
    std::atomic<int> counter(0);
    {
        ThreadPool pool(2);
        for (int i = 0; i < 50; ++i) {
            pool.enqueue([&counter]() { ++counter; });
        }
        pool.shutdown();
        pool.shutdown();
    }
    EXPECT_EQ(50, counter.load());
}

TEST(ThreadPoolTest, RejectsWorkAfterShutdown) {
    ThreadPool pool(1);
    pool.shutdown();
    
    EXPECT_FALSE(pool.enqueue([]() {}));
    EXPECT_THROW(pool.submit([]() { return 1; }), std::runtime_error);
}

TEST(ThreadPoolTest, KnowsItsOwnWorkers) {
    ThreadPool pool(2);
    ThreadPool other(1);
    
    EXPECT_FALSE(pool.owns_current_thread());
    EXPECT_TRUE(pool.submit([&pool]() { return pool.owns_current_thread(); }).get());
    EXPECT_FALSE(other.submit([&pool]() { return pool.owns_current_thread(); }).get());
}
