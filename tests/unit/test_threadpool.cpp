#include <gtest/gtest.h>

#include "ThreadPool.h"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <vector>

using namespace ChatCast;

TEST(ThreadPoolTest, RunsEnqueuedTask) {
    ThreadPool pool(2);
    std::atomic<bool> executed{false};

    auto future = pool.enqueue([&executed]() { executed = true; });
    future.wait();

    EXPECT_TRUE(executed);
    EXPECT_EQ(pool.threadCount(), 2u);
}

TEST(ThreadPoolTest, RunsManyTasks) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.enqueue([&counter]() {
            counter++;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }));
    }
    for (auto& f : futures) f.wait();

    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, EnqueuePropagatesException) {
    ThreadPool pool(1);
    auto future = pool.enqueue([]() { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, SubmitSurvivesThrowingTask) {
    ThreadPool pool(1);
    std::atomic<int> ran{0};

    EXPECT_TRUE(pool.submit([]() { throw std::runtime_error("logged"); }));
    EXPECT_TRUE(pool.submit([&ran]() { ++ran; }));
    pool.shutdown();

    EXPECT_EQ(ran.load(), 1);
}

TEST(ThreadPoolTest, ShutdownDrainsQueueAndRejectsNewWork) {
    ThreadPool pool(1);
    std::atomic<int> ran{0};
    for (int i = 0; i < 20; ++i) {
        pool.submit([&ran]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++ran;
        });
    }
    pool.shutdown();
    EXPECT_EQ(ran.load(), 20);

    EXPECT_FALSE(pool.submit([&ran]() { ++ran; }));

    // enqueue still completes the future by running inline
    auto future = pool.enqueue([&ran]() { ++ran; });
    future.wait();
    EXPECT_EQ(ran.load(), 21);
}

TEST(ThreadPoolTest, ZeroMeansHardwareConcurrency) {
    ThreadPool pool(0);
    EXPECT_GE(pool.threadCount(), 1u);
}
