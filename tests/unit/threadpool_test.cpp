// tests/unit/threadpool_test.cpp
#include <gtest/gtest.h>
#include "common/utils/threading/ThreadPool.hpp"
#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace multisig_engine::utils;

namespace
{
    struct CounterContext
    {
        int value = 0;
        std::atomic<int>* counter = nullptr;
    };

    struct BlockingContext
    {
        std::atomic<bool>* release = nullptr;
        std::atomic<int>* started = nullptr;
    };

    void AddTask(CounterContext* ctx)
    {
        ctx->counter->fetch_add(ctx->value);
    }

    void ThrowingTask(CounterContext* /*ctx*/)
    {
        throw std::runtime_error("task failure");
    }

    void BlockingTask(BlockingContext* ctx)
    {
        ctx->started->fetch_add(1);
        while (!ctx->release->load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }
}

TEST(ThreadPoolTest, RejectsZeroThreads) {
    EXPECT_THROW(ThreadPool<CounterContext> pool(0), std::invalid_argument);
}

TEST(ThreadPoolTest, OwnedTasksRunBeforeShutdownReturns) {
    std::atomic<int> counter{0};
    ThreadPool<CounterContext> pool(4);
    EXPECT_EQ(pool.GetThreadCount(), 4u);

    for (int i = 1; i <= 100; ++i) {
        auto ctx = std::make_unique<CounterContext>();
        ctx->value = i;
        ctx->counter = &counter;
        pool.SubmitOwned(AddTask, std::move(ctx));
    }

    pool.Shutdown();
    EXPECT_TRUE(pool.IsStopped());
    EXPECT_EQ(counter.load(), 5050);
    EXPECT_EQ(pool.GetPendingTaskCount(), 0u);
}

TEST(ThreadPoolTest, BorrowedContextStaysWithCaller) {
    std::atomic<int> counter{0};
    CounterContext ctx;
    ctx.value = 3;
    ctx.counter = &counter;

    {
        ThreadPool<CounterContext> pool(2);
        for (int i = 0; i < 10; ++i) {
            pool.SubmitBorrowed(AddTask, &ctx);
        }
    }

    EXPECT_EQ(counter.load(), 30);
    EXPECT_EQ(ctx.value, 3);
}

TEST(ThreadPoolTest, ThrowingTaskDoesNotKillWorker) {
    std::atomic<int> counter{0};
    ThreadPool<CounterContext> pool(1);

    CounterContext ctx;
    ctx.value = 1;
    ctx.counter = &counter;

    pool.SubmitBorrowed(ThrowingTask, &ctx);
    pool.SubmitBorrowed(AddTask, &ctx);
    pool.Shutdown();

    EXPECT_EQ(counter.load(), 1);
}

TEST(ThreadPoolTest, ActiveTaskCountTracksRunningWork) {
    std::atomic<bool> release{false};
    std::atomic<int> started{0};
    BlockingContext ctx{&release, &started};

    ThreadPool<BlockingContext> pool(2);
    pool.SubmitBorrowed(BlockingTask, &ctx);
    pool.SubmitBorrowed(BlockingTask, &ctx);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (started.load() < 2 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    EXPECT_EQ(pool.GetActiveTaskCount(), 2u);

    release = true;
    pool.Shutdown();
    EXPECT_EQ(pool.GetActiveTaskCount(), 0u);
}

TEST(ThreadPoolTest, SubmitAfterShutdownThrows) {
    std::atomic<int> counter{0};
    ThreadPool<CounterContext> pool(1);
    pool.Shutdown();
    pool.Shutdown();

    auto ctx = std::make_unique<CounterContext>();
    ctx->counter = &counter;
    EXPECT_THROW(pool.SubmitOwned(AddTask, std::move(ctx)), std::runtime_error);
}
