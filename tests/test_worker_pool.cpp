#include <gtest/gtest.h>

#include "core/Errors.hpp"
#include "core/Log.hpp"
#include "pipeline/DeadlineExecutor.hpp"
#include "pipeline/WorkerPool.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace verdant::test {

using namespace std::chrono_literals;

// ============================================================================
// WorkerPool
// ============================================================================

TEST(WorkerPoolTest, RunsEveryTaskAndReturnsResults) {
    WorkerPool pool(4);
    EXPECT_EQ(pool.ThreadCount(), 4u);

    Vector<std::future<int>> futures;
    for (int i = 0; i < 32; ++i) {
        futures.push_back(pool.Submit([i] { return i * i; }));
    }

    for (int i = 0; i < 32; ++i) {
        EXPECT_EQ(futures[i].get(), i * i);
    }
}

TEST(WorkerPoolTest, ZeroThreadsMeansOne) {
    WorkerPool pool(0);
    EXPECT_EQ(pool.ThreadCount(), 1u);
    EXPECT_EQ(pool.Submit([] { return 7; }).get(), 7);
}

TEST(WorkerPoolTest, PropagatesExceptionsThroughFutures) {
    WorkerPool pool(2);
    auto future = pool.Submit([]() -> int { throw DataSourceError("boom"); });
    EXPECT_THROW(future.get(), DataSourceError);

    // The worker survives the exception
    EXPECT_EQ(pool.Submit([] { return 1; }).get(), 1);
}

TEST(WorkerPoolTest, NeverExceedsThreadCount) {
    constexpr usize kThreads = 3;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    {
        WorkerPool pool(kThreads);
        Vector<std::future<void>> futures;
        for (int i = 0; i < 24; ++i) {
            futures.push_back(pool.Submit([&running, &peak] {
                const int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                }
                std::this_thread::sleep_for(2ms);
                --running;
            }));
        }
        for (auto& f : futures) {
            f.get();
        }
    }

    EXPECT_GE(peak.load(), 1);
    EXPECT_LE(peak.load(), static_cast<int>(kThreads));
}

TEST(WorkerPoolTest, DestructionDrainsQueuedTasks) {
    std::atomic<int> done{0};
    {
        WorkerPool pool(1);
        for (int i = 0; i < 10; ++i) {
            // Futures deliberately dropped
            (void)pool.Submit([&done] {
                std::this_thread::sleep_for(1ms);
                ++done;
            });
        }
    }
    EXPECT_EQ(done.load(), 10);
}

// ============================================================================
// DeadlineExecutor
// ============================================================================

TEST(DeadlineExecutorTest, ReturnsValueWithinDeadline) {
    DeadlineExecutor deadlines(2);
    EXPECT_EQ(deadlines.Run([] { return 42; }, 1000ms, "fast"), 42);
    EXPECT_EQ(deadlines.AbandonedCount(), 0u);
}

TEST(DeadlineExecutorTest, LateCallThrowsAndIsJoinedByDrain) {
    std::atomic<bool> finished{false};
    DeadlineExecutor deadlines(2);

    auto slow = [&finished] {
        std::this_thread::sleep_for(200ms);
        finished = true;
        return 1;
    };
    EXPECT_THROW(deadlines.Run(slow, 20ms, "slow"), FetchTimeoutError);
    EXPECT_EQ(deadlines.AbandonedCount(), 1u);

    deadlines.Drain();
    EXPECT_TRUE(finished.load());
    EXPECT_EQ(deadlines.AbandonedCount(), 0u);
}

TEST(DeadlineExecutorTest, AbandonedCallsKeepTheirSlot) {
    std::atomic<int> started{0};
    DeadlineExecutor deadlines(1);

    auto slow = [&started] {
        ++started;
        std::this_thread::sleep_for(300ms);
        return 0;
    };
    EXPECT_THROW(deadlines.Run(slow, 20ms, "first"), FetchTimeoutError);

    // The only slot is still held by the first call
    EXPECT_THROW(deadlines.Run(slow, 50ms, "second"), FetchTimeoutError);
    EXPECT_EQ(started.load(), 1);

    deadlines.Drain();
    EXPECT_EQ(deadlines.Run([] { return 5; }, 1000ms, "after drain"), 5);
}

TEST(DeadlineExecutorTest, ForwardsExceptions) {
    DeadlineExecutor deadlines(1);
    auto failing = []() -> int { throw DataSourceError("unreachable host"); };
    EXPECT_THROW(deadlines.Run(failing, 1000ms, "failing"), DataSourceError);

    // The slot came back
    EXPECT_EQ(deadlines.Run([] { return 3; }, 1000ms, "next"), 3);
}

TEST(DeadlineExecutorTest, ZeroTimeoutRunsInline) {
    DeadlineExecutor deadlines(1);
    const auto caller = std::this_thread::get_id();
    auto where = deadlines.Run([] { return std::this_thread::get_id(); }, 0ms, "inline");
    EXPECT_EQ(where, caller);
}

TEST(DeadlineExecutorTest, LoggerShutdownWhileTimedOutCallStillLogs) {
    Log::Init(nullptr, Log::Level::Off);
    {
        DeadlineExecutor deadlines(1);
        auto chatty = [] {
            for (int i = 0; i < 50; ++i) {
                VD_LOG_DEBUG("still fetching ({})", i);
                std::this_thread::sleep_for(1ms);
            }
            return 0;
        };
        EXPECT_THROW(deadlines.Run(chatty, 1ms, "chatty"), FetchTimeoutError);

        Log::Shutdown();
        VD_LOG_INFO("dropped after shutdown");
    }
    Log::Init(nullptr, Log::Level::Warn);
    EXPECT_EQ(Log::GetLevel(), Log::Level::Warn);
}

} // namespace verdant::test
