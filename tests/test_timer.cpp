#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

#include "util/timer.hpp"

using blelink::ThreadScheduler;
using namespace std::chrono_literals;

namespace
{
// Records fired ids; wait_for(n) blocks until n fired or 2s passed.
struct FireLog
{
    void add(int id)
    {
        {
            std::lock_guard<std::mutex> lk(mu);
            ids.push_back(id);
        }
        cv.notify_all();
    }
    bool wait_for(std::size_t n)
    {
        std::unique_lock<std::mutex> lk(mu);
        return cv.wait_for(lk, 2s, [&] { return ids.size() >= n; });
    }
    std::vector<int> snapshot()
    {
        std::lock_guard<std::mutex> lk(mu);
        return ids;
    }

    std::mutex              mu;
    std::condition_variable cv;
    std::vector<int>        ids;
};
}  // namespace

TEST(ThreadScheduler, FiresAfterDelay)
{
    ThreadScheduler s;
    FireLog         log;
    const auto      t0 = std::chrono::steady_clock::now();
    auto            t  = s.schedule(20ms, [&] { log.add(1); });
    EXPECT_TRUE(t->is_valid());

    ASSERT_TRUE(log.wait_for(1));
    EXPECT_GE(std::chrono::steady_clock::now() - t0, 20ms);
    EXPECT_FALSE(t->is_valid());
}

TEST(ThreadScheduler, FiresInDeadlineThenSubmissionOrder)
{
    ThreadScheduler s;
    FireLog         log;
    s.schedule(60ms, [&] { log.add(3); });
    s.schedule(10ms, [&] { log.add(1); });
    s.schedule(30ms, [&] { log.add(2); });

    ASSERT_TRUE(log.wait_for(3));
    EXPECT_EQ(log.snapshot(), (std::vector<int>{1, 2, 3}));
}

TEST(ThreadScheduler, InvalidatedTimerNeverFires)
{
    ThreadScheduler s;
    FireLog         log;
    auto            cancelled = s.schedule(10ms, [&] { log.add(1); });
    cancelled->invalidate();
    cancelled->invalidate();  // idempotent
    EXPECT_FALSE(cancelled->is_valid());
    s.schedule(40ms, [&] { log.add(2); });

    ASSERT_TRUE(log.wait_for(1));
    EXPECT_EQ(log.snapshot(), (std::vector<int>{2}));
}

TEST(ThreadScheduler, CallbackMayScheduleAnother)
{
    ThreadScheduler s;
    FireLog         log;
    s.schedule(5ms, [&] {
        log.add(1);
        s.schedule(5ms, [&] { log.add(2); });
    });

    ASSERT_TRUE(log.wait_for(2));
    EXPECT_EQ(log.snapshot(), (std::vector<int>{1, 2}));
}

TEST(ThreadScheduler, StopDropsPendingTimers)
{
    std::atomic_int fired{0};
    blelink::TimerPtr t;
    {
        ThreadScheduler s;
        t = s.schedule(1h, [&] { ++fired; });
        s.stop();
        EXPECT_FALSE(t->is_valid());

        // after stop nothing is accepted
        auto late = s.schedule(0ms, [&] { ++fired; });
        EXPECT_FALSE(late->is_valid());
    }
    EXPECT_EQ(fired.load(), 0);
}
