#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace blelink
{

// A single-fire delayed callback. invalidate() may be called any number of times,
// before or after firing; after it returns the callback will not start.
class TimerHandle
{
  public:
    virtual ~TimerHandle()             = default;
    virtual void invalidate()          = 0;
    virtual bool is_valid() const      = 0;  // armed and not yet fired
};

using TimerPtr = std::shared_ptr<TimerHandle>;

struct Scheduler
{
    virtual TimerPtr schedule(std::chrono::milliseconds delay, std::function<void()> fn) = 0;
    virtual ~Scheduler() = default;
};

// One worker thread firing timers in deadline order. Callbacks run on the worker,
// never under the scheduler lock, so they may schedule or invalidate other timers.
class ThreadScheduler final : public Scheduler
{
  public:
    ThreadScheduler();
    ~ThreadScheduler() override;

    TimerPtr schedule(std::chrono::milliseconds delay, std::function<void()> fn) override;
    void     stop();

  private:
    using Clock = std::chrono::steady_clock;

    class Timer;
    struct Entry
    {
        Clock::time_point      deadline;
        std::uint64_t          seq;  // FIFO among equal deadlines
        std::shared_ptr<Timer> timer;
    };
    struct Later
    {
        bool operator()(const Entry &a, const Entry &b) const
        {
            return a.deadline != b.deadline ? a.deadline > b.deadline : a.seq > b.seq;
        }
    };

    void run();

    std::mutex              mu_;
    std::condition_variable cv_;
    std::vector<Entry>      heap_;
    std::uint64_t           next_seq_{0};
    bool                    stopping_{false};
    std::thread             worker_;
};

}  // namespace blelink
