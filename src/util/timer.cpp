#include <algorithm>
#include <utility>

#include "util/log.hpp"
#include "util/timer.hpp"

namespace blelink
{

class ThreadScheduler::Timer final : public TimerHandle
{
  public:
    explicit Timer(std::function<void()> fn) : fn_(std::move(fn)) {}

    void invalidate() override { armed_.store(false, std::memory_order_release); }
    bool is_valid() const override { return armed_.load(std::memory_order_acquire); }

    // first caller between fire() and invalidate() wins
    void fire()
    {
        if (!armed_.exchange(false, std::memory_order_acq_rel))
            return;
        if (fn_)
            fn_();
        fn_ = nullptr;
    }

  private:
    std::atomic_bool      armed_{true};
    std::function<void()> fn_;
};

ThreadScheduler::ThreadScheduler()
{
    worker_ = std::thread([this] { run(); });
}

ThreadScheduler::~ThreadScheduler()
{
    stop();
}

TimerPtr ThreadScheduler::schedule(std::chrono::milliseconds delay, std::function<void()> fn)
{
    auto timer = std::make_shared<Timer>(std::move(fn));
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_)
        {
            LOG_WARN("[TIMER] schedule after stop; timer will never fire");
            timer->invalidate();
            return timer;
        }
        heap_.push_back(Entry{Clock::now() + delay, next_seq_++, timer});
        std::push_heap(heap_.begin(), heap_.end(), Later{});
    }
    cv_.notify_one();
    return timer;
}

void ThreadScheduler::stop()
{
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_ && !worker_.joinable())
            return;
        stopping_ = true;
        for (auto &e : heap_)
            e.timer->invalidate();
        heap_.clear();
    }
    cv_.notify_all();
    // never join from the worker itself (a callback destroying its scheduler)
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id())
        worker_.join();
}

void ThreadScheduler::run()
{
    std::unique_lock<std::mutex> lk(mu_);
    while (!stopping_)
    {
        if (heap_.empty())
        {
            cv_.wait(lk);
            continue;
        }
        const auto deadline = heap_.front().deadline;
        if (Clock::now() < deadline)
        {
            cv_.wait_until(lk, deadline);
            continue;
        }
        std::pop_heap(heap_.begin(), heap_.end(), Later{});
        auto timer = std::move(heap_.back().timer);
        heap_.pop_back();

        lk.unlock();
        timer->fire();
        lk.lock();
    }
}

}  // namespace blelink
