#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace core
{

// Strict FIFO with exactly one active command: the head. The owner dispatches the
// head through the execute handler and calls next(head) once its result has been
// delivered. Success and failure look the same here.
//
// T is copied out to the handler, so use a cheap handle (e.g. shared_ptr) when the
// command must outlive a synchronous completion that pops it.
template <typename T>
class CommandQueue
{
  public:
    using ExecuteHandler = std::function<void(T)>;

    void set_execute_handler(ExecuteHandler fn)
    {
        std::lock_guard<std::mutex> lk(mu_);
        execute_ = std::move(fn);
    }

    // Dispatches immediately when the queue was empty.
    void append(T command)
    {
        bool start = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            queue_.push_back(std::move(command));
            start = (queue_.size() == 1);
        }
        if (start)
            execute_head();
    }

    // Drops `done` and dispatches the following command. Ignored when `done` is no
    // longer the head (the queue was torn down and refilled while it ran).
    void next(const T &done)
    {
        bool more = false;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (queue_.empty() || !(queue_.front() == done))
                return;
            queue_.pop_front();
            more = !queue_.empty();
        }
        if (more)
            execute_head();
    }

    // No completion is fired; an already dispatched head is orphaned.
    void remove_all()
    {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.clear();
    }

    std::optional<T> first() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        if (queue_.empty())
            return std::nullopt;
        return queue_.front();
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return queue_.size();
    }

    bool empty() const { return size() == 0; }

  private:
    void execute_head()
    {
        std::optional<T> head;
        ExecuteHandler   fn;
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (queue_.empty())
                return;
            head = queue_.front();
            fn   = execute_;
        }
        // handler may complete inline and re-enter next(head)
        if (fn)
            fn(std::move(*head));
    }

    mutable std::mutex mu_;
    std::deque<T>      queue_;
    ExecuteHandler     execute_;
};

}  // namespace core
