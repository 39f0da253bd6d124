#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

#include "gatt/status.hpp"
#include "gatt/types.hpp"

namespace central
{

// Raised by the adapter's link-loss callback; one per connection.
struct LinkFlag
{
    std::atomic_bool lost{false};
};

// Unbounded FIFO between an adapter notification callback and the consuming loop.
class NotifyQueue
{
  public:
    // Ignored once closed.
    void push(const gatt::Bytes &v)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_)
                return;
            q_.push_back(v);
        }
        cv_.notify_one();
    }

    // Waits up to `slice`. Items queued before close() are still handed out.
    bool pop_for(gatt::Bytes &out, std::chrono::milliseconds slice)
    {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, slice, [&] { return !q_.empty() || closed_; });
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        return true;
    }

    // First reason wins. `discard` drops anything not yet consumed.
    void close(gatt::Errc reason, bool discard = false)
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (!closed_)
            {
                closed_ = true;
                reason_ = reason;
            }
            if (discard)
                q_.clear();
        }
        cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    gatt::Errc reason() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return reason_;
    }

    std::size_t pending() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

  private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<gatt::Bytes> q_;
    bool                    closed_{false};
    gatt::Errc              reason_{gatt::Errc::Ok};
};

}  // namespace central
