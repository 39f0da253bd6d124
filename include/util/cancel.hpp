#pragma once
#include <atomic>
#include <chrono>
#include <memory>

namespace util
{

// Polling slice used by every blocking wait that honours a CancelToken.
inline constexpr std::chrono::milliseconds CANCEL_POLL_SLICE{20};

class CancelToken
{
  public:
    // A default token is never raised.
    CancelToken() = default;

    bool cancelled() const noexcept
    {
        return flag_ && flag_->load(std::memory_order_acquire);
    }

  private:
    friend class CancelSource;
    explicit CancelToken(std::shared_ptr<std::atomic_bool> f) : flag_(std::move(f)) {}

    std::shared_ptr<std::atomic_bool> flag_;
};

class CancelSource
{
  public:
    CancelSource() : flag_(std::make_shared<std::atomic_bool>(false)) {}

    void        cancel() noexcept { flag_->store(true, std::memory_order_release); }
    bool        cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }
    CancelToken token() const { return CancelToken(flag_); }

  private:
    std::shared_ptr<std::atomic_bool> flag_;
};

}  // namespace util
