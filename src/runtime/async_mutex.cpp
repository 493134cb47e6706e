#include "ferry/runtime/async_mutex.hpp"

#include <algorithm>
#include <chrono>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace ferry::runtime
{

AsyncMutex::AsyncMutex(boost::asio::any_io_executor executor)
    : executor_(std::move(executor))
{
}

boost::asio::awaitable<Result<void>> AsyncMutex::lock()
{
    if (try_lock()) {
        co_return Result<void>{};
    }

    auto waiter = std::make_shared<Waiter>(executor_);
    waiter->timer.expires_at(std::chrono::steady_clock::time_point::max());
    waiters_.push_back(waiter);

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    // unlock() hands the mutex over by cancelling the timer, so a cancelled wait is the normal wake-up
    if (waiter->granted) {
        co_return Result<void>{};
    }
    waiters_.erase(std::remove(waiters_.begin(), waiters_.end(), waiter), waiters_.end());
    co_return unexpected_result(ErrorCode::Other, "lock wait aborted: " + ec.message());
}

boost::asio::awaitable<Result<AsyncMutex::Lock>> AsyncMutex::scoped_lock()
{
    if (auto res = co_await lock(); !res) {
        co_return std::unexpected(res.error());
    }
    co_return Lock{*this};
}

bool AsyncMutex::try_lock()
{
    if (locked_) {
        return false;
    }
    locked_ = true;
    return true;
}

void AsyncMutex::unlock()
{
    if (waiters_.empty()) {
        locked_ = false;
        return;
    }
    auto next = std::move(waiters_.front());
    waiters_.pop_front();
    next->granted = true;
    next->timer.cancel();
}

}  // namespace ferry::runtime
