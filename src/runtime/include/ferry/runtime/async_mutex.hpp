#pragma once

#include "ferry/runtime/result.hpp"

#include <deque>
#include <memory>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace ferry::runtime
{

/**
 * @brief Mutex whose wait is a coroutine suspension point.
 *
 * Waiters are granted the lock in arrival order. All users must run on the
 * same single-threaded executor (one io_context thread or one strand).
 */
class AsyncMutex
{
public:
    /// Releases the mutex when destroyed.
    class Lock
    {
    public:
        explicit Lock(AsyncMutex& mutex)
            : mutex_(&mutex)
        {
        }

        Lock(Lock&& other)
            : mutex_(std::exchange(other.mutex_, nullptr))
        {
        }

        Lock& operator=(Lock&& other)
        {
            if (this != &other) {
                release();
                mutex_ = std::exchange(other.mutex_, nullptr);
            }
            return *this;
        }

        Lock(const Lock&) = delete;
        Lock& operator=(const Lock&) = delete;

        ~Lock()
        {
            release();
        }

        void release()
        {
            if (mutex_) {
                std::exchange(mutex_, nullptr)->unlock();
            }
        }

    private:
        AsyncMutex* mutex_;
    };

    explicit AsyncMutex(boost::asio::any_io_executor executor);

    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    /// Fails with ErrorCode::Other if the wait is aborted before the lock is granted.
    boost::asio::awaitable<Result<void>> lock();

    /// `lock` wrapped in a guard.
    boost::asio::awaitable<Result<Lock>> scoped_lock();

    bool try_lock();
    void unlock();

    bool locked() const
    {
        return locked_;
    }

private:
    struct Waiter {
        explicit Waiter(const boost::asio::any_io_executor& executor)
            : timer(executor)
        {
        }

        boost::asio::steady_timer timer;
        bool granted = false;
    };

    boost::asio::any_io_executor executor_;
    bool locked_ = false;
    std::deque<std::shared_ptr<Waiter>> waiters_;
};

}  // namespace ferry::runtime
