#pragma once

#include "ferry/runtime/async_mutex.hpp"
#include "ferry/runtime/result.hpp"

#include <functional>
#include <mutex>
#include <type_traits>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

namespace ferry::runtime
{

/**
 * @brief Shares one blocking client transport between threads.
 *
 * The transport is reachable only through `lock`, which holds a mutex for
 * the duration of the callback. One whole call runs inside one callback, so
 * calls never interleave on the wire.
 */
template <typename Transport>
class Synchronized
{
public:
    explicit Synchronized(Transport transport)
        : transport_(std::move(transport))
    {
    }

    template <typename Fn>
    std::invoke_result_t<Fn, Transport&> lock(Fn&& fn) const
    {
        std::lock_guard guard(mutex_);
        return std::invoke(std::forward<Fn>(fn), transport_);
    }

private:
    mutable std::mutex mutex_;
    mutable Transport transport_;
};

/**
 * @brief Shares one coroutine client transport between coroutines.
 *
 * Same contract as Synchronized, with an AsyncMutex so that waiting for the
 * transport suspends instead of blocking the thread. `fn` must return an
 * awaitable of some `Result`.
 */
template <typename Transport>
class AsyncSynchronized
{
public:
    AsyncSynchronized(boost::asio::any_io_executor executor, Transport transport)
        : mutex_(std::move(executor))
        , transport_(std::move(transport))
    {
    }

    template <typename Fn>
    std::invoke_result_t<Fn, Transport&> lock(Fn fn) const
    {
        auto guard = co_await mutex_.scoped_lock();
        if (!guard) {
            co_return std::unexpected(guard.error());
        }
        co_return co_await std::invoke(fn, transport_);
    }

private:
    mutable AsyncMutex mutex_;
    mutable Transport transport_;
};

template <typename T>
struct is_synchronized : std::false_type {
};

template <typename Transport>
struct is_synchronized<Synchronized<Transport>> : std::true_type {
};

template <typename Transport>
struct is_synchronized<AsyncSynchronized<Transport>> : std::true_type {
};

template <typename T>
inline constexpr bool is_synchronized_v = is_synchronized<std::remove_cvref_t<T>>::value;

}  // namespace ferry::runtime
