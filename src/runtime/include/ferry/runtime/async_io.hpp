#pragma once

#include "ferry/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>
#include <boost/system/error_code.hpp>

namespace ferry::runtime
{

/// eof, or a reset from a peer that closed with unread data.
bool is_peer_closed(const boost::system::error_code& ec);

/// A closed peer is TransportEOF, anything else (cancellation included) TransportError.
Error asio_error(const boost::system::error_code& ec, std::string_view what);

template <typename AsyncStream>
boost::asio::awaitable<Result<void>> async_write_all(AsyncStream& stream, std::span<const std::uint8_t> data)
{
    boost::system::error_code ec;
    co_await boost::asio::async_write(stream, boost::asio::buffer(data.data(), data.size()),
                                      boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(asio_error(ec, "write failed"));
    }
    co_return Result<void>{};
}

template <typename AsyncStream>
boost::asio::awaitable<Result<void>> async_read_exact(AsyncStream& stream, std::span<std::uint8_t> buffer)
{
    boost::system::error_code ec;
    co_await boost::asio::async_read(stream, boost::asio::buffer(buffer.data(), buffer.size()),
                                     boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (ec) {
        co_return std::unexpected(asio_error(ec, "read failed"));
    }
    co_return Result<void>{};
}

/// Returns 0 at end of stream.
template <typename AsyncStream>
boost::asio::awaitable<Result<std::size_t>> async_read_some(AsyncStream& stream, std::span<std::uint8_t> buffer)
{
    boost::system::error_code ec;
    auto count = co_await stream.async_read_some(boost::asio::buffer(buffer.data(), buffer.size()),
                                                 boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    if (is_peer_closed(ec)) {
        co_return std::size_t{0};
    }
    if (ec) {
        co_return std::unexpected(asio_error(ec, "read failed"));
    }
    co_return count;
}

}  // namespace ferry::runtime
