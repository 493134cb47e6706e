#include "cli/ferry.hpp"

#include "cli/echo.hpp"
#include "cli/options.hpp"
#include "ferry/runtime/async_binary_transport.hpp"
#include "ferry/runtime/async_io.hpp"
#include "ferry/runtime/async_json_transport.hpp"
#include "ferry/runtime/binary_transport.hpp"
#include "ferry/runtime/client.hpp"
#include "ferry/runtime/json_transport.hpp"
#include "ferry/runtime/server.hpp"
#include "ferry/runtime/uds.hpp"

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace ferry
{
namespace
{

using Socket = boost::asio::local::stream_protocol::socket;

/**
 * @brief Connections being served, one thread each.
 *
 * Counts calls across all connections. Once the optional limit is reached
 * the pool stops: open connections are closed and the acceptor is woken by
 * a loopback connection so that it can observe `stopping()`.
 */
class ConnectionPool
{
public:
    ConnectionPool(std::string socket_path, std::optional<std::size_t> limit)
        : socket_path_(std::move(socket_path))
        , limit_(limit)
    {
    }

    ~ConnectionPool()
    {
        join();
    }

    template <typename Fn>
    void spawn(std::shared_ptr<runtime::ByteStream> stream, Fn serve)
    {
        std::lock_guard lock(mutex_);
        if (stopping_) {
            stream->close();
            return;
        }
        streams_.push_back(stream);
        workers_.emplace_back([this, stream = std::move(stream), serve = std::move(serve)] {
            serve(stream);
            release(stream);
        });
    }

    /// Records one served call. Returns false once the limit is reached.
    bool count_call()
    {
        auto served = ++served_;
        if (limit_ && served >= *limit_) {
            stop();
            return false;
        }
        return !stopping();
    }

    bool stopping() const
    {
        std::lock_guard lock(mutex_);
        return stopping_;
    }

    void stop()
    {
        std::vector<std::shared_ptr<runtime::ByteStream>> open;
        {
            std::lock_guard lock(mutex_);
            if (stopping_) {
                return;
            }
            stopping_ = true;
            open.swap(streams_);
        }
        for (auto& stream : open) {
            stream->close();
        }
        if (auto wake = runtime::uds::connect(socket_path_); wake) {
            (*wake)->close();
        }
    }

    void join()
    {
        std::vector<std::thread> workers;
        {
            std::lock_guard lock(mutex_);
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
    }

private:
    void release(const std::shared_ptr<runtime::ByteStream>& stream)
    {
        std::lock_guard lock(mutex_);
        std::erase(streams_, stream);
    }

    std::string socket_path_;
    std::optional<std::size_t> limit_;
    std::atomic<std::size_t> served_{0};
    mutable std::mutex mutex_;
    bool stopping_ = false;
    std::vector<std::shared_ptr<runtime::ByteStream>> streams_;
    std::vector<std::thread> workers_;
};

/// Serves one connection until the peer disconnects or the pool stops.
template <typename Transport>
void serve_connection(Transport transport, ConnectionPool& pool)
{
    runtime::Server<Transport> server{std::move(transport)};
    if (auto res = echo::register_methods(server); !res) {
        spdlog::error("Failed to register echo service: {}", res.error().to_string());
        return;
    }

    auto result = server.serve_until([&pool] { return pool.count_call(); });
    if (!result && result.error().kind() != runtime::ErrorCode::TransportEOF && !pool.stopping()) {
        // the connection is dropped, other connections are unaffected
        spdlog::warn("Connection failed: {}", result.error().to_string());
    }
}

int serve(const Options& opts)
{
    auto listener = runtime::uds::listen(opts.socket_path);
    if (!listener) {
        spdlog::error("Failed to listen on {}: {}", opts.socket_path, listener.error().to_string());
        return 1;
    }
    spdlog::info("Serving echo service on {}", opts.socket_path);

    ConnectionPool pool{opts.socket_path, opts.calls};
    int status = 0;
    while (true) {
        auto stream = (*listener)->accept();
        if (pool.stopping()) {
            if (stream) {
                (*stream)->close();
            }
            break;
        }
        if (!stream) {
            spdlog::error("Failed to accept connection: {}", stream.error().to_string());
            status = 1;
            pool.stop();
            break;
        }

        if (opts.codec == Codec::Json) {
            pool.spawn(*stream, [&pool, config = opts.config](std::shared_ptr<runtime::ByteStream> s) {
                serve_connection(runtime::JsonTransport{std::move(s), config}, pool);
            });
        } else {
            pool.spawn(*stream, [&pool, config = opts.config](std::shared_ptr<runtime::ByteStream> s) {
                serve_connection(runtime::BinaryTransport{std::move(s), config}, pool);
            });
        }
    }
    (*listener)->close();
    pool.join();
    return status;
}

template <typename Transport>
runtime::Result<std::string> call_describe(Transport& transport, const Options& opts)
{
    return runtime::call<std::string>(transport, echo::describe_method, runtime::param("subject", opts.subject),
                                      runtime::param("value", opts.value));
}

runtime::Result<std::string> call_blocking(const Options& opts)
{
    auto stream = runtime::uds::connect(opts.socket_path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    if (opts.codec == Codec::Json) {
        runtime::JsonTransport transport{*stream, opts.config};
        return call_describe(transport, opts);
    }
    runtime::BinaryTransport transport{*stream, opts.config};
    return call_describe(transport, opts);
}

template <typename Transport>
boost::asio::awaitable<void> async_describe(Transport transport, const Options& opts,
                                            std::optional<runtime::Result<std::string>>& outcome)
{
    outcome = co_await runtime::async_call<std::string>(transport, echo::describe_method,
                                                        runtime::param("subject", opts.subject),
                                                        runtime::param("value", opts.value));
}

runtime::Result<std::string> call_async(const Options& opts)
{
    boost::asio::io_context io;
    Socket socket{io};
    boost::system::error_code ec;
    socket.connect(boost::asio::local::stream_protocol::endpoint(opts.socket_path), ec);
    if (ec) {
        return std::unexpected(runtime::asio_error(ec, "connect failed"));
    }

    std::optional<runtime::Result<std::string>> outcome;
    boost::asio::co_spawn(
        io,
        [&]() {
            if (opts.codec == Codec::Json) {
                return async_describe(runtime::AsyncJsonTransport<Socket>{std::move(socket), opts.config}, opts,
                                      outcome);
            }
            return async_describe(runtime::AsyncBinaryTransport<Socket>{std::move(socket), opts.config}, opts,
                                  outcome);
        },
        boost::asio::detached);
    io.run();

    if (!outcome) {
        return runtime::unexpected_result<std::string>(runtime::ErrorCode::Other, "call did not complete");
    }
    return std::move(*outcome);
}

}  // namespace

int run(int argc, char* argv[])
{
    auto opts = parse_command_line(argc, argv);
    if (!opts) {
        spdlog::error("Failed to parse command line: {}", opts.error());
        return 1;
    }

    if (opts->help_message) {
        fmt::print("{}", opts->help_message.value());
        return 0;
    }

    spdlog::debug("ferry v{}.{}.{}", FERRY_VERSION_MAJOR, FERRY_VERSION_MINOR, FERRY_VERSION_PATCH);

    if (opts->serve) {
        return serve(*opts);
    }

    auto reply = opts->async ? call_async(*opts) : call_blocking(*opts);
    if (!reply) {
        spdlog::error("Call failed ({}): {}", runtime::to_string(reply.error().kind()), reply.error().to_string());
        return 1;
    }
    fmt::print("{}\n", *reply);
    return 0;
}

}  // namespace ferry
