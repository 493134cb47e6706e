#include "ferry/runtime/uds.hpp"

#include "ferry/runtime/error.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/eventfd.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace ferry::runtime::uds
{
namespace
{

class UdsStream : public ByteStream
{
public:
    explicit UdsStream(int fd)
        : fd_(fd)
    {
        wake_fd_ = ::eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
        if (wake_fd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "eventfd");
        }
    }

    ~UdsStream() override
    {
        close();
        if (wake_fd_ >= 0) {
            ::close(wake_fd_);
        }
    }

    Result<std::size_t> read_some(std::span<std::uint8_t> buffer) override;
    Result<void> write_all(std::span<const std::uint8_t> data) override;
    void close() override;

private:
    int fd() const
    {
        return fd_.load(std::memory_order_relaxed);
    }

    std::atomic<int> fd_{-1};
    int wake_fd_ = -1;
};

Result<std::size_t> UdsStream::read_some(std::span<std::uint8_t> buffer)
{
    if (buffer.empty()) {
        return std::size_t{0};
    }
    while (true) {
        int current_fd = fd();
        if (current_fd < 0) {
            return unexpected_result<std::size_t>(ErrorCode::TransportError, "stream closed");
        }

        struct pollfd fds[2];
        fds[0].fd = current_fd;
        fds[0].events = POLLIN;
        fds[0].revents = 0;
        fds[1].fd = wake_fd_;
        fds[1].events = POLLIN;
        fds[1].revents = 0;

        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result<std::size_t>(make_errno_error("poll", err));
        }

        if (fds[1].revents & POLLIN) {
            return unexpected_result<std::size_t>(ErrorCode::TransportError, "stream closed");
        }

        if (fds[0].revents & POLLNVAL) {
            return unexpected_result<std::size_t>(ErrorCode::TransportError, "invalid stream descriptor");
        }

        if (!(fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            continue;
        }

        ssize_t read_rc = ::read(current_fd, buffer.data(), buffer.size());
        if (read_rc < 0) {
            int err = errno;
            if (err == EINTR || err == EAGAIN) {
                continue;
            }
            if (err == ECONNRESET) {
                return std::size_t{0};
            }
            return unexpected_result<std::size_t>(make_errno_error("read", err));
        }
        return static_cast<std::size_t>(read_rc);
    }
}

Result<void> UdsStream::write_all(std::span<const std::uint8_t> data)
{
    int current_fd = fd();
    if (current_fd < 0) {
        return unexpected_result(ErrorCode::TransportError, "stream closed");
    }

    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t rc = ::send(current_fd, data.data() + written, data.size() - written, MSG_NOSIGNAL);
        if (rc < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result(make_errno_error("write", err));
        }
        written += static_cast<std::size_t>(rc);
    }
    return {};
}

void UdsStream::close()
{
    int old = fd_;
    fd_ = -1;
    if (old >= 0) {
        ::shutdown(old, SHUT_RDWR);
        ::close(old);
    }
    if (wake_fd_ >= 0) {
        std::uint64_t one = 1;
        [[maybe_unused]] auto rc = ::write(wake_fd_, &one, sizeof(one));
    }
}

int create_socket()
{
    int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    return fd;
}

sockaddr_un make_address(const std::string& path)
{
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw std::runtime_error("Unix socket path too long");
    }
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
    return addr;
}

}  // namespace

Result<std::shared_ptr<ByteStream>> adopt(int fd)
{
    if (fd < 0) {
        return unexpected_result<std::shared_ptr<ByteStream>>(ErrorCode::TransportError, "invalid stream descriptor");
    }
    try {
        return std::make_shared<UdsStream>(fd);
    } catch (const std::system_error& ex) {
        ::close(fd);
        return unexpected_result<std::shared_ptr<ByteStream>>(ErrorCode::TransportError, "cannot create stream",
                                                              GenericError::from_exception(ex));
    }
}

Server::Server(int fd, std::string path)
    : fd_(fd)
    , path_(std::move(path))
{
}

Server::~Server()
{
    close();
    if (!path_.empty()) {
        ::unlink(path_.c_str());
    }
}

void Server::close()
{
    int old = fd_;
    fd_ = -1;
    if (old >= 0) {
        ::shutdown(old, SHUT_RDWR);
        ::close(old);
    }
}

Result<std::shared_ptr<ByteStream>> Server::accept()
{
    if (fd_ < 0) {
        return unexpected_result<std::shared_ptr<ByteStream>>(ErrorCode::TransportError, "server socket closed");
    }

    while (true) {
        int client_fd = ::accept4(fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) {
            int err = errno;
            if (err == EINTR) {
                continue;
            }
            return unexpected_result<std::shared_ptr<ByteStream>>(make_errno_error("accept", err));
        }
        return adopt(client_fd);
    }
}

Result<std::shared_ptr<Server>> listen(const std::string& path)
{
    try {
        sockaddr_un addr = make_address(path);
        int fd = create_socket();
        ::unlink(path.c_str());
        if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Server>>(make_errno_error("bind", err));
        }
        if (::listen(fd, SOMAXCONN) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<Server>>(make_errno_error("listen", err));
        }
        return std::shared_ptr<Server>(new Server(fd, path));
    } catch (const std::exception& ex) {
        return unexpected_result<std::shared_ptr<Server>>(ErrorCode::TransportError, "cannot listen on " + path,
                                                          GenericError::from_exception(ex));
    }
}

Result<std::shared_ptr<ByteStream>> connect(const std::string& path)
{
    try {
        sockaddr_un addr = make_address(path);
        int fd = create_socket();
        if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
            int err = errno;
            ::close(fd);
            return unexpected_result<std::shared_ptr<ByteStream>>(make_errno_error("connect", err));
        }
        return adopt(fd);
    } catch (const std::exception& ex) {
        return unexpected_result<std::shared_ptr<ByteStream>>(ErrorCode::TransportError, "cannot connect to " + path,
                                                              GenericError::from_exception(ex));
    }
}

Result<std::pair<std::shared_ptr<ByteStream>, std::shared_ptr<ByteStream>>> socket_pair()
{
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) < 0) {
        return unexpected_result<std::pair<std::shared_ptr<ByteStream>, std::shared_ptr<ByteStream>>>(
            make_errno_error("socketpair", errno));
    }

    auto first = adopt(fds[0]);
    if (!first) {
        ::close(fds[1]);
        return std::unexpected(first.error());
    }

    auto second = adopt(fds[1]);
    if (!second) {
        return std::unexpected(second.error());
    }

    return std::make_pair(*first, *second);
}

}  // namespace ferry::runtime::uds
