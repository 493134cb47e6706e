#pragma once

#include "ferry/runtime/result.hpp"
#include "ferry/runtime/stream.hpp"

#include <memory>
#include <string>
#include <utility>

namespace ferry::runtime::uds
{

class Server
{
public:
    ~Server();
    Result<std::shared_ptr<ByteStream>> accept();
    void close();

private:
    friend Result<std::shared_ptr<Server>> listen(const std::string& path);
    explicit Server(int fd, std::string path);
    int fd_ = -1;
    std::string path_;
};

Result<std::shared_ptr<Server>> listen(const std::string& path);
Result<std::shared_ptr<ByteStream>> connect(const std::string& path);
Result<std::pair<std::shared_ptr<ByteStream>, std::shared_ptr<ByteStream>>> socket_pair();

/// Takes ownership of a connected stream socket descriptor.
Result<std::shared_ptr<ByteStream>> adopt(int fd);

}  // namespace ferry::runtime::uds
