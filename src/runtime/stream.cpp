#include "ferry/runtime/stream.hpp"

#include <algorithm>
#include <cstring>

namespace ferry::runtime
{

Result<void> read_exact(ByteStream& stream, std::span<std::uint8_t> buffer)
{
    std::size_t filled = 0;
    while (filled < buffer.size()) {
        auto count = stream.read_some(buffer.subspan(filled));
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            return unexpected_result(ErrorCode::TransportEOF, "peer closed connection");
        }
        filled += *count;
    }
    return {};
}

BufferStream::BufferStream(std::vector<std::uint8_t> input, std::size_t chunk)
    : input_(std::move(input))
    , chunk_(chunk == 0 ? 1 : chunk)
{
}

Result<std::size_t> BufferStream::read_some(std::span<std::uint8_t> buffer)
{
    std::lock_guard lock(mutex_);
    if (closed_) {
        return unexpected_result<std::size_t>(ErrorCode::TransportError, "stream closed");
    }
    auto count = std::min({buffer.size(), chunk_, input_.size() - offset_});
    if (count > 0) {
        std::memcpy(buffer.data(), input_.data() + offset_, count);
        offset_ += count;
    }
    return count;
}

Result<void> BufferStream::write_all(std::span<const std::uint8_t> data)
{
    std::lock_guard lock(mutex_);
    if (closed_) {
        return unexpected_result(ErrorCode::TransportError, "stream closed");
    }
    output_.insert(output_.end(), data.begin(), data.end());
    return {};
}

void BufferStream::close()
{
    std::lock_guard lock(mutex_);
    closed_ = true;
}

std::vector<std::uint8_t> BufferStream::output() const
{
    std::lock_guard lock(mutex_);
    return output_;
}

}  // namespace ferry::runtime
