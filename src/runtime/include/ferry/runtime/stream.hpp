#pragma once

#include "ferry/runtime/result.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <vector>

namespace ferry::runtime
{

/**
 * @brief Duplex byte channel hosting either codec.
 *
 * No message boundaries are assumed. `read_some` returns 0 once the peer
 * has closed its side.
 */
class ByteStream
{
public:
    virtual ~ByteStream() = default;
    virtual Result<std::size_t> read_some(std::span<std::uint8_t> buffer) = 0;
    virtual Result<void> write_all(std::span<const std::uint8_t> data) = 0;
    virtual void close() = 0;
};

/// Fills `buffer` completely. EOF before the last byte is TransportEOF.
Result<void> read_exact(ByteStream& stream, std::span<std::uint8_t> buffer);

/**
 * @brief In-memory stream reading from a fixed input and capturing output.
 *
 * Reads hand out at most `chunk` bytes at a time so that codecs see short
 * reads the way they would on a socket.
 */
class BufferStream : public ByteStream
{
public:
    explicit BufferStream(std::vector<std::uint8_t> input = {}, std::size_t chunk = 4096);

    Result<std::size_t> read_some(std::span<std::uint8_t> buffer) override;
    Result<void> write_all(std::span<const std::uint8_t> data) override;
    void close() override;

    std::vector<std::uint8_t> output() const;

private:
    mutable std::mutex mutex_;
    std::vector<std::uint8_t> input_;
    std::size_t offset_ = 0;
    std::size_t chunk_;
    std::vector<std::uint8_t> output_;
    bool closed_ = false;
};

}  // namespace ferry::runtime
