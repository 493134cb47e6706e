#pragma once

#include "ferry/runtime/result.hpp"
#include "ferry/runtime/stream.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace ferry::runtime
{

constexpr std::array<std::uint8_t, 6> FrameMagic{'F', 'E', 'R', 'R', 'Y', '1'};
constexpr std::size_t FrameHeaderSize = FrameMagic.size() + sizeof(std::uint32_t);

/// magic(6) || length(4, little-endian) || payload(length)
struct FrameHeader {
    std::uint32_t length = 0;
};

void encode_header(const FrameHeader& header, std::span<std::uint8_t, FrameHeaderSize> out);
Result<FrameHeader> decode_header(std::span<const std::uint8_t, FrameHeaderSize> buffer);

/// Header and payload in one contiguous buffer, ready for a single write.
Result<std::vector<std::uint8_t>> encode_frame(std::span<const std::uint8_t> payload);

/// Checks a decoded header against the configured limit before the payload is allocated.
Result<void> check_frame_length(const FrameHeader& header, std::uint32_t max_length);

Result<void> write_frame(ByteStream& stream, std::span<const std::uint8_t> payload);
Result<std::vector<std::uint8_t>> read_frame(ByteStream& stream, std::uint32_t max_length);

}  // namespace ferry::runtime
