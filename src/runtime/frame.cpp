#include "ferry/runtime/frame.hpp"

#include <algorithm>
#include <limits>

#include <fmt/core.h>

namespace ferry::runtime
{
namespace
{

inline void write_le32(std::uint8_t* dst, std::uint32_t value)
{
    dst[0] = static_cast<std::uint8_t>(value & 0xFFU);
    dst[1] = static_cast<std::uint8_t>((value >> 8U) & 0xFFU);
    dst[2] = static_cast<std::uint8_t>((value >> 16U) & 0xFFU);
    dst[3] = static_cast<std::uint8_t>((value >> 24U) & 0xFFU);
}

inline std::uint32_t read_le32(const std::uint8_t* src)
{
    return static_cast<std::uint32_t>(src[0]) | (static_cast<std::uint32_t>(src[1]) << 8U) |
           (static_cast<std::uint32_t>(src[2]) << 16U) | (static_cast<std::uint32_t>(src[3]) << 24U);
}

}  // namespace

void encode_header(const FrameHeader& header, std::span<std::uint8_t, FrameHeaderSize> out)
{
    std::copy(FrameMagic.begin(), FrameMagic.end(), out.begin());
    write_le32(out.data() + FrameMagic.size(), header.length);
}

Result<FrameHeader> decode_header(std::span<const std::uint8_t, FrameHeaderSize> buffer)
{
    if (!std::equal(FrameMagic.begin(), FrameMagic.end(), buffer.begin())) {
        return unexpected_result<FrameHeader>(ErrorCode::SerializationError, "invalid frame magic");
    }
    FrameHeader header;
    header.length = read_le32(buffer.data() + FrameMagic.size());
    return header;
}

Result<std::vector<std::uint8_t>> encode_frame(std::span<const std::uint8_t> payload)
{
    if (payload.size() > std::numeric_limits<std::uint32_t>::max()) {
        return unexpected_result<std::vector<std::uint8_t>>(ErrorCode::SerializationError, "frame payload too large");
    }
    std::vector<std::uint8_t> frame(FrameHeaderSize + payload.size());
    encode_header(FrameHeader{static_cast<std::uint32_t>(payload.size())},
                  std::span<std::uint8_t, FrameHeaderSize>(frame.data(), FrameHeaderSize));
    std::copy(payload.begin(), payload.end(), frame.begin() + FrameHeaderSize);
    return frame;
}

Result<void> check_frame_length(const FrameHeader& header, std::uint32_t max_length)
{
    if (header.length > max_length) {
        return unexpected_result(ErrorCode::SerializationError,
                                 fmt::format("frame length {} exceeds limit {}", header.length, max_length));
    }
    return {};
}

Result<void> write_frame(ByteStream& stream, std::span<const std::uint8_t> payload)
{
    auto frame = encode_frame(payload);
    if (!frame) {
        return std::unexpected(frame.error());
    }
    return stream.write_all(*frame);
}

Result<std::vector<std::uint8_t>> read_frame(ByteStream& stream, std::uint32_t max_length)
{
    std::array<std::uint8_t, FrameHeaderSize> header_buffer{};
    if (auto res = read_exact(stream, header_buffer); !res) {
        return std::unexpected(res.error());
    }

    auto header = decode_header(header_buffer);
    if (!header) {
        return std::unexpected(header.error());
    }
    if (auto res = check_frame_length(*header, max_length); !res) {
        return std::unexpected(res.error());
    }

    std::vector<std::uint8_t> payload(header->length);
    if (!payload.empty()) {
        if (auto res = read_exact(stream, payload); !res) {
            return std::unexpected(res.error());
        }
    }
    return payload;
}

}  // namespace ferry::runtime
