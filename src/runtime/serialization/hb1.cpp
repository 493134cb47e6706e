#include "ferry/runtime/serialization/hb1.hpp"

#include <array>

namespace ferry::runtime::hb1
{
namespace
{

constexpr std::size_t kMaxVarintBytes = 10;
constexpr int kMaxCauseDepth = 64;

std::size_t encode_varint_u64(std::uint64_t value, std::uint8_t* out)
{
    std::size_t index = 0;
    while (value >= 0x80) {
        out[index++] = static_cast<std::uint8_t>(value | 0x80);
        value >>= 7;
    }
    out[index++] = static_cast<std::uint8_t>(value);
    return index;
}

Result<void> write_cause(Writer& writer, const std::shared_ptr<const GenericError>& cause)
{
    if (!cause) {
        return writer.write_byte(0);
    }
    if (auto res = writer.write_byte(1); !res) {
        return res;
    }
    return Serializer<GenericError>::write(writer, *cause);
}

Result<void> read_generic(Reader& reader, GenericError& out, int depth);

Result<void> read_cause(Reader& reader, std::shared_ptr<const GenericError>& out, int depth)
{
    bool present = false;
    if (auto res = Serializer<bool>::read(reader, present); !res) {
        return res;
    }
    if (!present) {
        out.reset();
        return {};
    }
    if (depth >= kMaxCauseDepth) {
        return unexpected_result(ErrorCode::SerializationError, "error cause chain too deep");
    }
    GenericError cause;
    if (auto res = read_generic(reader, cause, depth + 1); !res) {
        return res;
    }
    out = std::make_shared<const GenericError>(std::move(cause));
    return {};
}

Result<void> read_generic(Reader& reader, GenericError& out, int depth)
{
    auto description = reader.read_string();
    if (!description) {
        return std::unexpected(description.error());
    }
    out.description = std::move(*description);
    return read_cause(reader, out.cause, depth);
}

}  // namespace

Writer::Writer(PayloadSink& sink)
    : sink_(&sink)
{
}

Result<void> Writer::write_byte(std::uint8_t value)
{
    return sink_->append(std::span<const std::uint8_t>(&value, 1));
}

Result<void> Writer::write_varint(std::uint64_t value)
{
    std::uint8_t buffer[kMaxVarintBytes];
    auto size = encode_varint_u64(value, buffer);
    return sink_->append(std::span<const std::uint8_t>(buffer, size));
}

Result<void> Writer::write_zigzag(std::int64_t value)
{
    std::uint64_t zigzag = (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
    return write_varint(zigzag);
}

Result<void> Writer::write_fixed32(std::uint32_t value)
{
    std::array<std::uint8_t, 4> buf{};
    for (std::size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return sink_->append(buf);
}

Result<void> Writer::write_fixed64(std::uint64_t value)
{
    std::array<std::uint8_t, 8> buf{};
    for (std::size_t i = 0; i < buf.size(); ++i) {
        buf[i] = static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF);
    }
    return sink_->append(buf);
}

Result<void> Writer::write_bytes(std::span<const std::uint8_t> bytes)
{
    if (auto res = write_varint(bytes.size()); !res) {
        return res;
    }
    return sink_->append(bytes);
}

Result<void> Writer::write_string(std::string_view value)
{
    return write_bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(value.data()), value.size()));
}

Reader::Reader(PayloadSource& source)
    : source_(&source)
{
}

Result<std::uint8_t> Reader::read_byte()
{
    auto byte_span = source_->read(1);
    if (!byte_span) {
        return std::unexpected(byte_span.error());
    }
    return (*byte_span)[0];
}

Result<std::uint64_t> Reader::read_varint()
{
    std::uint64_t result = 0;
    int shift = 0;
    for (std::size_t i = 0; i < kMaxVarintBytes; ++i) {
        auto byte = read_byte();
        if (!byte) {
            return std::unexpected(byte.error());
        }
        if (i == kMaxVarintBytes - 1 && *byte > 1) {
            return unexpected_result<std::uint64_t>(ErrorCode::SerializationError, "varint overflows 64 bits");
        }
        result |= static_cast<std::uint64_t>(*byte & 0x7F) << shift;
        if ((*byte & 0x80) == 0) {
            return result;
        }
        shift += 7;
    }
    return unexpected_result<std::uint64_t>(ErrorCode::SerializationError, "varint too long");
}

Result<std::int64_t> Reader::read_zigzag()
{
    auto varint = read_varint();
    if (!varint) {
        return std::unexpected(varint.error());
    }
    std::uint64_t value = *varint;
    return static_cast<std::int64_t>((value >> 1) ^ (~(value & 1) + 1));
}

Result<std::uint32_t> Reader::read_fixed32()
{
    auto bytes = source_->read(4);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    std::uint32_t value = 0;
    for (std::size_t i = 0; i < 4; ++i) {
        value |= static_cast<std::uint32_t>((*bytes)[i]) << (i * 8);
    }
    return value;
}

Result<std::uint64_t> Reader::read_fixed64()
{
    auto bytes = source_->read(8);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < 8; ++i) {
        value |= static_cast<std::uint64_t>((*bytes)[i]) << (i * 8);
    }
    return value;
}

Result<std::size_t> Reader::read_length()
{
    auto length = read_varint();
    if (!length) {
        return std::unexpected(length.error());
    }
    if (*length > source_->remaining()) {
        return unexpected_result<std::size_t>(ErrorCode::SerializationError, "length prefix exceeds payload");
    }
    return static_cast<std::size_t>(*length);
}

Result<std::vector<std::uint8_t>> Reader::read_bytes()
{
    auto length = read_length();
    if (!length) {
        return std::unexpected(length.error());
    }
    auto bytes = source_->read(*length);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return std::vector<std::uint8_t>(bytes->begin(), bytes->end());
}

Result<std::string> Reader::read_string()
{
    auto length = read_length();
    if (!length) {
        return std::unexpected(length.error());
    }
    auto bytes = source_->read(*length);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return std::string(reinterpret_cast<const char*>(bytes->data()), bytes->size());
}

Result<void> Serializer<GenericError>::write(Writer& writer, const GenericError& value)
{
    if (auto res = writer.write_string(value.description); !res) {
        return res;
    }
    return write_cause(writer, value.cause);
}

Result<void> Serializer<GenericError>::read(Reader& reader, GenericError& out)
{
    return read_generic(reader, out, 0);
}

Result<void> Serializer<Error>::write(Writer& writer, const Error& value)
{
    if (auto res = writer.write_varint(static_cast<std::uint64_t>(value.kind())); !res) {
        return res;
    }
    if (auto res = writer.write_string(value.message); !res) {
        return res;
    }
    return write_cause(writer, value.cause);
}

Result<void> Serializer<Error>::read(Reader& reader, Error& out)
{
    auto kind = reader.read_varint();
    if (!kind) {
        return std::unexpected(kind.error());
    }
    if (*kind < static_cast<std::uint64_t>(ErrorCode::SerializationError) ||
        *kind > static_cast<std::uint64_t>(ErrorCode::Other)) {
        return unexpected_result(ErrorCode::SerializationError, "invalid error kind");
    }
    auto message = reader.read_string();
    if (!message) {
        return std::unexpected(message.error());
    }
    out.code = make_error_code(static_cast<ErrorCode>(*kind));
    out.message = std::move(*message);
    return read_cause(reader, out.cause, 0);
}

}  // namespace ferry::runtime::hb1
