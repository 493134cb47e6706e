#pragma once

#include "ferry/runtime/result.hpp"
#include "ferry/runtime/serialization/payload.hpp"

#include <bit>
#include <cstdint>
#include <expected>
#include <limits>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

#include <boost/fusion/include/for_each.hpp>
#include <boost/fusion/include/is_sequence.hpp>

/**
 * HB1 positional value encoding.
 *
 * Values carry no field names or tags: a reader must request exactly the
 * types the writer produced, in the same order. Unsigned integers are
 * LEB128 varints, signed integers zigzag varints, floating point values
 * fixed-width little-endian. Structs adapted with BOOST_FUSION_ADAPT_STRUCT
 * are written member by member; anything else specializes hb1::Serializer.
 */
namespace ferry::runtime::hb1
{

class Writer
{
public:
    explicit Writer(PayloadSink& sink);

    Result<void> write_byte(std::uint8_t value);
    Result<void> write_varint(std::uint64_t value);
    Result<void> write_zigzag(std::int64_t value);
    Result<void> write_fixed32(std::uint32_t value);
    Result<void> write_fixed64(std::uint64_t value);
    Result<void> write_bytes(std::span<const std::uint8_t> bytes);
    Result<void> write_string(std::string_view value);

private:
    PayloadSink* sink_;
};

class Reader
{
public:
    explicit Reader(PayloadSource& source);

    Result<std::uint8_t> read_byte();
    Result<std::uint64_t> read_varint();
    Result<std::int64_t> read_zigzag();
    Result<std::uint32_t> read_fixed32();
    Result<std::uint64_t> read_fixed64();
    Result<std::vector<std::uint8_t>> read_bytes();
    Result<std::string> read_string();

    /// Element count prefix; never larger than the bytes left in the payload.
    Result<std::size_t> read_length();

    std::size_t remaining() const
    {
        return source_->remaining();
    }

private:
    PayloadSource* source_;
};

template <typename T>
inline constexpr bool always_false = false;

template <typename T, typename Enable = void>
struct Serializer {
    static Result<void> write(Writer& writer, const T& value)
    {
        if constexpr (std::is_same_v<T, bool>) {
            return writer.write_byte(value ? 1 : 0);
        } else if constexpr (std::is_enum_v<T>) {
            using Underlying = std::underlying_type_t<T>;
            return Serializer<Underlying>::write(writer, static_cast<Underlying>(value));
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            return writer.write_varint(value);
        } else if constexpr (std::is_integral_v<T>) {
            return writer.write_zigzag(value);
        } else if constexpr (std::is_same_v<T, float>) {
            return writer.write_fixed32(std::bit_cast<std::uint32_t>(value));
        } else if constexpr (std::is_same_v<T, double>) {
            return writer.write_fixed64(std::bit_cast<std::uint64_t>(value));
        } else if constexpr (boost::fusion::traits::is_sequence<T>::value) {
            Result<void> status;
            boost::fusion::for_each(value, [&](const auto& field) {
                if (status) {
                    status = Serializer<std::decay_t<decltype(field)>>::write(writer, field);
                }
            });
            return status;
        } else {
            static_assert(always_false<T>,
                          "no HB1 encoding: adapt the type with BOOST_FUSION_ADAPT_STRUCT or specialize hb1::Serializer");
        }
    }

    static Result<void> read(Reader& reader, T& out)
    {
        if constexpr (std::is_same_v<T, bool>) {
            auto byte = reader.read_byte();
            if (!byte) {
                return std::unexpected(byte.error());
            }
            if (*byte > 1) {
                return unexpected_result(ErrorCode::SerializationError, "invalid bool byte");
            }
            out = *byte == 1;
            return {};
        } else if constexpr (std::is_enum_v<T>) {
            std::underlying_type_t<T> raw{};
            if (auto res = Serializer<std::underlying_type_t<T>>::read(reader, raw); !res) {
                return res;
            }
            out = static_cast<T>(raw);
            return {};
        } else if constexpr (std::is_integral_v<T> && std::is_unsigned_v<T>) {
            auto value = reader.read_varint();
            if (!value) {
                return std::unexpected(value.error());
            }
            if (*value > std::numeric_limits<T>::max()) {
                return unexpected_result(ErrorCode::SerializationError, "unsigned integer out of range");
            }
            out = static_cast<T>(*value);
            return {};
        } else if constexpr (std::is_integral_v<T>) {
            auto value = reader.read_zigzag();
            if (!value) {
                return std::unexpected(value.error());
            }
            if (*value < std::numeric_limits<T>::min() || *value > std::numeric_limits<T>::max()) {
                return unexpected_result(ErrorCode::SerializationError, "signed integer out of range");
            }
            out = static_cast<T>(*value);
            return {};
        } else if constexpr (std::is_same_v<T, float>) {
            auto bits = reader.read_fixed32();
            if (!bits) {
                return std::unexpected(bits.error());
            }
            out = std::bit_cast<float>(*bits);
            return {};
        } else if constexpr (std::is_same_v<T, double>) {
            auto bits = reader.read_fixed64();
            if (!bits) {
                return std::unexpected(bits.error());
            }
            out = std::bit_cast<double>(*bits);
            return {};
        } else if constexpr (boost::fusion::traits::is_sequence<T>::value) {
            Result<void> status;
            boost::fusion::for_each(out, [&](auto& field) {
                if (status) {
                    status = Serializer<std::decay_t<decltype(field)>>::read(reader, field);
                }
            });
            return status;
        } else {
            static_assert(always_false<T>,
                          "no HB1 encoding: adapt the type with BOOST_FUSION_ADAPT_STRUCT or specialize hb1::Serializer");
        }
    }
};

template <typename T>
Result<void> encode(Writer& writer, const T& value)
{
    return Serializer<T>::write(writer, value);
}

template <typename T>
Result<T> decode(Reader& reader)
{
    T value{};
    if (auto res = Serializer<T>::read(reader, value); !res) {
        return std::unexpected(res.error());
    }
    return value;
}

template <>
struct Serializer<std::string> {
    static Result<void> write(Writer& writer, const std::string& value)
    {
        return writer.write_string(value);
    }

    static Result<void> read(Reader& reader, std::string& out)
    {
        auto text = reader.read_string();
        if (!text) {
            return std::unexpected(text.error());
        }
        out = std::move(*text);
        return {};
    }
};

template <>
struct Serializer<std::monostate> {
    static Result<void> write(Writer&, const std::monostate&)
    {
        return {};
    }

    static Result<void> read(Reader&, std::monostate&)
    {
        return {};
    }
};

template <typename T, typename Alloc>
struct Serializer<std::vector<T, Alloc>> {
    static Result<void> write(Writer& writer, const std::vector<T, Alloc>& value)
    {
        if constexpr (std::is_same_v<T, std::uint8_t>) {
            return writer.write_bytes(value);
        } else {
            if (auto res = writer.write_varint(value.size()); !res) {
                return res;
            }
            for (const auto& item : value) {
                if (auto res = Serializer<T>::write(writer, item); !res) {
                    return res;
                }
            }
            return {};
        }
    }

    static Result<void> read(Reader& reader, std::vector<T, Alloc>& out)
    {
        if constexpr (std::is_same_v<T, std::uint8_t>) {
            auto bytes = reader.read_bytes();
            if (!bytes) {
                return std::unexpected(bytes.error());
            }
            out.assign(bytes->begin(), bytes->end());
            return {};
        } else {
            auto count = reader.read_length();
            if (!count) {
                return std::unexpected(count.error());
            }
            out.clear();
            out.reserve(*count);
            for (std::size_t i = 0; i < *count; ++i) {
                T item{};
                if (auto res = Serializer<T>::read(reader, item); !res) {
                    return res;
                }
                out.push_back(std::move(item));
            }
            return {};
        }
    }
};

template <typename T>
struct Serializer<std::optional<T>> {
    static Result<void> write(Writer& writer, const std::optional<T>& value)
    {
        if (!value) {
            return writer.write_byte(0);
        }
        if (auto res = writer.write_byte(1); !res) {
            return res;
        }
        return Serializer<T>::write(writer, *value);
    }

    static Result<void> read(Reader& reader, std::optional<T>& out)
    {
        bool present = false;
        if (auto res = Serializer<bool>::read(reader, present); !res) {
            return res;
        }
        if (!present) {
            out.reset();
            return {};
        }
        T value{};
        if (auto res = Serializer<T>::read(reader, value); !res) {
            return res;
        }
        out = std::move(value);
        return {};
    }
};

template <typename Map>
struct MapSerializer {
    static Result<void> write(Writer& writer, const Map& value)
    {
        if (auto res = writer.write_varint(value.size()); !res) {
            return res;
        }
        for (const auto& [key, item] : value) {
            if (auto res = Serializer<typename Map::key_type>::write(writer, key); !res) {
                return res;
            }
            if (auto res = Serializer<typename Map::mapped_type>::write(writer, item); !res) {
                return res;
            }
        }
        return {};
    }

    static Result<void> read(Reader& reader, Map& out)
    {
        auto count = reader.read_length();
        if (!count) {
            return std::unexpected(count.error());
        }
        out.clear();
        for (std::size_t i = 0; i < *count; ++i) {
            typename Map::key_type key{};
            typename Map::mapped_type item{};
            if (auto res = Serializer<typename Map::key_type>::read(reader, key); !res) {
                return res;
            }
            if (auto res = Serializer<typename Map::mapped_type>::read(reader, item); !res) {
                return res;
            }
            out.insert_or_assign(std::move(key), std::move(item));
        }
        return {};
    }
};

template <typename K, typename V, typename Compare, typename Alloc>
struct Serializer<std::map<K, V, Compare, Alloc>> : MapSerializer<std::map<K, V, Compare, Alloc>> {
};

template <typename K, typename V, typename Hash, typename Eq, typename Alloc>
struct Serializer<std::unordered_map<K, V, Hash, Eq, Alloc>>
    : MapSerializer<std::unordered_map<K, V, Hash, Eq, Alloc>> {
};

template <typename A, typename B>
struct Serializer<std::pair<A, B>> {
    static Result<void> write(Writer& writer, const std::pair<A, B>& value)
    {
        if (auto res = Serializer<A>::write(writer, value.first); !res) {
            return res;
        }
        return Serializer<B>::write(writer, value.second);
    }

    static Result<void> read(Reader& reader, std::pair<A, B>& out)
    {
        if (auto res = Serializer<A>::read(reader, out.first); !res) {
            return res;
        }
        return Serializer<B>::read(reader, out.second);
    }
};

template <typename... Ts>
struct Serializer<std::tuple<Ts...>> {
    static Result<void> write(Writer& writer, const std::tuple<Ts...>& value)
    {
        Result<void> status;
        std::apply(
            [&](const auto&... items) {
                ((status = Serializer<std::decay_t<decltype(items)>>::write(writer, items)) && ...);
            },
            value);
        return status;
    }

    static Result<void> read(Reader& reader, std::tuple<Ts...>& out)
    {
        Result<void> status;
        std::apply(
            [&](auto&... items) {
                ((status = Serializer<std::decay_t<decltype(items)>>::read(reader, items)) && ...);
            },
            out);
        return status;
    }
};

/// Arm tag 0 carries the value, 1 the error.
template <typename T, typename E>
struct Serializer<std::expected<T, E>> {
    static Result<void> write(Writer& writer, const std::expected<T, E>& value)
    {
        if (!value) {
            if (auto res = writer.write_varint(1); !res) {
                return res;
            }
            return Serializer<E>::write(writer, value.error());
        }
        if (auto res = writer.write_varint(0); !res) {
            return res;
        }
        if constexpr (std::is_void_v<T>) {
            return {};
        } else {
            return Serializer<T>::write(writer, *value);
        }
    }

    static Result<void> read(Reader& reader, std::expected<T, E>& out)
    {
        auto tag = reader.read_varint();
        if (!tag) {
            return std::unexpected(tag.error());
        }
        if (*tag == 1) {
            E error{};
            if (auto res = Serializer<E>::read(reader, error); !res) {
                return res;
            }
            out = std::unexpected(std::move(error));
            return {};
        }
        if (*tag != 0) {
            return unexpected_result(ErrorCode::SerializationError, "invalid result arm tag");
        }
        if constexpr (std::is_void_v<T>) {
            out = std::expected<T, E>{};
        } else {
            T value{};
            if (auto res = Serializer<T>::read(reader, value); !res) {
                return res;
            }
            out = std::move(value);
        }
        return {};
    }
};

template <>
struct Serializer<GenericError> {
    static Result<void> write(Writer& writer, const GenericError& value);
    static Result<void> read(Reader& reader, GenericError& out);
};

template <>
struct Serializer<Error> {
    static Result<void> write(Writer& writer, const Error& value);
    static Result<void> read(Reader& reader, Error& out);
};

/// Encodes a single value into a fresh buffer.
template <typename T>
Result<std::vector<std::uint8_t>> to_bytes(const T& value)
{
    std::vector<std::uint8_t> buffer;
    VectorSink sink{buffer};
    Writer writer{sink};
    if (auto res = encode(writer, value); !res) {
        return std::unexpected(res.error());
    }
    return buffer;
}

/// Decodes a single value that must span the whole buffer.
template <typename T>
Result<T> from_bytes(std::span<const std::uint8_t> data)
{
    SpanSource source{data};
    Reader reader{source};
    auto value = decode<T>(reader);
    if (!value) {
        return value;
    }
    if (!source.empty()) {
        return unexpected_result<T>(ErrorCode::SerializationError, "trailing bytes after value");
    }
    return value;
}

}  // namespace ferry::runtime::hb1
