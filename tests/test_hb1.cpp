#include "ferry/runtime/serialization/hb1.hpp"

#include <gtest/gtest.h>

#include <boost/fusion/include/adapt_struct.hpp>

#include <cstdint>
#include <limits>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

using namespace ferry::runtime;
using namespace ferry::runtime::hb1;

namespace test
{

enum class Color : std::uint8_t {
    Red = 1,
    Blue = 200,
};

struct Point {
    std::int32_t x = 0;
    std::int32_t y = 0;
};

struct Shape {
    std::string name;
    std::vector<Point> points;
    std::optional<Color> color;
    double scale = 1.0;
};

bool operator==(const Point& lhs, const Point& rhs)
{
    return lhs.x == rhs.x && lhs.y == rhs.y;
}

bool operator==(const Shape& lhs, const Shape& rhs)
{
    return lhs.name == rhs.name && lhs.points == rhs.points && lhs.color == rhs.color && lhs.scale == rhs.scale;
}

}  // namespace test

BOOST_FUSION_ADAPT_STRUCT(test::Point, x, y)
BOOST_FUSION_ADAPT_STRUCT(test::Shape, name, points, color, scale)

namespace
{

template <typename T>
std::vector<std::uint8_t> bytes_of(const T& value)
{
    auto bytes = to_bytes(value);
    EXPECT_TRUE(bytes);
    return bytes.value_or(std::vector<std::uint8_t>{});
}

}  // namespace

TEST(Hb1, UnsignedVarintLayout)
{
    EXPECT_EQ(bytes_of(std::uint32_t{0}), (std::vector<std::uint8_t>{0x00}));
    EXPECT_EQ(bytes_of(std::uint32_t{127}), (std::vector<std::uint8_t>{0x7F}));
    EXPECT_EQ(bytes_of(std::uint32_t{128}), (std::vector<std::uint8_t>{0x80, 0x01}));
    EXPECT_EQ(bytes_of(std::uint32_t{300}), (std::vector<std::uint8_t>{0xAC, 0x02}));
    EXPECT_EQ(bytes_of(std::numeric_limits<std::uint64_t>::max()).size(), 10u);
}

TEST(Hb1, SignedIntegersUseZigzag)
{
    EXPECT_EQ(bytes_of(std::int32_t{0}), (std::vector<std::uint8_t>{0x00}));
    EXPECT_EQ(bytes_of(std::int32_t{-1}), (std::vector<std::uint8_t>{0x01}));
    EXPECT_EQ(bytes_of(std::int32_t{1}), (std::vector<std::uint8_t>{0x02}));
    EXPECT_EQ(bytes_of(std::int32_t{42}), (std::vector<std::uint8_t>{0x54}));

    for (std::int64_t value : {std::numeric_limits<std::int64_t>::min(), std::int64_t{-300}, std::int64_t{300},
                               std::numeric_limits<std::int64_t>::max()}) {
        auto decoded = from_bytes<std::int64_t>(bytes_of(value));
        ASSERT_TRUE(decoded);
        EXPECT_EQ(*decoded, value);
    }
}

TEST(Hb1, FixedWidthFloatingPoint)
{
    auto bytes = bytes_of(1.0f);
    EXPECT_EQ(bytes, (std::vector<std::uint8_t>{0x00, 0x00, 0x80, 0x3F}));

    auto decoded = from_bytes<double>(bytes_of(-2.5));
    ASSERT_TRUE(decoded);
    EXPECT_EQ(*decoded, -2.5);
}

TEST(Hb1, StringsAndBytesAreLengthPrefixed)
{
    EXPECT_EQ(bytes_of(std::string("hi")), (std::vector<std::uint8_t>{0x02, 'h', 'i'}));
    EXPECT_EQ(bytes_of(std::vector<std::uint8_t>{9, 8}), (std::vector<std::uint8_t>{0x02, 9, 8}));
    EXPECT_EQ(bytes_of(true), (std::vector<std::uint8_t>{0x01}));
}

TEST(Hb1, AdaptedStructRoundTrip)
{
    test::Shape shape{"triangle", {{0, 0}, {4, 0}, {0, -3}}, test::Color::Blue, 0.5};
    auto decoded = from_bytes<test::Shape>(bytes_of(shape));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(*decoded, shape);
}

TEST(Hb1, ContainersRoundTrip)
{
    std::map<std::string, std::vector<std::int32_t>> map{{"a", {1, 2}}, {"b", {}}};
    auto decoded_map = from_bytes<decltype(map)>(bytes_of(map));
    ASSERT_TRUE(decoded_map);
    EXPECT_EQ(*decoded_map, map);

    std::tuple<bool, std::string, std::uint16_t> tuple{true, "x", 65535};
    auto decoded_tuple = from_bytes<decltype(tuple)>(bytes_of(tuple));
    ASSERT_TRUE(decoded_tuple);
    EXPECT_EQ(*decoded_tuple, tuple);

    std::optional<std::string> empty;
    EXPECT_EQ(bytes_of(empty), (std::vector<std::uint8_t>{0x00}));
}

TEST(Hb1, ExpectedWritesArmTag)
{
    std::expected<std::string, std::string> ok{"fine"};
    std::expected<std::string, std::string> err{std::unexpect, "broken"};

    EXPECT_EQ(bytes_of(ok), (std::vector<std::uint8_t>{0x00, 0x04, 'f', 'i', 'n', 'e'}));
    EXPECT_EQ(bytes_of(err).front(), 0x01);

    auto decoded = from_bytes<std::expected<std::string, std::string>>(bytes_of(err));
    ASSERT_TRUE(decoded);
    ASSERT_FALSE(*decoded);
    EXPECT_EQ(decoded->error(), "broken");

    std::expected<void, std::string> done;
    EXPECT_EQ(bytes_of(done), (std::vector<std::uint8_t>{0x00}));
}

TEST(Hb1, ErrorRoundTripKeepsCauseChain)
{
    GenericError inner{"connection reset"};
    auto error = make_error(ErrorCode::TransportError, "read failed",
                            GenericError{"socket", std::make_shared<const GenericError>(inner)});

    auto decoded = from_bytes<Error>(bytes_of(error));
    ASSERT_TRUE(decoded) << decoded.error().message;
    EXPECT_EQ(*decoded, error);
    EXPECT_EQ(decoded->kind(), ErrorCode::TransportError);
}

TEST(Hb1, RejectsUnknownErrorKind)
{
    auto decoded = from_bytes<Error>(std::vector<std::uint8_t>{0x63, 0x00, 0x00});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind(), ErrorCode::SerializationError);
}

TEST(Hb1, UnderrunIsSerializationError)
{
    auto decoded = from_bytes<std::uint64_t>(std::vector<std::uint8_t>{0x80, 0x80});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind(), ErrorCode::SerializationError);

    auto fixed = from_bytes<double>(std::vector<std::uint8_t>{1, 2, 3});
    ASSERT_FALSE(fixed);
    EXPECT_EQ(fixed.error().kind(), ErrorCode::SerializationError);
}

TEST(Hb1, RejectsOverlongVarint)
{
    std::vector<std::uint8_t> bytes(11, 0x80);
    bytes.back() = 0x00;
    auto decoded = from_bytes<std::uint64_t>(bytes);
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind(), ErrorCode::SerializationError);
}

TEST(Hb1, RejectsOutOfRangeIntegers)
{
    auto narrow = from_bytes<std::uint8_t>(bytes_of(std::uint32_t{256}));
    ASSERT_FALSE(narrow);
    EXPECT_EQ(narrow.error().kind(), ErrorCode::SerializationError);

    auto small = from_bytes<std::int8_t>(bytes_of(std::int32_t{-129}));
    ASSERT_FALSE(small);
}

TEST(Hb1, RejectsInvalidBoolAndTag)
{
    EXPECT_FALSE(from_bytes<bool>(std::vector<std::uint8_t>{0x02}));
    EXPECT_FALSE((from_bytes<std::expected<int, int>>(std::vector<std::uint8_t>{0x02, 0x00})));
}

TEST(Hb1, LengthPrefixCannotExceedPayload)
{
    // claims a one million element vector in a three byte payload
    auto decoded = from_bytes<std::vector<std::uint32_t>>(std::vector<std::uint8_t>{0xC0, 0x84, 0x3D});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind(), ErrorCode::SerializationError);
}

TEST(Hb1, TrailingBytesAreRejected)
{
    auto decoded = from_bytes<std::uint32_t>(std::vector<std::uint8_t>{0x01, 0x02});
    ASSERT_FALSE(decoded);
    EXPECT_EQ(decoded.error().kind(), ErrorCode::SerializationError);
}

TEST(Hb1, ReaderTracksPosition)
{
    std::vector<std::uint8_t> buffer;
    VectorSink sink{buffer};
    Writer writer{sink};
    ASSERT_TRUE(encode(writer, std::uint32_t{1}));
    ASSERT_TRUE(encode(writer, std::string("two")));
    ASSERT_TRUE(encode(writer, std::int32_t{-3}));

    SpanSource source{buffer};
    Reader reader{source};
    EXPECT_EQ(decode<std::uint32_t>(reader).value_or(0), 1u);
    EXPECT_EQ(decode<std::string>(reader).value_or(""), "two");
    EXPECT_EQ(decode<std::int32_t>(reader).value_or(0), -3);
    EXPECT_EQ(reader.remaining(), 0u);
    EXPECT_FALSE(decode<std::uint32_t>(reader));
}
