#include "hovel/types/value_codec.hpp"

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

using hovel::types::DataType;
using hovel::types::TypedValue;

namespace {

std::vector<std::byte> bytes_of(std::initializer_list<unsigned> values)
{
    std::vector<std::byte> out;
    for (const auto value : values) {
        out.push_back(static_cast<std::byte>(value));
    }
    return out;
}

std::string as_text(const std::vector<std::byte>& bytes)
{
    return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

}  // namespace

TEST_CASE("encode_value writes fixed little-endian widths", "[codec]")
{
    CHECK(hovel::types::encode_value(TypedValue::integer(0x0102)) == bytes_of({0x02, 0x01, 0, 0, 0, 0, 0, 0}));
    CHECK(hovel::types::encode_value(TypedValue::serial(0x0A0B0C0DU)) == bytes_of({0x0D, 0x0C, 0x0B, 0x0A}));
    CHECK(hovel::types::encode_value(TypedValue::character('A')) == bytes_of({0x41}));
    CHECK(hovel::types::encode_value(TypedValue::integer(-1)).size() == 8U);
    CHECK(hovel::types::encode_value(TypedValue::floating(0.5)).size() == 8U);
}

TEST_CASE("strings carry an eight byte length prefix", "[codec]")
{
    const auto encoded = hovel::types::encode_value(TypedValue::string("hey"));
    REQUIRE(encoded.size() == hovel::types::kStringLengthPrefixSize + 3U);
    CHECK(encoded == bytes_of({3, 0, 0, 0, 0, 0, 0, 0, 'h', 'e', 'y'}));
    CHECK(hovel::types::encoded_size(TypedValue::email("a@b.io")) == 8U + 6U);
}

TEST_CASE("decode_value reads consecutive values from a span", "[codec]")
{
    std::vector<std::byte> buffer;
    hovel::types::encode_value(TypedValue::integer(-77), buffer);
    hovel::types::encode_value(TypedValue::string("naïve"), buffer);
    hovel::types::encode_value(TypedValue::floating(3.25), buffer);

    std::size_t offset = 0U;
    TypedValue value;
    REQUIRE_FALSE(hovel::types::decode_value(DataType::Int, buffer, offset, value));
    CHECK(value == TypedValue::integer(-77));
    REQUIRE_FALSE(hovel::types::decode_value(DataType::String, buffer, offset, value));
    CHECK(value == TypedValue::string("naïve"));
    REQUIRE_FALSE(hovel::types::decode_value(DataType::Float, buffer, offset, value));
    CHECK(value == TypedValue::floating(3.25));
    CHECK(offset == buffer.size());
}

TEST_CASE("boundary values decode to what was encoded", "[codec]")
{
    const std::vector<TypedValue> values{
        TypedValue::integer(std::numeric_limits<std::int64_t>::min()),
        TypedValue::integer(std::numeric_limits<std::int64_t>::max()),
        TypedValue::serial(std::numeric_limits<std::uint32_t>::max()),
        TypedValue::floating(-0.0),
        TypedValue::character('\0'),
        TypedValue::string(""),
        TypedValue::string("\xE6\x97\xA5\xE6\x9C\xAC \xF0\x9F\x8D\xA3"),
        TypedValue::email("x@y.z"),
    };

    std::vector<std::byte> buffer;
    for (const auto& value : values) {
        hovel::types::encode_value(value, buffer);
    }

    std::size_t offset = 0U;
    for (const auto& expected : values) {
        TypedValue decoded;
        REQUIRE_FALSE(hovel::types::decode_value(expected.type(), buffer, offset, decoded));
        CHECK(decoded == expected);
    }
    CHECK(offset == buffer.size());
}

TEST_CASE("decode_value reads email payloads back as emails", "[codec]")
{
    std::istringstream stream{as_text(hovel::types::encode_value(TypedValue::email("ann@example.com")))};
    TypedValue value;
    REQUIRE_FALSE(hovel::types::decode_value(DataType::Email, stream, value));
    CHECK(value == TypedValue::email("ann@example.com"));
}

TEST_CASE("decode_value reports short reads as io_error", "[codec]")
{
    const auto truncated = bytes_of({1, 2, 3});
    std::size_t offset = 0U;
    TypedValue value;
    CHECK(hovel::types::decode_value(DataType::Int, truncated, offset, value) == std::errc::io_error);

    // Length prefix promises ten bytes but only two follow.
    std::istringstream stream{as_text(bytes_of({10, 0, 0, 0, 0, 0, 0, 0, 'a', 'b'}))};
    CHECK(hovel::types::decode_value(DataType::String, stream, value) == std::errc::io_error);
}

TEST_CASE("decode_value rejects invalid UTF-8 string payloads", "[codec]")
{
    const auto encoded = bytes_of({2, 0, 0, 0, 0, 0, 0, 0, 0xC3, 0x28});
    std::size_t offset = 0U;
    TypedValue value;
    CHECK(hovel::types::decode_value(DataType::String, encoded, offset, value) == std::errc::illegal_byte_sequence);
}

TEST_CASE("u32 helpers are little-endian", "[codec]")
{
    std::array<std::byte, 4> header{};
    hovel::types::write_u32_le(258U, header.data());
    CHECK(header[0] == std::byte{2});
    CHECK(header[1] == std::byte{1});
    CHECK(hovel::types::read_u32_le(header.data()) == 258U);
}

TEST_CASE("is_valid_utf8 checks sequence structure", "[codec]")
{
    CHECK(hovel::types::is_valid_utf8("plain ascii"));
    CHECK(hovel::types::is_valid_utf8("\xE2\x82\xAC"));
    CHECK_FALSE(hovel::types::is_valid_utf8("\xE2\x82"));
    CHECK_FALSE(hovel::types::is_valid_utf8("\xFF"));
}
