// Copyright (C) 2025 Category Labs, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.

#include <hashring/core/byte_string.hpp>
#include <hashring/core/bytes.hpp>
#include <hashring/core/hex.hpp>
#include <hashring/execution/rlp/decode.hpp>
#include <hashring/execution/rlp/decode_error.hpp>
#include <hashring/execution/rlp/encode.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <string>

using namespace hashring;
using namespace hashring::literals;
using namespace hashring::rlp;

TEST(Rlp, EncodeUnsigned)
{
    EXPECT_EQ(encode_unsigned(uint64_t{0}), EMPTY_STRING);
    EXPECT_EQ(encode_unsigned(uint64_t{0x0f}), "0f"_hex);
    EXPECT_EQ(encode_unsigned(uint64_t{0x7f}), "7f"_hex);
    EXPECT_EQ(encode_unsigned(uint64_t{0x80}), "8180"_hex);
    EXPECT_EQ(encode_unsigned(uint64_t{1024}), "820400"_hex);
    EXPECT_EQ(
        encode_unsigned(UINT64_MAX), "88ffffffffffffffff"_hex);
}

TEST(Rlp, EncodeBool)
{
    EXPECT_EQ(encode_bool(false), EMPTY_STRING);
    EXPECT_EQ(encode_bool(true), "01"_hex);
}

TEST(Rlp, EncodeString)
{
    std::string const empty_string = "";
    EXPECT_EQ(encode_string(to_byte_string_view(empty_string)), EMPTY_STRING);

    std::string const dog = "dog";
    EXPECT_EQ(encode_string(to_byte_string_view(dog)), "83646f67"_hex);

    std::string const long_string =
        "Lorem ipsum dolor sit amet, consectetur adipisicing elit";
    ASSERT_EQ(long_string.size(), 56u);
    auto const encoding = encode_string(to_byte_string_view(long_string));
    EXPECT_EQ(encoding.substr(0, 2), "b838"_hex);
    EXPECT_EQ(encoding.size(), 58u);
}

TEST(Rlp, EncodeList)
{
    std::string const cat = "cat";
    std::string const dog = "dog";
    EXPECT_EQ(
        encode_list(
            encode_string(to_byte_string_view(cat)),
            encode_string(to_byte_string_view(dog))),
        "c88363617483646f67"_hex);
    EXPECT_EQ(encode_list_payload({}), "c0"_hex);
}

TEST(Rlp, EncodeBytes32)
{
    auto const encoding = encode_bytes32(NULL_HASH);
    EXPECT_EQ(encoding.size(), 33u);
    EXPECT_EQ(encoding[0], 0xa0);
    EXPECT_EQ(encoding.substr(1), to_byte_string_view(NULL_HASH.bytes));
}

TEST(Rlp, DecodeUnsigned)
{
    {
        byte_string const encoding = "820400"_hex;
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 1024);
        EXPECT_TRUE(enc.empty());
    }

    {
        byte_string const encoding = EMPTY_STRING;
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), 0);
    }

    {
        auto const encoding = encode_unsigned(UINT64_MAX);
        byte_string_view enc{encoding};
        auto const decoded = decode_unsigned<uint64_t>(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), UINT64_MAX);
    }
}

TEST(Rlp, DecodeUnsignedErrors)
{
    {
        byte_string const encoding = "8200ff"_hex;
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).assume_error(),
            DecodeError::LeadingZero);
    }

    {
        byte_string const encoding = "89010000000000000000"_hex;
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).assume_error(),
            DecodeError::Overflow);
    }

    {
        byte_string const encoding = "830102"_hex;
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).assume_error(),
            DecodeError::InputTooShort);
    }

    {
        byte_string const encoding = "c0"_hex;
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).assume_error(),
            DecodeError::TypeUnexpected);
    }

    {
        byte_string_view enc{};
        EXPECT_EQ(
            decode_unsigned<uint64_t>(enc).assume_error(),
            DecodeError::InputTooShort);
    }
}

TEST(Rlp, DecodeBool)
{
    byte_string const encoding = "018002"_hex;
    byte_string_view enc{encoding};

    auto const t = decode_bool(enc);
    ASSERT_FALSE(t.has_error());
    EXPECT_TRUE(t.value());

    auto const f = decode_bool(enc);
    ASSERT_FALSE(f.has_error());
    EXPECT_FALSE(f.value());

    EXPECT_EQ(decode_bool(enc).assume_error(), DecodeError::Overflow);
}

TEST(Rlp, DecodeBytes32)
{
    {
        auto const encoding = encode_bytes32(NULL_HASH);
        byte_string_view enc{encoding};
        auto const decoded = decode_bytes32(enc);
        ASSERT_FALSE(decoded.has_error());
        EXPECT_EQ(decoded.value(), NULL_HASH);
        EXPECT_TRUE(enc.empty());
    }

    {
        auto const encoding =
            encode_string(to_byte_string_view(NULL_HASH.bytes).substr(1));
        byte_string_view enc{encoding};
        EXPECT_EQ(
            decode_bytes32(enc).assume_error(),
            DecodeError::ArrayLengthUnexpected);
    }
}

TEST(Rlp, DecodeList)
{
    byte_string const encoding = "c88363617483646f67"_hex;
    byte_string_view enc{encoding};
    auto payload = parse_list_metadata(enc);
    ASSERT_FALSE(payload.has_error());
    EXPECT_TRUE(enc.empty());

    auto const cat = decode_string(payload.value());
    ASSERT_FALSE(cat.has_error());
    EXPECT_EQ(cat.value(), "636174"_hex);
    auto const dog = decode_string(payload.value());
    ASSERT_FALSE(dog.has_error());
    EXPECT_EQ(dog.value(), "646f67"_hex);
    EXPECT_TRUE(payload.value().empty());

    byte_string const truncated = "c883636174"_hex;
    byte_string_view enc2{truncated};
    EXPECT_EQ(
        parse_list_metadata(enc2).assume_error(), DecodeError::InputTooShort);

    byte_string const not_a_list = "83636174"_hex;
    byte_string_view enc3{not_a_list};
    EXPECT_EQ(
        parse_list_metadata(enc3).assume_error(),
        DecodeError::TypeUnexpected);
}
