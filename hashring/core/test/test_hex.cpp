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

#include <gtest/gtest.h>

#include <optional>

using namespace hashring;
using namespace hashring::literals;

TEST(Hex, from_hex)
{
    EXPECT_EQ(from_hex(""), byte_string{});
    EXPECT_EQ(from_hex("0x"), byte_string{});
    EXPECT_EQ(from_hex("00ff"), (byte_string{0x00, 0xff}));
    EXPECT_EQ(from_hex("0XAbCd"), (byte_string{0xab, 0xcd}));
    EXPECT_EQ(from_hex("0x123"), (byte_string{0x01, 0x23}));
}

TEST(Hex, rejects_non_hex)
{
    EXPECT_EQ(from_hex("0g"), std::nullopt);
    EXPECT_EQ(from_hex("x0"), std::nullopt);
    EXPECT_EQ(from_hex("12 4"), std::nullopt);
}

TEST(Hex, literal)
{
    EXPECT_EQ("c0"_hex, byte_string{0xc0});

    // short values are right aligned, as a big endian number would be
    auto const b = to_bytes("0x0102"_hex);
    EXPECT_EQ(b.bytes[30], 0x01);
    EXPECT_EQ(b.bytes[31], 0x02);
    EXPECT_EQ(b.bytes[0], 0x00);
}
