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

#pragma once

#include <hashring/core/byte_string.hpp>
#include <hashring/core/config.hpp>

#include <optional>
#include <string_view>

HASHRING_NAMESPACE_BEGIN

inline constexpr unsigned char from_hex_digit(char const h)
{
    if (h >= '0' && h <= '9') {
        return static_cast<unsigned char>(h - '0');
    }
    else if (h >= 'a' && h <= 'f') {
        return static_cast<unsigned char>(h - 'a' + 10);
    }
    else if (h >= 'A' && h <= 'F') {
        return static_cast<unsigned char>(h - 'A' + 10);
    }
    else {
        return 0xff;
    }
}

/// Parses an optionally `0x`-prefixed hex string. An odd number of digits is
/// read as if a leading zero were present. Returns nullopt on any non-hex
/// character.
inline std::optional<byte_string> from_hex(std::string_view s)
{
    if (s.size() >= 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) {
        s.remove_prefix(2);
    }

    byte_string r((s.size() + 1) / 2, (unsigned char)0);
    size_t in = 0;
    size_t out = 0;
    if (s.size() % 2) {
        auto const v = from_hex_digit(s[in++]);
        if (v == 0xff) {
            return std::nullopt;
        }
        r[out++] = v;
    }

    for (; in < s.size(); in += 2) {
        auto const hi = from_hex_digit(s[in]);
        auto const lo = from_hex_digit(s[in + 1]);
        if (hi == 0xff || lo == 0xff) {
            return std::nullopt;
        }
        r[out++] = static_cast<unsigned char>((hi << 4) | lo);
    }

    return r;
}

namespace literals
{
    inline byte_string operator""_hex(char const *s, size_t const n)
    {
        return from_hex({s, n}).value();
    }
}

HASHRING_NAMESPACE_END
