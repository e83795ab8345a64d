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

#include <hashring/core/assert.h>
#include <hashring/core/byte_string.hpp>
#include <hashring/core/bytes.hpp>
#include <hashring/core/int.hpp>
#include <hashring/core/rlp/config.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>

HASHRING_RLP_NAMESPACE_BEGIN

inline byte_string const EMPTY_STRING = {0x80};

inline byte_string_view zeroless_view(byte_string_view const string_view)
{
    auto b = string_view.begin();
    auto const e = string_view.end();
    while (b < e && *b == 0) {
        ++b;
    }
    return {b, e};
}

inline byte_string to_big_compact(unsigned_integral auto n)
{
    n = intx::to_big_endian(n);
    return byte_string(
        zeroless_view({reinterpret_cast<unsigned char *>(&n), sizeof(n)}));
}

namespace impl
{
    inline byte_string
    encode_header(unsigned char const short_base, size_t const size)
    {
        byte_string result;
        if (size > 55) {
            auto const size_str = to_big_compact(size);
            HASHRING_ASSERT(size_str.size() <= 8u);
            result.push_back(static_cast<unsigned char>(
                short_base + 55 + size_str.size()));
            result += size_str;
        }
        else {
            result.push_back(static_cast<unsigned char>(short_base + size));
        }
        return result;
    }
}

inline byte_string encode_string(byte_string_view const string_view)
{
    if (string_view.size() == 1 && string_view[0] <= 0x7f) {
        return byte_string{string_view};
    }
    byte_string result = impl::encode_header(0x80, string_view.size());
    result += string_view;
    return result;
}

inline byte_string encode_unsigned(unsigned_integral auto const &n)
{
    return encode_string(to_big_compact(n));
}

inline byte_string encode_bool(bool const b)
{
    return encode_unsigned(static_cast<uint64_t>(b));
}

inline byte_string encode_bytes32(bytes32_t const &byte)
{
    return encode_string(to_byte_string_view(byte.bytes));
}

/// Wraps an already concatenated sequence of encoded items as a list
inline byte_string encode_list_payload(byte_string_view const payload)
{
    byte_string result = impl::encode_header(0xc0, payload.size());
    result += payload;
    return result;
}

template <std::convertible_to<byte_string>... Args>
byte_string encode_list(Args const &...args)
{
    byte_string payload;
    ([&] { payload += args; }(), ...);
    return encode_list_payload(payload);
}

HASHRING_RLP_NAMESPACE_END
