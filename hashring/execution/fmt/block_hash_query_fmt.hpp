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

#include <hashring/core/fmt/bytes_fmt.hpp>
#include <hashring/execution/block_hash_index.hpp>

#include <quill/Quill.h>

template <>
struct quill::copy_loggable<hashring::BlockHashQueryStatus> : std::true_type
{
};

template <>
struct fmt::formatter<hashring::BlockHashQueryStatus>
    : public hashring::BasicFormatter
{
    template <typename FormatContext>
    auto
    format(hashring::BlockHashQueryStatus const status, FormatContext &ctx) const
    {
        fmt::format_to(ctx.out(), "{}", hashring::to_string(status));
        return ctx.out();
    }
};
