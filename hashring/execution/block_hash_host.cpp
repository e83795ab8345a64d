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

#include <hashring/core/assert.h>
#include <hashring/core/bytes.hpp>
#include <hashring/core/config.hpp>
#include <hashring/core/fmt/bytes_fmt.hpp>
#include <hashring/execution/block_hash_host.hpp>
#include <hashring/execution/block_hash_index.hpp>
#include <hashring/execution/fmt/block_hash_query_fmt.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <optional>

HASHRING_NAMESPACE_BEGIN

BlockHashHost::BlockHashHost(
    RecentBlockHashIndex const &index, uint64_t const block_height)
    : index_{index}
    , block_height_{block_height}
{
    HASHRING_ASSERT(
        !index_.newest_height().has_value() ||
            index_.newest_height().value() < block_height_,
        "block hash index is ahead of the executing block");
}

uint64_t BlockHashHost::block_height() const noexcept
{
    return block_height_;
}

std::optional<bytes32_t>
BlockHashHost::block_hash(uint64_t const height) const noexcept
{
    auto const result = index_.query(height);
    LOG_TRACE_L1(
        "block_hash({}) in block {}: {}",
        height,
        block_height_,
        result.status);
    if (result.status != BlockHashQueryStatus::Found) {
        return std::nullopt;
    }
    return result.hash;
}

HASHRING_NAMESPACE_END
