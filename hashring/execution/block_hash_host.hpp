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

#include <hashring/core/bytes.hpp>
#include <hashring/core/config.hpp>

#include <cstdint>
#include <optional>

HASHRING_NAMESPACE_BEGIN

class RecentBlockHashIndex;

/// Contract-facing view of a shard's block hash index for the execution of
/// one block. The index is read as of the start of that block: the block's
/// own hash is recorded only after all of its contract calls have run.
class BlockHashHost
{
    RecentBlockHashIndex const &index_;
    uint64_t block_height_;

public:
    BlockHashHost(RecentBlockHashIndex const &, uint64_t block_height);

    uint64_t block_height() const noexcept;

    /// `env::block_hash`: the hash of `height` if it is among the 256 most
    /// recent heights before the executing block, otherwise nullopt
    std::optional<bytes32_t> block_hash(uint64_t height) const noexcept;
};

HASHRING_NAMESPACE_END
