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
#include <hashring/core/result.hpp>
#include <hashring/execution/block_hash_host.hpp>
#include <hashring/execution/block_hash_index.hpp>

#include <cstdint>

HASHRING_NAMESPACE_BEGIN

class FileDb;

/// Well-known key of the index image within a shard's store
inline constexpr char BLOCK_HASH_INDEX_KEY[] = "recent_block_hashes";

/// An absent image reads as an empty index
Result<RecentBlockHashIndex> read_block_hash_index(FileDb const &);

void write_block_hash_index(FileDb const &, RecentBlockHashIndex const &);

/// Block hash index of one shard, kept resident and written through to the
/// shard's store on every finalized block
class ShardBlockHashes
{
    FileDb const &db_;
    RecentBlockHashIndex index_;

    ShardBlockHashes(FileDb const &, RecentBlockHashIndex const &);

    bytes32_t persist();

public:
    static Result<ShardBlockHashes> open(FileDb const &);

    RecentBlockHashIndex const &index() const noexcept;

    bytes32_t commitment() const;

    /// Host view for executing the block at `block_height`
    BlockHashHost host(uint64_t block_height) const;

    /// Returns the commitment of the updated index
    bytes32_t on_block_finalized(uint64_t height, bytes32_t const &hash);
    bytes32_t on_block_skipped(uint64_t height);

    /// Replaces the index, e.g. after a rebuild, and persists it
    bytes32_t reset(RecentBlockHashIndex const &);
};

HASHRING_NAMESPACE_END
