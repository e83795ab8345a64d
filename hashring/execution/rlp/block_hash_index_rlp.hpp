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
#include <hashring/core/bytes.hpp>
#include <hashring/core/result.hpp>
#include <hashring/core/rlp/config.hpp>
#include <hashring/execution/block_hash_index.hpp>

HASHRING_RLP_NAMESPACE_BEGIN

byte_string encode_block_hash_slot(BlockHashSlot const &);
byte_string encode_block_hash_index(RecentBlockHashIndex const &);

Result<BlockHashSlot> decode_block_hash_slot(byte_string_view &);

/// Decodes one index image from the front of `enc`
Result<RecentBlockHashIndex> decode_block_hash_index(byte_string_view &);

HASHRING_RLP_NAMESPACE_END

HASHRING_NAMESPACE_BEGIN

/// keccak256 of the RLP image; this is what the shard state root commits to
bytes32_t block_hash_index_commitment(RecentBlockHashIndex const &);

HASHRING_NAMESPACE_END
