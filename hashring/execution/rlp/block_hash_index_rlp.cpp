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
#include <hashring/core/keccak.hpp>
#include <hashring/core/likely.h>
#include <hashring/core/result.hpp>
#include <hashring/core/rlp/config.hpp>
#include <hashring/execution/block_hash_index.hpp>
#include <hashring/execution/rlp/block_hash_index_rlp.hpp>
#include <hashring/execution/rlp/decode.hpp>
#include <hashring/execution/rlp/decode_error.hpp>
#include <hashring/execution/rlp/encode.hpp>

#include <boost/outcome/try.hpp>

#include <cstdint>
#include <optional>

HASHRING_RLP_NAMESPACE_BEGIN

byte_string encode_block_hash_slot(BlockHashSlot const &slot)
{
    return encode_list(
        encode_unsigned(slot.height),
        encode_bytes32(slot.hash),
        encode_bool(slot.occupied));
}

byte_string encode_block_hash_index(RecentBlockHashIndex const &index)
{
    byte_string const newest =
        index.newest_height().has_value()
            ? encode_list(encode_unsigned(index.newest_height().value()))
            : encode_list_payload({});

    byte_string slots;
    for (auto const &slot : index.slots()) {
        slots += encode_block_hash_slot(slot);
    }

    return encode_list(newest, encode_list_payload(slots));
}

Result<BlockHashSlot> decode_block_hash_slot(byte_string_view &enc)
{
    BlockHashSlot slot;
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));
    BOOST_OUTCOME_TRY(slot.height, decode_unsigned<uint64_t>(payload));
    BOOST_OUTCOME_TRY(slot.hash, decode_bytes32(payload));
    BOOST_OUTCOME_TRY(slot.occupied, decode_bool(payload));

    if (HASHRING_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return slot;
}

Result<RecentBlockHashIndex> decode_block_hash_index(byte_string_view &enc)
{
    BOOST_OUTCOME_TRY(auto payload, parse_list_metadata(enc));

    std::optional<uint64_t> newest_height;
    BOOST_OUTCOME_TRY(auto newest_payload, parse_list_metadata(payload));
    if (!newest_payload.empty()) {
        BOOST_OUTCOME_TRY(
            auto const height, decode_unsigned<uint64_t>(newest_payload));
        if (HASHRING_UNLIKELY(!newest_payload.empty())) {
            return DecodeError::InputTooLong;
        }
        newest_height = height;
    }

    RecentBlockHashIndex::Slots slots;
    BOOST_OUTCOME_TRY(auto slots_payload, parse_list_metadata(payload));
    for (auto &slot : slots) {
        if (HASHRING_UNLIKELY(slots_payload.empty())) {
            return DecodeError::SlotCountUnexpected;
        }
        BOOST_OUTCOME_TRY(slot, decode_block_hash_slot(slots_payload));
    }
    if (HASHRING_UNLIKELY(!slots_payload.empty())) {
        return DecodeError::SlotCountUnexpected;
    }

    if (HASHRING_UNLIKELY(!payload.empty())) {
        return DecodeError::InputTooLong;
    }

    return RecentBlockHashIndex{slots, newest_height};
}

HASHRING_RLP_NAMESPACE_END

HASHRING_NAMESPACE_BEGIN

bytes32_t block_hash_index_commitment(RecentBlockHashIndex const &index)
{
    return to_bytes(keccak256(rlp::encode_block_hash_index(index)));
}

HASHRING_NAMESPACE_END
