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
#include <hashring/core/config.hpp>
#include <hashring/core/fmt/bytes_fmt.hpp>
#include <hashring/core/result.hpp>
#include <hashring/execution/block_hash_host.hpp>
#include <hashring/execution/block_hash_index.hpp>
#include <hashring/execution/db/file_db.hpp>
#include <hashring/execution/rlp/block_hash_index_rlp.hpp>
#include <hashring/execution/rlp/decode_error.hpp>
#include <hashring/execution/shard_block_hashes.hpp>

#include <boost/outcome/try.hpp>

#include <quill/Quill.h>

#include <cstdint>
#include <string>
#include <string_view>

HASHRING_NAMESPACE_BEGIN

Result<RecentBlockHashIndex> read_block_hash_index(FileDb const &db)
{
    auto const image = db.get(BLOCK_HASH_INDEX_KEY);
    if (!image.has_value()) {
        LOG_INFO("No block hash index in store, starting empty");
        return RecentBlockHashIndex{};
    }
    byte_string_view enc{
        reinterpret_cast<unsigned char const *>(image->data()), image->size()};
    BOOST_OUTCOME_TRY(auto const index, rlp::decode_block_hash_index(enc));
    if (!enc.empty()) {
        return rlp::DecodeError::InputTooLong;
    }
    return index;
}

void write_block_hash_index(
    FileDb const &db, RecentBlockHashIndex const &index)
{
    byte_string const image = rlp::encode_block_hash_index(index);
    db.upsert(
        BLOCK_HASH_INDEX_KEY,
        std::string_view{
            reinterpret_cast<char const *>(image.data()), image.size()});
}

ShardBlockHashes::ShardBlockHashes(
    FileDb const &db, RecentBlockHashIndex const &index)
    : db_{db}
    , index_{index}
{
}

Result<ShardBlockHashes> ShardBlockHashes::open(FileDb const &db)
{
    BOOST_OUTCOME_TRY(auto const index, read_block_hash_index(db));
    if (index.newest_height().has_value()) {
        LOG_INFO(
            "Loaded block hash index at height {}",
            index.newest_height().value());
    }
    return ShardBlockHashes{db, index};
}

RecentBlockHashIndex const &ShardBlockHashes::index() const noexcept
{
    return index_;
}

bytes32_t ShardBlockHashes::commitment() const
{
    return block_hash_index_commitment(index_);
}

BlockHashHost ShardBlockHashes::host(uint64_t const block_height) const
{
    return BlockHashHost{index_, block_height};
}

bytes32_t ShardBlockHashes::persist()
{
    write_block_hash_index(db_, index_);
    return commitment();
}

bytes32_t ShardBlockHashes::on_block_finalized(
    uint64_t const height, bytes32_t const &hash)
{
    index_.record(height, hash);
    auto const root = persist();
    LOG_DEBUG(
        "Finalized block {} hash {}, index commitment {}", height, hash, root);
    return root;
}

bytes32_t ShardBlockHashes::on_block_skipped(uint64_t const height)
{
    index_.skip(height);
    auto const root = persist();
    LOG_DEBUG("Skipped block {}, index commitment {}", height, root);
    return root;
}

bytes32_t ShardBlockHashes::reset(RecentBlockHashIndex const &index)
{
    index_ = index;
    return persist();
}

HASHRING_NAMESPACE_END
