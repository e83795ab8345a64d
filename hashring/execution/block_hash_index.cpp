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
#include <hashring/core/likely.h>
#include <hashring/execution/block_hash_index.hpp>

#include <quill/Quill.h>

#include <algorithm>
#include <cstdint>
#include <optional>

HASHRING_NAMESPACE_BEGIN

char const *to_string(BlockHashQueryStatus const status)
{
    switch (status) {
    case BlockHashQueryStatus::Found:
        return "found";
    case BlockHashQueryStatus::Skipped:
        return "skipped";
    case BlockHashQueryStatus::NotRecorded:
        return "not recorded";
    case BlockHashQueryStatus::NotYetProduced:
        return "not yet produced";
    case BlockHashQueryStatus::Evicted:
        return "evicted";
    case BlockHashQueryStatus::Corrupted:
        return "corrupted";
    }
    HASHRING_ABORT("unknown BlockHashQueryStatus");
}

RecentBlockHashIndex::RecentBlockHashIndex(
    Slots const &slots, std::optional<uint64_t> const newest_height)
    : slots_{slots}
    , newest_height_{newest_height}
{
}

std::optional<uint64_t> RecentBlockHashIndex::newest_height() const noexcept
{
    return newest_height_;
}

bool RecentBlockHashIndex::empty() const noexcept
{
    return !newest_height_.has_value();
}

RecentBlockHashIndex::Slots const &RecentBlockHashIndex::slots() const noexcept
{
    return slots_;
}

void RecentBlockHashIndex::write_slot(
    uint64_t const height, bytes32_t const &hash, bool const occupied)
{
    slots_[height % N] =
        BlockHashSlot{.height = height, .hash = hash, .occupied = occupied};
}

void RecentBlockHashIndex::mark_skipped_until(uint64_t const height)
{
    HASHRING_ASSERT(height != EMPTY_SLOT_HEIGHT);
    if (HASHRING_UNLIKELY(!newest_height_.has_value())) {
        return;
    }
    uint64_t const newest = newest_height_.value();
    HASHRING_ASSERT(
        height > newest, "block hash index heights must strictly increase");
    if (HASHRING_LIKELY(height == newest + 1)) {
        return;
    }

    // anything before height - N + 1 is outside the window once height lands
    uint64_t const first =
        std::max(newest + 1, height >= N ? height - N + 1 : uint64_t{0});
    LOG_WARNING(
        "Block heights {} to {} were not produced, marking {} slots skipped",
        newest + 1,
        height - 1,
        height - first);
    for (uint64_t h = first; h < height; ++h) {
        write_slot(h, bytes32_t{}, false);
    }
}

void RecentBlockHashIndex::record(uint64_t const height, bytes32_t const &hash)
{
    mark_skipped_until(height);
    write_slot(height, hash, true);
    newest_height_ = height;
    LOG_TRACE_L1("Recorded block hash {} at height {}", hash, height);
}

void RecentBlockHashIndex::skip(uint64_t const height)
{
    mark_skipped_until(height);
    write_slot(height, bytes32_t{}, false);
    newest_height_ = height;
    LOG_DEBUG("Recorded skipped block at height {}", height);
}

BlockHashQuery RecentBlockHashIndex::query(uint64_t const height) const noexcept
{
    if (!newest_height_.has_value() || height > newest_height_.value()) {
        return {.status = BlockHashQueryStatus::NotYetProduced};
    }
    if (newest_height_.value() - height >= N) {
        return {.status = BlockHashQueryStatus::Evicted};
    }

    BlockHashSlot const &slot = slots_[height % N];
    if (HASHRING_UNLIKELY(slot.height != height)) {
        if (slot.height == EMPTY_SLOT_HEIGHT && !slot.occupied) {
            return {.status = BlockHashQueryStatus::NotRecorded};
        }
        return {.status = BlockHashQueryStatus::Corrupted};
    }
    if (!slot.occupied) {
        return {.status = BlockHashQueryStatus::Skipped};
    }
    return {.status = BlockHashQueryStatus::Found, .hash = slot.hash};
}

std::optional<bytes32_t>
RecentBlockHashIndex::lookup(uint64_t const height) const noexcept
{
    auto const result = query(height);
    if (result.status != BlockHashQueryStatus::Found) {
        return std::nullopt;
    }
    return result.hash;
}

bool init_block_hash_index(
    BlockHashProvider const &provider, uint64_t const newest_height,
    RecentBlockHashIndex &index)
{
    constexpr uint64_t N = RecentBlockHashIndex::N;

    auto const newest_hash = provider(newest_height);
    if (!newest_hash.has_value()) {
        LOG_WARNING(
            "Could not query block {} to rebuild the block hash index",
            newest_height);
        return false;
    }

    RecentBlockHashIndex rebuilt;
    uint64_t const first =
        newest_height < N ? 0 : newest_height - N + 1;
    for (uint64_t h = first; h < newest_height; ++h) {
        auto const hash = provider(h);
        if (hash.has_value()) {
            rebuilt.record(h, hash.value());
        }
        else {
            rebuilt.skip(h);
        }
    }
    rebuilt.record(newest_height, newest_hash.value());

    LOG_INFO(
        "Rebuilt block hash index for heights {} to {}", first, newest_height);
    index = rebuilt;
    return true;
}

HASHRING_NAMESPACE_END
