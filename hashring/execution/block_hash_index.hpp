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

#include <array>
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>

HASHRING_NAMESPACE_BEGIN

/// Height tag of a slot that has never been written
inline constexpr uint64_t EMPTY_SLOT_HEIGHT =
    std::numeric_limits<uint64_t>::max();

struct BlockHashSlot
{
    uint64_t height{EMPTY_SLOT_HEIGHT};
    bytes32_t hash{};
    bool occupied{false};

    friend bool
    operator==(BlockHashSlot const &, BlockHashSlot const &) = default;
};

enum class BlockHashQueryStatus : uint8_t
{
    Found,
    // inside the window, but no block was produced at this height
    Skipped,
    // inside the window, but before the first recorded height
    NotRecorded,
    NotYetProduced,
    Evicted,
    // slot tag disagrees with the height; only reachable from a damaged image
    Corrupted,
};

struct BlockHashQuery
{
    BlockHashQueryStatus status;
    bytes32_t hash{};
};

char const *to_string(BlockHashQueryStatus);

/// Hashes of the most recent N block heights of one shard, stored in a
/// fixed ring indexed by `height % N`. Each slot carries the height it was
/// written for, so a stale slot left behind by wraparound never answers for
/// a different height.
///
/// Written once per finalized block by the finalization path; read by
/// contract execution. Both operations are O(1), except that a gap in the
/// recorded heights writes at most N skipped markers.
class RecentBlockHashIndex
{
public:
    static constexpr uint64_t N = 256;

    using Slots = std::array<BlockHashSlot, N>;

private:
    Slots slots_;
    std::optional<uint64_t> newest_height_;

    void write_slot(uint64_t height, bytes32_t const &, bool occupied);
    void mark_skipped_until(uint64_t height);

public:
    RecentBlockHashIndex() = default;
    RecentBlockHashIndex(Slots const &, std::optional<uint64_t> newest_height);

    std::optional<uint64_t> newest_height() const noexcept;
    bool empty() const noexcept;
    Slots const &slots() const noexcept;

    /// Precondition: the index is empty or `height > newest_height()`.
    /// Heights strictly between the previous newest height and `height` are
    /// marked skipped. Violating the precondition aborts.
    void record(uint64_t height, bytes32_t const &);

    /// Records that no block was produced at `height`; same precondition as
    /// `record`
    void skip(uint64_t height);

    std::optional<bytes32_t> lookup(uint64_t height) const noexcept;
    BlockHashQuery query(uint64_t height) const noexcept;

    friend bool operator==(
        RecentBlockHashIndex const &, RecentBlockHashIndex const &) = default;
};

/// Source of finalized block hashes by height; nullopt means no block was
/// produced at that height
using BlockHashProvider = std::function<std::optional<bytes32_t>(uint64_t)>;

/// Fills `index` with the window of N heights ending at `newest_height`.
/// Returns false, leaving `index` untouched, if the provider has no block at
/// `newest_height`.
bool init_block_hash_index(
    BlockHashProvider const &, uint64_t newest_height, RecentBlockHashIndex &);

HASHRING_NAMESPACE_END
