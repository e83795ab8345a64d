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
#include <hashring/core/hex.hpp>
#include <hashring/core/log_level_map.hpp>
#include <hashring/execution/block_hash_index.hpp>
#include <hashring/execution/db/file_db.hpp>
#include <hashring/execution/fmt/block_hash_query_fmt.hpp>
#include <hashring/execution/shard_block_hashes.hpp>

#include <CLI/CLI.hpp>

#include <quill/LogLevel.h>
#include <quill/Quill.h>
#include <quill/bundled/fmt/core.h>
#include <quill/bundled/fmt/format.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <sstream>
#include <string>

using namespace hashring;
namespace fs = std::filesystem;

HASHRING_ANONYMOUS_NAMESPACE_BEGIN

std::optional<bytes32_t> parse_bytes32(std::string const &s)
{
    auto const bytes = from_hex(s);
    if (!bytes.has_value() || bytes->size() != sizeof(bytes32_t)) {
        return std::nullopt;
    }
    return to_bytes(byte_string_view{*bytes});
}

/// Reads `height hash` pairs, one per line; blank lines and lines starting
/// with '#' are ignored
std::optional<std::map<uint64_t, bytes32_t>>
read_hashes_file(fs::path const &path)
{
    std::ifstream in{path};
    if (!in) {
        LOG_ERROR("Could not open {}", path.string());
        return std::nullopt;
    }
    std::map<uint64_t, bytes32_t> hashes;
    std::string line;
    uint64_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (line.empty() || line.front() == '#') {
            continue;
        }
        std::istringstream fields{line};
        uint64_t height;
        std::string hex;
        if (!(fields >> height >> hex)) {
            LOG_ERROR("{}:{}: expected `height hash`", path.string(), line_no);
            return std::nullopt;
        }
        auto const hash = parse_bytes32(hex);
        if (!hash.has_value()) {
            LOG_ERROR("{}:{}: invalid hash '{}'", path.string(), line_no, hex);
            return std::nullopt;
        }
        hashes[height] = hash.value();
    }
    return hashes;
}

bool is_next_height(RecentBlockHashIndex const &index, uint64_t const height)
{
    if (height == EMPTY_SLOT_HEIGHT) {
        LOG_ERROR("Height {} is reserved", height);
        return false;
    }
    auto const newest = index.newest_height();
    if (newest.has_value() && height <= newest.value()) {
        LOG_ERROR(
            "Height {} is not above the newest recorded height {}",
            height,
            newest.value());
        return false;
    }
    return true;
}

void print_query(RecentBlockHashIndex const &index, uint64_t const height)
{
    auto const result = index.query(height);
    if (result.status == BlockHashQueryStatus::Found) {
        fmt::println("{}", result.hash);
    }
    else {
        fmt::println("none ({})", result.status);
    }
}

void print_dump(RecentBlockHashIndex const &index)
{
    if (!index.newest_height().has_value()) {
        fmt::println("newest: none");
        return;
    }
    uint64_t const newest = index.newest_height().value();
    fmt::println("newest: {}", newest);
    uint64_t const first = newest < RecentBlockHashIndex::N
                               ? 0
                               : newest - RecentBlockHashIndex::N + 1;
    for (uint64_t h = first; h <= newest; ++h) {
        auto const result = index.query(h);
        if (result.status == BlockHashQueryStatus::Found) {
            fmt::println("{} {}", h, result.hash);
        }
        else if (result.status != BlockHashQueryStatus::NotRecorded) {
            fmt::println("{} none ({})", h, result.status);
        }
    }
}

HASHRING_ANONYMOUS_NAMESPACE_END

int main(int const argc, char const *argv[])
{
    CLI::App cli{"hashring"};
    cli.option_defaults()->always_capture_default();
    cli.require_subcommand(1);

    fs::path db_path;
    auto log_level = quill::LogLevel::Info;
    uint64_t height = 0;
    std::string hash_hex;
    fs::path hashes_path;

    cli.add_option("--db", db_path, "shard store directory")->required();
    cli.add_option("--log_level", log_level, "level of logging")
        ->transform(CLI::CheckedTransformer(log_level_map, CLI::ignore_case));

    auto *const record_cmd =
        cli.add_subcommand("record", "record the hash of a finalized block");
    record_cmd->add_option("--height", height, "block height")->required();
    record_cmd->add_option("--hash", hash_hex, "0x-prefixed 32 byte hash")
        ->required();

    auto *const skip_cmd = cli.add_subcommand(
        "skip", "record that no block was produced at a height");
    skip_cmd->add_option("--height", height, "block height")->required();

    auto *const lookup_cmd =
        cli.add_subcommand("lookup", "look up the hash of a block height");
    lookup_cmd->add_option("--height", height, "block height")->required();

    auto *const dump_cmd =
        cli.add_subcommand("dump", "print every height in the window");

    auto *const commitment_cmd = cli.add_subcommand(
        "commitment", "print the state commitment of the index");

    auto *const rebuild_cmd = cli.add_subcommand(
        "rebuild", "rebuild the index from a file of `height hash` lines");
    rebuild_cmd->add_option("--hashes", hashes_path, "block hashes file")
        ->required()
        ->check(CLI::ExistingFile);
    rebuild_cmd->add_option("--newest", height, "newest block height")
        ->required();

    try {
        cli.parse(argc, argv);
    }
    catch (CLI::ParseError const &e) {
        return cli.exit(e);
    }

    auto stdout_handler = quill::stdout_handler();
    stdout_handler->set_pattern(
        "%(ascii_time) [%(thread)] %(filename):%(lineno) LOG_%(level_name)\t"
        "%(message)",
        "%Y-%m-%d %H:%M:%S.%Qns",
        quill::Timezone::GmtTime);
    quill::Config cfg;
    cfg.default_handlers.emplace_back(stdout_handler);
    quill::configure(cfg);
    quill::start(true);
    quill::get_root_logger()->set_log_level(log_level);

    FileDb const db{db_path.c_str()};
    auto shard = ShardBlockHashes::open(db);
    if (shard.has_error()) {
        LOG_ERROR(
            "Could not load block hash index from {}: {}",
            db_path.string(),
            shard.error().message().c_str());
        quill::flush();
        return EXIT_FAILURE;
    }
    auto &hashes = shard.value();

    int status = EXIT_SUCCESS;
    if (record_cmd->parsed()) {
        auto const hash = parse_bytes32(hash_hex);
        if (!hash.has_value()) {
            LOG_ERROR("Invalid block hash '{}'", hash_hex);
            status = EXIT_FAILURE;
        }
        else if (!is_next_height(hashes.index(), height)) {
            status = EXIT_FAILURE;
        }
        else {
            fmt::println("{}", hashes.on_block_finalized(height, hash.value()));
        }
    }
    else if (skip_cmd->parsed()) {
        if (!is_next_height(hashes.index(), height)) {
            status = EXIT_FAILURE;
        }
        else {
            fmt::println("{}", hashes.on_block_skipped(height));
        }
    }
    else if (lookup_cmd->parsed()) {
        print_query(hashes.index(), height);
    }
    else if (dump_cmd->parsed()) {
        print_dump(hashes.index());
    }
    else if (commitment_cmd->parsed()) {
        fmt::println("{}", hashes.commitment());
    }
    else if (rebuild_cmd->parsed()) {
        auto const blocks = read_hashes_file(hashes_path);
        RecentBlockHashIndex rebuilt;
        if (!blocks.has_value() || !is_next_height(rebuilt, height) ||
            !init_block_hash_index(
                [&](uint64_t const h) -> std::optional<bytes32_t> {
                    auto const it = blocks->find(h);
                    if (it == blocks->end()) {
                        return std::nullopt;
                    }
                    return it->second;
                },
                height,
                rebuilt)) {
            status = EXIT_FAILURE;
        }
        else {
            fmt::println("{}", hashes.reset(rebuilt));
        }
    }

    quill::flush();
    return status;
}
