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

#include <hashring/core/config.hpp>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

HASHRING_NAMESPACE_BEGIN

/// Directory of small values, one file per key. Writes replace the value
/// atomically: a reader sees either the old or the new image, never a torn
/// one.
class FileDb final
{
    class Impl;

    std::unique_ptr<Impl> impl_;

public:
    FileDb() = delete;
    FileDb(FileDb const &) = delete;
    FileDb(FileDb &&);
    explicit FileDb(char const *dir);
    ~FileDb();

    std::optional<std::string> get(std::string_view key) const;

    void upsert(std::string_view key, std::string_view value) const;
    bool remove(std::string_view key) const;
};

HASHRING_NAMESPACE_END
