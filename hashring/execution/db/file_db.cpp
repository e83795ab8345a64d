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
#include <hashring/core/config.hpp>
#include <hashring/execution/db/file_db.hpp>

#include <quill/Quill.h>

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <ios>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

HASHRING_NAMESPACE_BEGIN

namespace
{
    // keys are plain file names; a leading '_' is reserved for temp files
    bool is_valid_key(std::string_view const key)
    {
        return !key.empty() && key.front() != '_' && key != "." &&
               key != ".." && key.find('/') == std::string_view::npos;
    }

    void fsync_path(std::filesystem::path const &path, int const flags)
    {
        int const fd = ::open(path.c_str(), flags);
        HASHRING_ASSERT(fd != -1);
        HASHRING_ASSERT(::fsync(fd) == 0);
        HASHRING_ASSERT(::close(fd) == 0);
    }
}

class FileDb::Impl
{
    std::filesystem::path const dir_;

public:
    explicit Impl(char const *const dir)
        : dir_{dir}
    {
        std::filesystem::create_directories(dir_);
        HASHRING_ASSERT(std::filesystem::is_directory(dir_));
    }

    std::optional<std::string> get(std::string_view const key) const
    {
        HASHRING_ASSERT(is_valid_key(key));
        auto const path = dir_ / key;
        std::ifstream in{path, std::ios::in | std::ios::binary};
        if (!in) {
            return std::nullopt;
        }
        std::string value;
        in.seekg(0, std::ios::end);
        auto const pos = in.tellg();
        HASHRING_ASSERT(pos >= 0);
        value.resize(static_cast<size_t>(pos));
        in.seekg(0, std::ios::beg);
        in.read(value.data(), static_cast<std::streamsize>(value.size()));
        HASHRING_ASSERT(in.gcount() == static_cast<std::streamsize>(value.size()));
        return value;
    }

    void upsert(std::string_view const key, std::string_view const value) const
    {
        HASHRING_ASSERT(is_valid_key(key));
        auto const path = dir_ / key;
        std::stringstream temp_name;
        temp_name << '_' << key << '.' << std::this_thread::get_id();
        auto const temp_path = dir_ / temp_name.str();
        {
            std::ofstream out{
                temp_path, std::ios::out | std::ios::trunc | std::ios::binary};
            HASHRING_ASSERT(out);
            out.write(value.data(), static_cast<std::streamsize>(value.size()));
            out.close();
            HASHRING_ASSERT(out);
        }
        fsync_path(temp_path, O_RDONLY);
        std::filesystem::rename(temp_path, path);
        fsync_path(dir_, O_RDONLY | O_DIRECTORY);
        LOG_DEBUG("Wrote {} bytes to {}", value.size(), path.string());
    }

    bool remove(std::string_view const key) const
    {
        HASHRING_ASSERT(is_valid_key(key));
        return std::filesystem::remove(dir_ / key);
    }
};

FileDb::FileDb(FileDb &&) = default;

FileDb::FileDb(char const *const dir)
    : impl_{new Impl{dir}}
{
}

FileDb::~FileDb() = default;

std::optional<std::string> FileDb::get(std::string_view const key) const
{
    return impl_->get(key);
}

void FileDb::upsert(std::string_view const key, std::string_view const value)
    const
{
    impl_->upsert(key, value);
}

bool FileDb::remove(std::string_view const key) const
{
    return impl_->remove(key);
}

HASHRING_NAMESPACE_END
