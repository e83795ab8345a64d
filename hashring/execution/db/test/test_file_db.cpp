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

#include <hashring/execution/db/file_db.hpp>

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>
#include <utility>

using namespace hashring;

namespace
{
    struct FileDbTest : public ::testing::Test
    {
        std::filesystem::path dir;

        void SetUp() override
        {
            std::string tmpl = (std::filesystem::temp_directory_path() /
                                "hashring_file_db_test_XXXXXX")
                                   .string();
            ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
            dir = tmpl;
        }

        void TearDown() override
        {
            std::filesystem::remove_all(dir);
        }
    };
}

TEST_F(FileDbTest, get_upsert_remove)
{
    FileDb const db{dir.c_str()};
    EXPECT_FALSE(db.get("key").has_value());

    db.upsert("key", "value");
    EXPECT_EQ(db.get("key"), "value");

    db.upsert("key", "");
    EXPECT_EQ(db.get("key"), "");

    EXPECT_TRUE(db.remove("key"));
    EXPECT_FALSE(db.get("key").has_value());
    EXPECT_FALSE(db.remove("key"));
}

TEST_F(FileDbTest, binary_values)
{
    FileDb const db{dir.c_str()};
    std::string value(4096, '\0');
    for (size_t i = 0; i < value.size(); ++i) {
        value[i] = static_cast<char>(i * 31);
    }
    db.upsert("blob", value);
    EXPECT_EQ(db.get("blob"), value);
}

TEST_F(FileDbTest, no_temp_files_left_behind)
{
    FileDb const db{dir.c_str()};
    db.upsert("a", "1");
    db.upsert("a", "2");
    db.upsert("b", "3");

    size_t files = 0;
    for (auto const &entry : std::filesystem::directory_iterator{dir}) {
        EXPECT_NE(entry.path().filename().string().front(), '_');
        ++files;
    }
    EXPECT_EQ(files, 2u);
}

TEST_F(FileDbTest, reopen_and_move)
{
    {
        FileDb const db{dir.c_str()};
        db.upsert("key", "persisted");
    }
    FileDb db{dir.c_str()};
    FileDb const moved{std::move(db)};
    EXPECT_EQ(moved.get("key"), "persisted");
}

TEST_F(FileDbTest, creates_missing_directory)
{
    auto const nested = dir / "a" / "b";
    FileDb const db{nested.c_str()};
    db.upsert("key", "value");
    EXPECT_TRUE(std::filesystem::exists(nested / "key"));
}

using FileDbDeathTest = FileDbTest;

TEST_F(FileDbDeathTest, invalid_keys)
{
    FileDb const db{dir.c_str()};
    EXPECT_DEATH(db.upsert("", "x"), "");
    EXPECT_DEATH(db.upsert("_reserved", "x"), "");
    EXPECT_DEATH(db.get("../escape"), "");
    EXPECT_DEATH(db.remove(".."), "");
}
