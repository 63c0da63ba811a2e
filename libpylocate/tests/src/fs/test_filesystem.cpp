// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <catch2/catch_all.hpp>
#include <fmt/format.h>

#include "pylocate/core/util.hpp"
#include "pylocate/fs/filesystem.hpp"
#include "pylocate/util/build.hpp"
#include "pylocate/util/encoding.hpp"

#include "pylocatetests.hpp"

namespace pylocate
{
    namespace
    {
        TEST_CASE("normalized_separators")
        {
            static constexpr auto value = u8"a/b/c";
            std::filesystem::path x{ value };
            const auto y = fs::normalized_separators(x);
#if defined(_WIN32)
            REQUIRE(y.u8string() == u8R"(a\b\c)");
#else
            REQUIRE(y.u8string() == value);
#endif
        }

        TEST_CASE("from_utf8_to_utf8_unicode")
        {
            const auto value = util::to_utf8_std_string(u8"日本語/パイソン");
            const std::filesystem::path x = fs::from_utf8(value);
            REQUIRE(x.filename().u8string() == u8"パイソン");
            REQUIRE(fs::u8path(value).filename().string() == util::to_utf8_std_string(u8"パイソン"));
        }

        TEST_CASE("u8path")
        {
            SECTION("append")
            {
                const auto root = fs::u8path("root");
                REQUIRE((root / "versions" / "3.11.4") == fs::u8path("root/versions/3.11.4"));
                REQUIRE((root / std::string("bin")) == fs::u8path("root/bin"));
                REQUIRE((root / std::string_view("bin")) == fs::u8path("root/bin"));
                REQUIRE((root / fs::u8path("bin")) == fs::u8path("root/bin"));
            }

            SECTION("parts")
            {
                const auto p = fs::u8path("/some/env/pyvenv.cfg");
                REQUIRE(p.filename() == "pyvenv.cfg");
                REQUIRE(p.parent_path() == fs::u8path("/some/env"));
                REQUIRE(fs::u8path("/some/env/").filename().empty());
                REQUIRE(fs::u8path().empty());
            }

            SECTION("comparison")
            {
                REQUIRE(fs::u8path("a/b") == std::string("a/b"));
                REQUIRE(fs::u8path("a/b") != fs::u8path("a/c"));
                REQUIRE_FALSE(fs::u8path("a/b") == "a/c");
            }

            SECTION("std_path")
            {
                const auto p = fs::u8path("a") / "b";
                REQUIRE(p.std_path() == std::filesystem::path("a") / "b");
            }

            SECTION("format")
            {
                REQUIRE(fmt::format("{}", fs::u8path("abc")) == "'abc'");
            }
        }

        TEST_CASE("directory_iterator")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto& root = tmp_dir.path();

            pylocatetests::write_file(root / "file.txt", "content");
            REQUIRE(fs::create_directory(root / "dir"));

            std::error_code ec;
            REQUIRE(fs::is_regular_file(root / "file.txt", ec));
            REQUIRE_FALSE(fs::is_regular_file(root / "dir", ec));
            REQUIRE(fs::exists(root / "dir", ec));

            auto names = std::vector<std::string>();
            auto dirs = std::vector<std::string>();
            for (const auto& entry : fs::directory_iterator(root))
            {
                names.push_back(entry.path().filename().string());
                if (entry.is_directory())
                {
                    dirs.push_back(entry.path().filename().string());
                }
            }
            std::sort(names.begin(), names.end());
            REQUIRE(names == std::vector<std::string>{ "dir", "file.txt" });
            REQUIRE(dirs == std::vector<std::string>{ "dir" });

            SECTION("Error code overloads")
            {
                auto count = std::size_t(0);
                auto iter = fs::directory_iterator(root, ec);
                for (; !ec && (iter != fs::directory_iterator()); iter.increment(ec))
                {
                    std::error_code entry_ec;
                    if (iter->is_directory(entry_ec))
                    {
                        REQUIRE(iter->path() == root / "dir");
                    }
                    REQUIRE_FALSE(entry_ec);
                    ++count;
                }
                REQUIRE_FALSE(ec);
                REQUIRE(count == 2);
            }

            SECTION("Inexistent directory")
            {
                [[maybe_unused]] auto iter = fs::directory_iterator(root / "does-not-exist", ec);
                REQUIRE(ec);
            }
        }

        TEST_CASE("create_directory_symlink")
        {
            if constexpr (!util::on_win)
            {
                const auto tmp_dir = TemporaryDirectory();
                const auto& root = tmp_dir.path();

                REQUIRE(fs::create_directories(root / "dir" / "nested"));
                fs::create_directory_symlink(root / "dir", root / "dir_link");

                std::error_code ec;
                REQUIRE(fs::exists(root / "dir_link" / "nested", ec));
                REQUIRE_FALSE(ec);
            }
        }

        TEST_CASE("TemporaryDirectory")
        {
            auto path = fs::u8path();
            {
                const auto tmp_dir = TemporaryDirectory();
                path = tmp_dir.path();
                std::error_code ec;
                REQUIRE(fs::exists(path, ec));
                pylocatetests::write_file(path / "nested" / "file");
            }
            std::error_code ec;
            REQUIRE_FALSE(fs::exists(path, ec));
        }

        TEST_CASE("read_contents")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto file = tmp_dir.path() / "file.txt";
            pylocatetests::write_file(file, "home = /usr/bin\nversion = 3.9.1\n");

            REQUIRE(read_contents(file) == "home = /usr/bin\nversion = 3.9.1\n");
            REQUIRE_THROWS_AS(read_contents(tmp_dir.path() / "missing"), std::system_error);
        }
    }
}
