// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pylocate/util/build.hpp"
#include "pylocate/util/path_manip.hpp"

using namespace pylocate::util;

namespace
{
    TEST_CASE("path_concat")
    {
        SECTION("proper concatenation")
        {
            REQUIRE(path_concat("", "file", '/') == "file");
            REQUIRE(path_concat("some/folder", "", '/') == "some/folder");
            REQUIRE(path_concat("some/folder", "file", '/') == "some/folder/file");
            REQUIRE(path_concat("some/folder/", "file", '/') == "some/folder/file");
            REQUIRE(path_concat("some/folder", "/file", '/') == "some/folder/file");
            REQUIRE(path_concat("some/folder/", "/file", '/') == "some/folder/file");
            REQUIRE(path_concat(R"(C:\folder)", "file", '\\') == R"(C:\folder\file)");
        }

        SECTION("platform separator")
        {
            if (on_win)
            {
                REQUIRE(path_concat(R"(C:\folder)", "file") == R"(C:\folder\file)");
            }
            else
            {
                REQUIRE(path_concat("/folder", "file") == "/folder/file");
            }
        }
    }

    TEST_CASE("expand_home")
    {
        REQUIRE(expand_home("", "") == "");
        REQUIRE(expand_home("~", "") == "");
        REQUIRE(expand_home("", "/user/pylocate") == "");
        REQUIRE(expand_home("~", "/user/pylocate") == "/user/pylocate");
        REQUIRE(expand_home("~/", "/user/pylocate") == "/user/pylocate");
        REQUIRE(expand_home("~/.local/bin", "/user/pylocate") == path_concat("/user/pylocate", ".local/bin"));
        REQUIRE(expand_home("/opt/~/bin", "/user/pylocate") == "/opt/~/bin");
        REQUIRE(expand_home("~other/bin", "/user/pylocate") == "~other/bin");
    }
}
