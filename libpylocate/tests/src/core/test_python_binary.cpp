// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pylocate/core/python_binary.hpp"
#include "pylocate/core/util.hpp"
#include "pylocate/util/build.hpp"

#include "pylocatetests.hpp"

namespace pylocate
{
    namespace
    {
        TEST_CASE("python_binary_name")
        {
            REQUIRE(python_binary_name() == (util::on_win ? "python.exe" : "python"));
        }

        TEST_CASE("find_python_binary_path")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto env = tmp_dir.path() / "env";
            const auto exe = python_binary_name();
            fs::create_directories(env);

            SECTION("Empty environment")
            {
                REQUIRE_FALSE(find_python_binary_path(env).has_value());
            }

            SECTION("Inexistent environment")
            {
                REQUIRE_FALSE(find_python_binary_path(tmp_dir.path() / "nope").has_value());
            }

            SECTION("In root")
            {
                pylocatetests::write_file(env / exe);
                REQUIRE(find_python_binary_path(env) == env / exe);
            }

            SECTION("Scripts before root")
            {
                pylocatetests::write_file(env / exe);
                pylocatetests::write_file(env / "Scripts" / exe);
                REQUIRE(find_python_binary_path(env) == env / "Scripts" / exe);
            }

            SECTION("bin before everything")
            {
                pylocatetests::write_file(env / exe);
                pylocatetests::write_file(env / "Scripts" / exe);
                pylocatetests::write_file(env / "bin" / exe);
                REQUIRE(find_python_binary_path(env) == env / "bin" / exe);
            }
        }
    }
}
