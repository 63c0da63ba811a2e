// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <catch2/catch_all.hpp>

#include "pylocate/core/pyvenv_cfg.hpp"
#include "pylocate/core/util.hpp"

#include "pylocatetests.hpp"

namespace pylocate
{
    namespace
    {
        auto parsed_version(std::string_view contents) -> std::optional<std::string>
        {
            if (auto cfg = parse_pyvenv_cfg(contents))
            {
                return cfg->version;
            }
            return {};
        }

        TEST_CASE("parse_pyvenv_cfg")
        {
            SECTION("version key")
            {
                REQUIRE(parsed_version("version = 3.9.1") == "3.9.1");
                REQUIRE(parsed_version("version=3.12.0") == "3.12.0");
                REQUIRE(parsed_version("  version   =   3.12.0  ") == "3.12.0");
                REQUIRE(parsed_version("version = 3.9.1\r\n") == "3.9.1");
            }

            SECTION("version_info key keeps the three numbers")
            {
                REQUIRE(parsed_version("version_info = 3.12.0.final.0") == "3.12.0");
                REQUIRE(parsed_version("version_info = 3.13.0rc1") == "3.13.0");
            }

            SECTION("Full file")
            {
                const auto contents = std::string_view(
                    "home = /home/user/.pyenv/versions/3.11.4/bin\n"
                    "include-system-site-packages = false\n"
                    "version = 3.11.4\n"
                    "prompt = myenv\n"
                );
                REQUIRE(parsed_version(contents) == "3.11.4");
            }

            SECTION("First matching line wins")
            {
                REQUIRE(parsed_version("version_info = 3.10.2.final.0\nversion = 3.9.1\n") == "3.10.2");
                REQUIRE(parsed_version("version = 3.9\nversion = 3.9.1\n") == "3.9.1");
            }

            SECTION("No version")
            {
                REQUIRE_FALSE(parse_pyvenv_cfg("").has_value());
                REQUIRE_FALSE(parse_pyvenv_cfg("home = /usr/bin\n").has_value());
                REQUIRE_FALSE(parse_pyvenv_cfg("version = 3.9\n").has_value());
                REQUIRE_FALSE(parse_pyvenv_cfg("version = 3.9.1rc1\n").has_value());
                REQUIRE_FALSE(parse_pyvenv_cfg("version 3.9.1\n").has_value());
                REQUIRE_FALSE(parse_pyvenv_cfg("virtualenv = 20.4.7\n").has_value());
            }
        }

        TEST_CASE("find_pyvenv_config_path")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto env = tmp_dir.path() / "myenv";
            const auto exe = pylocatetests::make_python_env(env);

            REQUIRE_FALSE(find_pyvenv_config_path(exe).has_value());

            SECTION("In the environment root")
            {
                pylocatetests::write_file(env / "pyvenv.cfg", "version = 3.11.4\n");
                REQUIRE(find_pyvenv_config_path(exe) == env / "pyvenv.cfg");
            }

            SECTION("Next to the executable comes first")
            {
                pylocatetests::write_file(env / "pyvenv.cfg", "version = 3.11.4\n");
                pylocatetests::write_file(env / "bin" / "pyvenv.cfg", "version = 3.10.1\n");
                REQUIRE(find_pyvenv_config_path(exe) == env / "bin" / "pyvenv.cfg");
            }

            SECTION("A directory is not a config file")
            {
                fs::create_directories(env / "pyvenv.cfg");
                REQUIRE_FALSE(find_pyvenv_config_path(exe).has_value());
            }
        }

        TEST_CASE("find_and_parse_pyvenv_cfg")
        {
            const auto tmp_dir = TemporaryDirectory();
            const auto env = tmp_dir.path() / "myenv";
            const auto exe = pylocatetests::make_python_env(env);

            REQUIRE_FALSE(find_and_parse_pyvenv_cfg(exe).has_value());

            pylocatetests::write_file(env / "pyvenv.cfg", "home = /usr/bin\n");
            REQUIRE_FALSE(find_and_parse_pyvenv_cfg(exe).has_value());

            pylocatetests::write_file(env / "pyvenv.cfg", "home = /usr/bin\nversion = 3.11.4\n");
            const auto cfg = find_and_parse_pyvenv_cfg(exe);
            REQUIRE(cfg.has_value());
            REQUIRE(cfg->version == "3.11.4");
        }
    }
}
