// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <optional>
#include <string>

#include <catch2/catch_all.hpp>

#include "pylocate/core/context.hpp"
#include "pylocate/core/host.hpp"
#include "pylocate/util/build.hpp"
#include "pylocate/util/environment.hpp"

#include "pylocatetests.hpp"

namespace pylocate
{
    namespace
    {
        TEST_CASE("default_global_search_locations")
        {
            if constexpr (util::on_win)
            {
                REQUIRE(default_global_search_locations(fs::u8path("C:\\Users\\me")).empty());
            }
            else
            {
                const auto without_home = default_global_search_locations(std::nullopt);
                REQUIRE(without_home.size() == 12);
                REQUIRE(without_home.front() == "/usr/bin");
                REQUIRE(without_home.back() == "/opt/homebrew/bin");

                const auto with_home = default_global_search_locations(fs::u8path("/home/me"));
                REQUIRE(with_home.size() == 13);
                REQUIRE(with_home.back() == fs::u8path("/home/me/.local/bin"));
            }
        }

        TEST_CASE("SystemHostEnvironment")
        {
            const auto restore = pylocatetests::EnvironmentCleaner();
            auto ctx = Context();
            const auto host = SystemHostEnvironment(ctx);

            SECTION("Environment variables")
            {
                util::set_env("PYLOCATE_TEST_VAR", "value");
                REQUIRE(host.get_env_var("PYLOCATE_TEST_VAR") == "value");
                util::unset_env("PYLOCATE_TEST_VAR");
                REQUIRE_FALSE(host.get_env_var("PYLOCATE_TEST_VAR").has_value());
            }

            SECTION("Unset variable is reported absent")
            {
                auto value = std::optional<std::string>("placeholder");
                REQUIRE_NOTHROW(value = host.get_env_var("PYLOCATE_VAR_THAT_DOES_NOT_EXIST"));
                REQUIRE_FALSE(value.has_value());
            }

            SECTION("Home")
            {
                if (util::on_win)
                {
                    util::set_env("USERPROFILE", R"(D:\user\pylocate)");
                    REQUIRE(host.get_user_home() == fs::u8path(R"(D:\user\pylocate)"));
                }
                else
                {
                    util::set_env("HOME", "/user/pylocate");
                    REQUIRE(host.get_user_home() == fs::u8path("/user/pylocate"));
                }
            }

            SECTION("Configured search locations come first")
            {
                ctx.locator_params.search_locations = { "/first", "/second" };
                const auto locations = host.get_known_global_search_locations();
                REQUIRE(locations.size() >= 2);
                REQUIRE(locations[0] == "/first");
                REQUIRE(locations[1] == "/second");
                if (!util::on_win)
                {
                    REQUIRE(std::find(locations.cbegin(), locations.cend(), fs::u8path("/usr/bin"))
                            != locations.cend());
                }
            }
        }
    }
}
