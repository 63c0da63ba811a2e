// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <stdexcept>

#include "pylocate/core/context.hpp"
#include "pylocate/core/host.hpp"
#include "pylocate/core/logging.hpp"
#include "pylocate/util/build.hpp"
#include "pylocate/util/environment.hpp"

namespace pylocate
{
    auto default_global_search_locations(const std::optional<fs::u8path>& home)
        -> std::vector<fs::u8path>
    {
        if constexpr (util::on_win)
        {
            return {};
        }
        else
        {
            static constexpr auto unix_locations = std::array{
                "/usr/bin",  "/usr/local/bin", "/bin",     "/home/bin", "/sbin",
                "/usr/sbin", "/usr/local/sbin", "/home/sbin", "/opt",   "/opt/bin",
                "/opt/sbin", "/opt/homebrew/bin",
            };

            auto locations = std::vector<fs::u8path>(unix_locations.cbegin(), unix_locations.cend());
            if (home.has_value())
            {
                locations.push_back(home.value() / ".local" / "bin");
            }
            return locations;
        }
    }

    SystemHostEnvironment::SystemHostEnvironment(const Context& context)
        : m_context(context)
    {
    }

    auto SystemHostEnvironment::get_env_var(const std::string& key) const
        -> std::optional<std::string>
    {
        try
        {
            return util::get_env(key);
        }
        catch (const std::runtime_error& e)
        {
            LOG_DEBUG << "Could not read environment variable " << key << ": " << e.what();
            return {};
        }
    }

    auto SystemHostEnvironment::get_user_home() const -> std::optional<fs::u8path>
    {
        try
        {
            return { util::user_home_dir() };
        }
        catch (const std::runtime_error& e)
        {
            LOG_DEBUG << "No user home directory: " << e.what();
            return {};
        }
    }

    auto SystemHostEnvironment::get_known_global_search_locations() const
        -> std::vector<fs::u8path>
    {
        auto locations = m_context.locator_params.search_locations;
        for (auto& dir : default_global_search_locations(get_user_home()))
        {
            locations.push_back(std::move(dir));
        }
        return locations;
    }
}
