// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <stdexcept>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "pylocate/core/context.hpp"
#include "pylocate/util/environment.hpp"
#include "pylocate/util/path_manip.hpp"
#include "pylocate/util/string.hpp"

namespace pylocate
{
    namespace
    {
        auto expand_user(const std::string& path) -> fs::u8path
        {
            try
            {
                return util::expand_home(path, util::user_home_dir());
            }
            catch (const std::runtime_error&)
            {
                // No home directory, keep the path as written
                return path;
            }
        }
    }

    Context::Context(const ContextOptions& options)
    {
        if (options.enable_logging)
        {
            enable_logging();
        }
    }

    void Context::load_env()
    {
        if (auto level_name = util::get_env("PYLOCATE_LOG_LEVEL"))
        {
            if (auto level = parse_log_level(level_name.value()))
            {
                set_log_level(level.value());
            }
            else
            {
                LOG_WARNING << "Ignoring unknown log level in PYLOCATE_LOG_LEVEL: '"
                            << level_name.value() << "'";
            }
        }

        if (auto search_path = util::get_env("PYLOCATE_SEARCH_PATH"))
        {
            for (const auto& dir : util::split(search_path.value(), util::pathsep()))
            {
                if (!dir.empty())
                {
                    locator_params.search_locations.push_back(expand_user(dir));
                }
            }
        }
    }

    void Context::set_log_level(log_level level)
    {
        logging_params.logging_level = level;
        logging::set_log_level(level);
    }

    void Context::enable_logging()
    {
        logging::enable_logging(logging_params);
    }

    auto load_config_file(Context& context, const fs::u8path& file) -> expected_t<void>
    {
        YAML::Node config;
        try
        {
            config = YAML::LoadFile(file.string());
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Could not read configuration file {}: {}", file, e.what()),
                pylocate_error_code::config_parse_error
            );
        }

        if (config.IsNull())
        {
            return {};
        }
        if (!config.IsMap())
        {
            return make_unexpected(
                fmt::format("Configuration file {} must contain a mapping", file),
                pylocate_error_code::config_parse_error
            );
        }

        try
        {
            if (const auto level_node = config["log_level"])
            {
                const auto level_name = level_node.as<std::string>();
                if (auto level = parse_log_level(level_name))
                {
                    context.set_log_level(level.value());
                }
                else
                {
                    return make_unexpected(
                        fmt::format(R"(Invalid log_level "{}" in {})", level_name, file),
                        pylocate_error_code::config_parse_error
                    );
                }
            }

            if (const auto locations_node = config["search_locations"])
            {
                auto locations = std::vector<fs::u8path>();
                for (const auto& dir : locations_node.as<std::vector<std::string>>())
                {
                    locations.push_back(expand_user(dir));
                }
                context.locator_params.search_locations = std::move(locations);
            }
        }
        catch (const YAML::Exception& e)
        {
            return make_unexpected(
                fmt::format("Invalid configuration in {}: {}", file, e.what()),
                pylocate_error_code::config_parse_error
            );
        }

        LOG_DEBUG << "Loaded configuration from " << file;
        return {};
    }
}
