// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <regex>
#include <system_error>

#include "pylocate/core/logging.hpp"
#include "pylocate/core/pyvenv_cfg.hpp"
#include "pylocate/core/util.hpp"
#include "pylocate/util/string.hpp"

namespace pylocate
{
    auto find_pyvenv_config_path(const fs::u8path& python_executable)
        -> std::optional<fs::u8path>
    {
        const auto exe_dir = python_executable.parent_path();
        for (const auto& dir : { exe_dir, exe_dir.parent_path() })
        {
            if (dir.empty())
            {
                continue;
            }
            auto cfg = dir / PYVENV_CONFIG_FILE;
            std::error_code ec;
            if (fs::is_regular_file(cfg, ec))
            {
                return cfg;
            }
        }
        return {};
    }

    auto parse_pyvenv_cfg(std::string_view contents) -> std::optional<PyVenvCfg>
    {
        static const auto version_re = std::regex(R"(^(\d+\.\d+\.\d+)$)");
        static const auto version_info_re = std::regex(R"(^(\d+\.\d+\.\d+))");

        for (const auto& line : util::split(contents, '\n'))
        {
            const auto [raw_key, raw_value] = util::split_once(line, '=');
            if (!raw_value.has_value())
            {
                continue;
            }

            const auto key = util::strip(raw_key);
            const auto value = std::string(util::strip(raw_value.value()));

            std::smatch m;
            if (key == "version" && std::regex_match(value, m, version_re))
            {
                return PyVenvCfg{ m[1].str() };
            }
            if (key == "version_info" && std::regex_search(value, m, version_info_re))
            {
                return PyVenvCfg{ m[1].str() };
            }
        }
        return {};
    }

    auto find_and_parse_pyvenv_cfg(const fs::u8path& python_executable)
        -> std::optional<PyVenvCfg>
    {
        const auto cfg = find_pyvenv_config_path(python_executable);
        if (!cfg.has_value())
        {
            return {};
        }

        try
        {
            auto parsed = parse_pyvenv_cfg(read_contents(cfg.value()));
            if (!parsed.has_value())
            {
                LOG_DEBUG << "No version found in " << cfg.value();
            }
            return parsed;
        }
        catch (const std::system_error& e)
        {
            LOG_DEBUG << "Could not read " << cfg.value() << ": " << e.what();
            return {};
        }
    }
}
