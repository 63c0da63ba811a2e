// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <system_error>

#include "pylocate/core/python_binary.hpp"
#include "pylocate/util/build.hpp"

namespace pylocate
{
    auto python_binary_name() -> std::string_view
    {
        return util::on_win ? "python.exe" : "python";
    }

    auto find_python_binary_path(const fs::u8path& env_path) -> std::optional<fs::u8path>
    {
        const auto exe = python_binary_name();
        const auto candidates = std::array<fs::u8path, 3>{
            env_path / "bin" / exe,
            env_path / "Scripts" / exe,
            env_path / exe,
        };

        for (const auto& candidate : candidates)
        {
            std::error_code ec;
            if (fs::exists(candidate, ec))
            {
                return candidate;
            }
        }
        return {};
    }
}
