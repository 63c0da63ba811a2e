// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pylocate/util/build.hpp"
#include "pylocate/util/path_manip.hpp"
#include "pylocate/util/string.hpp"

namespace pylocate::util
{
    namespace
    {
        constexpr auto preferred_sep() -> char
        {
            return on_win ? preferred_path_separator_win : preferred_path_separator_posix;
        }
    }

    auto path_concat(std::string_view parent, std::string_view child, char sep) -> std::string
    {
        if (parent.empty())
        {
            return std::string(child);
        }
        if (child.empty())
        {
            return std::string(parent);
        }
        const auto sep_str = std::string_view(&sep, 1);
        auto out = std::string(rstrip(parent, sep_str));
        out += sep;
        out += strip(child, sep_str);
        return out;
    }

    auto path_concat(std::string_view parent, std::string_view child) -> std::string
    {
        return path_concat(parent, child, preferred_sep());
    }

    auto expand_home(std::string_view path, std::string_view home) -> std::string
    {
        if (path == "~")
        {
            return std::string(home);
        }
        if (starts_with(path, "~/") || (on_win && starts_with(path, "~\\")))
        {
            return path_concat(home, path.substr(2));
        }
        return std::string(path);
    }
}
