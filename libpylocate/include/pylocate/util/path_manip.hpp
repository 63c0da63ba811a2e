// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_UTIL_PATH_MANIP_HPP
#define PYLOCATE_UTIL_PATH_MANIP_HPP

#include <string>
#include <string_view>

namespace pylocate::util
{
    inline static constexpr char preferred_path_separator_posix = '/';
    inline static constexpr char preferred_path_separator_win = '\\';

    /**
     * Concatenate paths with the given separator.
     */
    [[nodiscard]] auto path_concat(std::string_view parent, std::string_view child, char sep)
        -> std::string;

    /**
     * Concatenate paths with the platform preferred separator.
     */
    [[nodiscard]] auto path_concat(std::string_view parent, std::string_view child) -> std::string;

    /**
     * Expand a leading '~' with the given home directory.
     *
     * Both '/' and the platform preferred separator are accepted after the '~'.
     */
    [[nodiscard]] auto expand_home(std::string_view path, std::string_view home) -> std::string;
}
#endif
