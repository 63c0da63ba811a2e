// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_UTIL_ENVIRONMENT_HPP
#define PYLOCATE_UTIL_ENVIRONMENT_HPP

#include <optional>
#include <string>
#include <unordered_map>

#include "pylocate/util/build.hpp"

namespace pylocate::util
{
    // Keys and values are UTF-8 on every platform.
    // Failures to read or write the process environment throw std::runtime_error.

    [[nodiscard]] auto get_env(const std::string& key) -> std::optional<std::string>;
    void set_env(const std::string& key, const std::string& value);
    void unset_env(const std::string& key);

    using environment_map = std::unordered_map<std::string, std::string>;

    [[nodiscard]] auto get_env_map() -> environment_map;

    /**
     * Replace the whole process environment with ``env``.
     *
     * Variables absent from ``env`` are removed.
     */
    void set_env_map(const environment_map& env);

    /**
     * The current user home directory.
     *
     * Read from ``HOME`` (``USERPROFILE`` on Windows), then from the password database
     * (``HOMEDRIVE`` and ``HOMEPATH`` on Windows). Throws if none gives an answer.
     */
    [[nodiscard]] auto user_home_dir() -> std::string;

    /**
     * Separator of directory lists such as ``PATH``.
     */
    [[nodiscard]] constexpr auto pathsep() -> char;

    /********************
     *  Implementation  *
     ********************/

    constexpr auto pathsep() -> char
    {
        return on_win ? ';' : ':';
    }
}
#endif
