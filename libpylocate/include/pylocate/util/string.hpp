// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_UTIL_STRING_HPP
#define PYLOCATE_UTIL_STRING_HPP

#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace pylocate::util
{
    [[nodiscard]] auto to_lower(char c) -> char;
    [[nodiscard]] auto to_lower(std::string_view str) -> std::string;

    [[nodiscard]] auto starts_with(std::string_view str, std::string_view prefix) -> bool;

    /**
     * Remove the given characters (or spaces when not given) from the start of the input.
     */
    [[nodiscard]] auto lstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto lstrip(std::string_view input) -> std::string_view;

    /**
     * Remove the given characters (or spaces when not given) from the end of the input.
     */
    [[nodiscard]] auto rstrip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto rstrip(std::string_view input) -> std::string_view;

    /**
     * Remove the given characters (or spaces when not given) from both ends of the input.
     */
    [[nodiscard]] auto strip(std::string_view input, std::string_view chars) -> std::string_view;
    [[nodiscard]] auto strip(std::string_view input) -> std::string_view;

    /**
     * Split once on the first occurrence of ``sep``.
     *
     * If ``sep`` is not found, the whole string is returned as first element and
     * the second is empty.
     */
    [[nodiscard]] auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>;

    /**
     * Split on every occurrence of ``sep``, keeping empty parts.
     */
    [[nodiscard]] auto split(std::string_view input, char sep) -> std::vector<std::string>;
}
#endif
