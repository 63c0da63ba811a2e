// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <algorithm>
#include <cctype>
#include <iterator>

#include "pylocate/util/string.hpp"

namespace pylocate::util
{
    namespace
    {
        constexpr std::string_view whitespaces = " \t\n\v\f\r";
    }

    auto to_lower(char c) -> char
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    auto to_lower(std::string_view str) -> std::string
    {
        auto out = std::string();
        std::transform(
            str.cbegin(),
            str.cend(),
            std::back_inserter(out),
            [](char c) { return to_lower(c); }
        );
        return out;
    }

    auto starts_with(std::string_view str, std::string_view prefix) -> bool
    {
        return str.size() >= prefix.size() && 0 == str.compare(0, prefix.size(), prefix);
    }

    /***************************************
     *  Implementation of strip functions  *
     ***************************************/

    auto lstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const std::size_t start = input.find_first_not_of(chars);
        if (start == std::string_view::npos)
        {
            return {};
        }
        return input.substr(start);
    }

    auto lstrip(std::string_view input) -> std::string_view
    {
        return lstrip(input, whitespaces);
    }

    auto rstrip(std::string_view input, std::string_view chars) -> std::string_view
    {
        const std::size_t end = input.find_last_not_of(chars);
        if (end == std::string_view::npos)
        {
            return {};
        }
        return input.substr(0, end + 1);
    }

    auto rstrip(std::string_view input) -> std::string_view
    {
        return rstrip(input, whitespaces);
    }

    auto strip(std::string_view input, std::string_view chars) -> std::string_view
    {
        return rstrip(lstrip(input, chars), chars);
    }

    auto strip(std::string_view input) -> std::string_view
    {
        return strip(input, whitespaces);
    }

    /***************************************
     *  Implementation of split functions  *
     ***************************************/

    auto split_once(std::string_view str, char sep)
        -> std::tuple<std::string_view, std::optional<std::string_view>>
    {
        if (const auto pos = str.find(sep); pos != std::string_view::npos)
        {
            return { str.substr(0, pos), str.substr(pos + 1) };
        }
        return { str, std::nullopt };
    }

    auto split(std::string_view input, char sep) -> std::vector<std::string>
    {
        auto result = std::vector<std::string>();
        auto elem = std::string_view();
        auto rest = std::optional<std::string_view>(input);
        while (rest.has_value())
        {
            std::tie(elem, rest) = split_once(rest.value(), sep);
            result.emplace_back(elem);
        }
        return result;
    }
}
