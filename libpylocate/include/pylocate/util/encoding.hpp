// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_UTIL_ENCODING_HPP
#define PYLOCATE_UTIL_ENCODING_HPP

#include <string>
#include <string_view>

namespace pylocate::util
{
    /**
     * Reinterpret UTF-8 code units as a plain `std::string`.
     */
    [[nodiscard]] auto to_utf8_std_string(std::u8string_view text) -> std::string;

    /**
     * Reinterpret a UTF-8 encoded `std::string` as `std::u8string`.
     */
    [[nodiscard]] auto to_u8string(std::string_view text) -> std::u8string;
}
#endif
