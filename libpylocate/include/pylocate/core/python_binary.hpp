// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_PYTHON_BINARY_HPP
#define PYLOCATE_CORE_PYTHON_BINARY_HPP

#include <optional>
#include <string_view>

#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    /**
     * File name of the interpreter, ``python.exe`` on Windows and ``python`` elsewhere.
     */
    [[nodiscard]] auto python_binary_name() -> std::string_view;

    /**
     * Find the interpreter of an environment rooted at ``env_path``.
     *
     * Looks, in order, in ``bin/``, ``Scripts/`` and the root itself.
     */
    [[nodiscard]] auto find_python_binary_path(const fs::u8path& env_path)
        -> std::optional<fs::u8path>;
}

#endif
