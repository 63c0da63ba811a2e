// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_PYVENV_CFG_HPP
#define PYLOCATE_CORE_PYVENV_CFG_HPP

#include <optional>
#include <string>
#include <string_view>

#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    inline constexpr std::string_view PYVENV_CONFIG_FILE = "pyvenv.cfg";

    /**
     * The parts of a ``pyvenv.cfg`` file we care about.
     */
    struct PyVenvCfg
    {
        /// ``MAJOR.MINOR.PATCH`` of the interpreter the environment was created from.
        std::string version;
    };

    /**
     * Locate the ``pyvenv.cfg`` belonging to an interpreter.
     *
     * The file is looked up next to the executable, then one directory above (the usual
     * ``<env>/bin/python`` layout).
     */
    [[nodiscard]] auto find_pyvenv_config_path(const fs::u8path& python_executable)
        -> std::optional<fs::u8path>;

    /**
     * Extract the version from the content of a ``pyvenv.cfg`` file.
     *
     * The first ``version = X.Y.Z`` or ``version_info = X.Y.Z...`` line wins.
     */
    [[nodiscard]] auto parse_pyvenv_cfg(std::string_view contents) -> std::optional<PyVenvCfg>;

    /**
     * Find, read and parse the ``pyvenv.cfg`` of an interpreter.
     *
     * A missing, unreadable or malformed file yields nothing.
     */
    [[nodiscard]] auto find_and_parse_pyvenv_cfg(const fs::u8path& python_executable)
        -> std::optional<PyVenvCfg>;
}

#endif
