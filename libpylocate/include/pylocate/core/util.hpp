// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_UTIL_HPP
#define PYLOCATE_CORE_UTIL_HPP

#include <ios>
#include <string>

#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    // Throws std::system_error if the file cannot be opened.
    std::string read_contents(const fs::u8path& path, std::ios::openmode mode = std::ios::in);

    class TemporaryDirectory
    {
    public:

        TemporaryDirectory();
        ~TemporaryDirectory();

        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

        const fs::u8path& path() const;
        operator fs::u8path();

    private:

        fs::u8path m_path;
    };
}

#endif
