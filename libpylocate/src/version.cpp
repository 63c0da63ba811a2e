// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pylocate/version.hpp"

namespace pylocate
{
    std::string version()
    {
        return LIBPYLOCATE_VERSION_STRING;
    }
}
