// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef LIBPYLOCATE_VERSION_HPP
#define LIBPYLOCATE_VERSION_HPP

#include <string>

#define LIBPYLOCATE_VERSION_MAJOR 0
#define LIBPYLOCATE_VERSION_MINOR 3
#define LIBPYLOCATE_VERSION_PATCH 0

#define LIBPYLOCATE_VERSION_STRING "0.3.0"
#define LIBPYLOCATE_VERSION                                                                        \
    (LIBPYLOCATE_VERSION_MAJOR * 10000 + LIBPYLOCATE_VERSION_MINOR * 100 + LIBPYLOCATE_VERSION_PATCH)

namespace pylocate
{
    std::string version();
}

#endif
