// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include "pylocate/core/error_handling.hpp"

namespace pylocate
{
    pylocate_error::pylocate_error(const std::string& msg, pylocate_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    pylocate_error::pylocate_error(const char* msg, pylocate_error_code ec)
        : base_type(msg)
        , m_error_code(ec)
    {
    }

    pylocate_error_code pylocate_error::error_code() const noexcept
    {
        return m_error_code;
    }

    tl::unexpected<pylocate_error> make_unexpected(const char* msg, pylocate_error_code ec)
    {
        return tl::make_unexpected(pylocate_error(msg, ec));
    }

    tl::unexpected<pylocate_error> make_unexpected(const std::string& msg, pylocate_error_code ec)
    {
        return tl::make_unexpected(pylocate_error(msg, ec));
    }
}
