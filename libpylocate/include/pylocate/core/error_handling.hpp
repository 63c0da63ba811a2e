// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_ERROR_HANDLING_HPP
#define PYLOCATE_CORE_ERROR_HANDLING_HPP

#include <stdexcept>
#include <string>

#include <tl/expected.hpp>

namespace pylocate
{
    /***********************
     * pylocate exceptions *
     ***********************/

    enum class pylocate_error_code
    {
        unknown,
        pyenv_root_not_found,
        pyenv_versions_not_found,
        config_parse_error,
    };

    class pylocate_error : public std::runtime_error
    {
    public:

        using base_type = std::runtime_error;

        pylocate_error(const std::string& msg, pylocate_error_code ec);
        pylocate_error(const char* msg, pylocate_error_code ec);

        pylocate_error_code error_code() const noexcept;

    private:

        pylocate_error_code m_error_code;
    };

    template <class T, class E = pylocate_error>
    using expected_t = tl::expected<T, E>;

    /********************
     * helper functions *
     ********************/

    tl::unexpected<pylocate_error> make_unexpected(const char* msg, pylocate_error_code ec);

    tl::unexpected<pylocate_error> make_unexpected(const std::string& msg, pylocate_error_code ec);

    template <class T, class E>
    tl::unexpected<E> forward_error(const tl::expected<T, E>& exp)
    {
        return tl::make_unexpected(exp.error());
    }
}

#endif
