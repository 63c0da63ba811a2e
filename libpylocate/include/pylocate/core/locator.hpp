// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_LOCATOR_HPP
#define PYLOCATE_CORE_LOCATOR_HPP

#include <optional>
#include <string>

#include "pylocate/core/error_handling.hpp"
#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    class Reporter;

    /**
     * An interpreter found by some other mean (``PATH``, a registry...) that a locator
     * may claim.
     */
    struct PythonEnv
    {
        fs::u8path executable;
        std::optional<fs::u8path> path;
        std::optional<std::string> version;
    };

    /**
     * A discovery strategy for one kind of Python installation.
     *
     * Usage is ``gather()`` once, then ``report()`` as many times as needed.
     */
    class Locator
    {
    public:

        virtual ~Locator() = default;

        /// Whether ``python_executable`` belongs to an environment this locator found.
        [[nodiscard]] virtual auto is_known(const fs::u8path& python_executable) const -> bool = 0;

        /// Claim ``env`` if it belongs to this locator. Returns whether it was claimed.
        virtual auto track_if_compatible(const PythonEnv& env) -> bool = 0;

        /// Find every environment of this kind on the host.
        virtual auto gather() -> expected_t<void> = 0;

        /// Send what was found to ``reporter``. Does not modify the locator.
        virtual void report(Reporter& reporter) const = 0;
    };
}

#endif
