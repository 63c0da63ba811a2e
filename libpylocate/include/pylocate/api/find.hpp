// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_API_FIND_HPP
#define PYLOCATE_API_FIND_HPP

#include <cstddef>
#include <memory>
#include <vector>

namespace pylocate
{
    class Context;
    class HostEnvironment;
    class Locator;
    class Reporter;

    /**
     * All the locators available, in the order they should be run.
     */
    [[nodiscard]] auto make_locators(const HostEnvironment& host)
        -> std::vector<std::unique_ptr<Locator>>;

    /**
     * Run every locator against ``host`` and send their findings to ``reporter``.
     *
     * Every locator reports what it found, even when its gathering failed part way.
     * Returns the number of locators that gathered successfully.
     */
    auto find_environments(const Context& context, const HostEnvironment& host, Reporter& reporter)
        -> std::size_t;
}

#endif
