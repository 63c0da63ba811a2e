// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_HOST_HPP
#define PYLOCATE_CORE_HOST_HPP

#include <optional>
#include <string>
#include <vector>

#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    class Context;

    /**
     * Read-only view of the machine the locators run on.
     *
     * Locators never query the process environment directly so that they can be run
     * against a fake host in tests.
     */
    class HostEnvironment
    {
    public:

        virtual ~HostEnvironment() = default;

        [[nodiscard]] virtual auto get_env_var(const std::string& key) const
            -> std::optional<std::string> = 0;

        [[nodiscard]] virtual auto get_user_home() const -> std::optional<fs::u8path> = 0;

        /// Directories where tools installed globally usually live, in search order.
        [[nodiscard]] virtual auto get_known_global_search_locations() const
            -> std::vector<fs::u8path> = 0;
    };

    /**
     * Platform defaults for `HostEnvironment::get_known_global_search_locations`.
     *
     * ``~/.local/bin`` is added on Unix when a home directory is given.
     */
    [[nodiscard]] auto default_global_search_locations(const std::optional<fs::u8path>& home)
        -> std::vector<fs::u8path>;

    class SystemHostEnvironment : public HostEnvironment
    {
    public:

        explicit SystemHostEnvironment(const Context& context);

        auto get_env_var(const std::string& key) const -> std::optional<std::string> override;
        auto get_user_home() const -> std::optional<fs::u8path> override;
        auto get_known_global_search_locations() const -> std::vector<fs::u8path> override;

    private:

        const Context& m_context;
    };
}

#endif
