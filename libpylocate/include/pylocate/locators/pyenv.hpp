// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_LOCATORS_PYENV_HPP
#define PYLOCATE_LOCATORS_PYENV_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "pylocate/core/locator.hpp"
#include "pylocate/core/python_environment.hpp"
#include "pylocate/util/build.hpp"

namespace pylocate
{
    class HostEnvironment;

    namespace pyenv
    {
        /// Layout conventions differ between pyenv and pyenv-win.
        enum class Platform
        {
            posix,
            windows,
        };

        inline constexpr Platform build_platform = util::on_win ? Platform::windows
                                                                : Platform::posix;

        /**
         * Candidate root of the pyenv installation.
         *
         * ``PYENV_ROOT`` then ``PYENV`` then ``~/.pyenv`` (``~/.pyenv/pyenv-win`` on Windows).
         * The directory is not checked for existence.
         */
        [[nodiscard]] auto
        get_pyenv_dir(const HostEnvironment& host, Platform platform = build_platform)
            -> std::optional<fs::u8path>;

        /**
         * The ``pyenv`` executable, in the root ``bin/`` directory or in a well known
         * location.
         */
        [[nodiscard]] auto
        get_pyenv_binary(const HostEnvironment& host, Platform platform = build_platform)
            -> std::optional<fs::u8path>;

        /**
         * Version of a pyenv installed interpreter from its directory name.
         *
         * Accepts ``3.10.10``, ``3.10-dev`` and ``3.10.0a3`` like names. Anything else,
         * typically a pyenv-virtualenv environment name, yields nothing.
         */
        [[nodiscard]] auto get_pyenv_version(std::string_view folder_name)
            -> std::optional<std::string>;

        [[nodiscard]] auto get_pure_python_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>;

        [[nodiscard]] auto get_virtual_env_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>;

        /**
         * Pure interpreter first, pyenv-virtualenv environment otherwise.
         */
        [[nodiscard]] auto build_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>;

        /**
         * Every environment found in ``<root>/versions``.
         *
         * Fails when the root cannot be resolved or has no readable ``versions`` directory.
         */
        [[nodiscard]] auto list_pyenv_environments(
            const std::shared_ptr<const EnvironmentManager>& manager,
            const HostEnvironment& host,
            Platform platform = build_platform
        ) -> expected_t<std::vector<PythonEnvironment>>;
    }

    class PyenvLocator : public Locator
    {
    public:

        explicit PyenvLocator(
            const HostEnvironment& host,
            pyenv::Platform platform = pyenv::build_platform
        );

        auto is_known(const fs::u8path& python_executable) const -> bool override;

        // Everything is found by `gather`.
        auto track_if_compatible(const PythonEnv& env) -> bool override;

        auto gather() -> expected_t<void> override;

        void report(Reporter& reporter) const override;

        [[nodiscard]] auto manager() const -> const std::shared_ptr<const EnvironmentManager>&;

        [[nodiscard]] auto environments() const
            -> const std::unordered_map<std::string, PythonEnvironment>&;

    private:

        const HostEnvironment& m_host;
        pyenv::Platform m_platform;
        std::shared_ptr<const EnvironmentManager> m_manager;
        std::unordered_map<std::string, PythonEnvironment> m_environments;
    };
}

#endif
