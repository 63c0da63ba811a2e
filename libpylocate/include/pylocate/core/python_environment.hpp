// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_PYTHON_ENVIRONMENT_HPP
#define PYLOCATE_CORE_PYTHON_ENVIRONMENT_HPP

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    enum class EnvironmentManagerType
    {
        conda,
        pyenv,
    };

    [[nodiscard]] auto manager_type_name(EnvironmentManagerType type) -> std::string_view;

    /**
     * The tool managing a set of discovered environments.
     */
    struct EnvironmentManager
    {
        fs::u8path executable_path;
        std::optional<std::string> version;
        EnvironmentManagerType tool;

        auto operator==(const EnvironmentManager& other) const -> bool = default;
    };

    enum class PythonEnvironmentCategory
    {
        system,
        homebrew,
        conda,
        pyenv,
        pyenv_virtual_env,
        windows_store,
        pipenv,
        virtual_env_wrapper,
        venv,
        virtual_env,
    };

    /**
     * Name of the category on the wire, e.g. ``pyenvVirtualEnv``.
     */
    [[nodiscard]] auto category_name(PythonEnvironmentCategory category) -> std::string_view;

    /**
     * A discovered Python interpreter.
     *
     * Two records describe the same environment when their ``python_executable_path`` are
     * equal. The manager is shared between all records found by one locator run.
     */
    struct PythonEnvironment
    {
        std::optional<std::string> name;
        std::optional<fs::u8path> python_executable_path;
        PythonEnvironmentCategory category;
        std::optional<std::string> version;
        std::optional<fs::u8path> env_path;
        std::optional<fs::u8path> sys_prefix_path;
        std::shared_ptr<const EnvironmentManager> env_manager;
        std::optional<std::vector<std::string>> python_run_command;
    };

    void to_json(nlohmann::json& j, const EnvironmentManagerType& type);
    void to_json(nlohmann::json& j, const EnvironmentManager& manager);
    void to_json(nlohmann::json& j, const PythonEnvironmentCategory& category);
    void to_json(nlohmann::json& j, const PythonEnvironment& env);
}

#endif
