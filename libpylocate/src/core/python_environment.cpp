// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <nlohmann/json.hpp>

#include "pylocate/core/python_environment.hpp"

namespace pylocate
{
    namespace
    {
        auto optional_path_to_json(const std::optional<fs::u8path>& path) -> nlohmann::json
        {
            if (path.has_value())
            {
                return path->string();
            }
            return nullptr;
        }

        template <typename T>
        auto optional_to_json(const std::optional<T>& opt) -> nlohmann::json
        {
            if (opt.has_value())
            {
                return opt.value();
            }
            return nullptr;
        }
    }

    auto manager_type_name(EnvironmentManagerType type) -> std::string_view
    {
        switch (type)
        {
            case EnvironmentManagerType::conda:
                return "conda";
            case EnvironmentManagerType::pyenv:
                return "pyenv";
        }
        return "";
    }

    auto category_name(PythonEnvironmentCategory category) -> std::string_view
    {
        switch (category)
        {
            case PythonEnvironmentCategory::system:
                return "system";
            case PythonEnvironmentCategory::homebrew:
                return "homebrew";
            case PythonEnvironmentCategory::conda:
                return "conda";
            case PythonEnvironmentCategory::pyenv:
                return "pyenv";
            case PythonEnvironmentCategory::pyenv_virtual_env:
                return "pyenvVirtualEnv";
            case PythonEnvironmentCategory::windows_store:
                return "windowsStore";
            case PythonEnvironmentCategory::pipenv:
                return "pipenv";
            case PythonEnvironmentCategory::virtual_env_wrapper:
                return "virtualEnvWrapper";
            case PythonEnvironmentCategory::venv:
                return "venv";
            case PythonEnvironmentCategory::virtual_env:
                return "virtualEnv";
        }
        return "";
    }

    void to_json(nlohmann::json& j, const EnvironmentManagerType& type)
    {
        j = std::string(manager_type_name(type));
    }

    void to_json(nlohmann::json& j, const EnvironmentManager& manager)
    {
        j["executablePath"] = manager.executable_path.string();
        j["version"] = optional_to_json(manager.version);
        j["tool"] = manager.tool;
    }

    void to_json(nlohmann::json& j, const PythonEnvironmentCategory& category)
    {
        j = std::string(category_name(category));
    }

    void to_json(nlohmann::json& j, const PythonEnvironment& env)
    {
        j["name"] = optional_to_json(env.name);
        j["pythonExecutablePath"] = optional_path_to_json(env.python_executable_path);
        j["category"] = env.category;
        j["version"] = optional_to_json(env.version);
        j["envPath"] = optional_path_to_json(env.env_path);
        j["sysPrefixPath"] = optional_path_to_json(env.sys_prefix_path);
        if (env.env_manager)
        {
            j["envManager"] = *env.env_manager;
        }
        else
        {
            j["envManager"] = nullptr;
        }
        j["pythonRunCommand"] = optional_to_json(env.python_run_command);
    }
}
