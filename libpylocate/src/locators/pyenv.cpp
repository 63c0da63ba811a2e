// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <regex>
#include <system_error>

#include <fmt/format.h>

#include "pylocate/core/host.hpp"
#include "pylocate/core/logging.hpp"
#include "pylocate/core/python_binary.hpp"
#include "pylocate/core/pyvenv_cfg.hpp"
#include "pylocate/core/reporter.hpp"
#include "pylocate/locators/pyenv.hpp"

namespace pylocate
{
    namespace pyenv
    {
        namespace
        {
            auto get_home_pyenv_dir(const HostEnvironment& host, Platform platform)
                -> std::optional<fs::u8path>
            {
                auto home = host.get_user_home();
                if (!home.has_value())
                {
                    return {};
                }
                if (platform == Platform::windows)
                {
                    return home.value() / ".pyenv" / "pyenv-win";
                }
                return home.value() / ".pyenv";
            }

            auto get_binary_from_known_paths(const HostEnvironment& host)
                -> std::optional<fs::u8path>
            {
                for (const auto& known_path : host.get_known_global_search_locations())
                {
                    auto bin = known_path / "pyenv";
                    std::error_code ec;
                    if (fs::exists(bin, ec))
                    {
                        return bin;
                    }
                }
                return {};
            }

            auto make_environment(
                std::optional<std::string> name,
                const fs::u8path& executable,
                PythonEnvironmentCategory category,
                std::string version,
                const fs::u8path& path,
                const std::shared_ptr<const EnvironmentManager>& manager
            ) -> PythonEnvironment
            {
                return {
                    /* .name = */ std::move(name),
                    /* .python_executable_path = */ executable,
                    /* .category = */ category,
                    /* .version = */ std::move(version),
                    /* .env_path = */ path,
                    /* .sys_prefix_path = */ path,
                    /* .env_manager = */ manager,
                    /* .python_run_command = */ std::vector<std::string>{ executable.string() },
                };
            }
        }

        auto get_pyenv_dir(const HostEnvironment& host, Platform platform)
            -> std::optional<fs::u8path>
        {
            // PYENV_ROOT is the documented variable, pyenv-win sets PYENV.
            // See https://github.com/pyenv/pyenv#locating-the-python-installation
            // and https://github.com/pyenv-win/pyenv-win
            if (auto dir = host.get_env_var("PYENV_ROOT"))
            {
                return fs::u8path(dir.value());
            }
            if (auto dir = host.get_env_var("PYENV"))
            {
                return fs::u8path(dir.value());
            }
            return get_home_pyenv_dir(host, platform);
        }

        auto get_pyenv_binary(const HostEnvironment& host, Platform platform)
            -> std::optional<fs::u8path>
        {
            const auto dir = get_pyenv_dir(host, platform);
            if (!dir.has_value())
            {
                return {};
            }

            auto exe = dir.value() / "bin" / "pyenv";
            std::error_code ec;
            if (fs::exists(exe, ec))
            {
                return exe;
            }
            return get_binary_from_known_paths(host);
        }

        auto get_pyenv_version(std::string_view folder_name) -> std::optional<std::string>
        {
            // Tried in order, the first one matching gives the version.
            static const auto matchers = std::array{
                // Stable versions, like 3.10.10
                std::regex(R"(^(\d+\.\d+\.\d+)$)"),
                // Dev versions, like 3.10-dev
                std::regex(R"(^(\d+\.\d+-dev)$)"),
                // Alpha, beta and rc versions, like 3.10.0a3
                std::regex(R"(^(\d+\.\d+\.\d+[A-Za-z]\d+))"),
            };

            const auto name = std::string(folder_name);
            for (const auto& re : matchers)
            {
                if (auto m = std::smatch(); std::regex_search(name, m, re) && (m.size() == 2))
                {
                    return m[1].str();
                }
            }
            return {};
        }

        auto get_pure_python_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>
        {
            auto version = get_pyenv_version(path.filename().string());
            if (!version.has_value())
            {
                return {};
            }
            return make_environment(
                std::nullopt,
                executable,
                PythonEnvironmentCategory::pyenv,
                std::move(version).value(),
                path,
                manager
            );
        }

        auto get_virtual_env_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>
        {
            auto cfg = find_and_parse_pyvenv_cfg(executable);
            if (!cfg.has_value())
            {
                return {};
            }
            return make_environment(
                path.filename().string(),
                executable,
                PythonEnvironmentCategory::pyenv_virtual_env,
                std::move(cfg->version),
                path,
                manager
            );
        }

        auto build_environment(
            const fs::u8path& executable,
            const fs::u8path& path,
            const std::shared_ptr<const EnvironmentManager>& manager
        ) -> std::optional<PythonEnvironment>
        {
            if (auto env = get_pure_python_environment(executable, path, manager))
            {
                return env;
            }
            return get_virtual_env_environment(executable, path, manager);
        }

        auto list_pyenv_environments(
            const std::shared_ptr<const EnvironmentManager>& manager,
            const HostEnvironment& host,
            Platform platform
        ) -> expected_t<std::vector<PythonEnvironment>>
        {
            const auto pyenv_dir = get_pyenv_dir(host, platform);
            if (!pyenv_dir.has_value())
            {
                return make_unexpected(
                    "Could not determine the pyenv root directory",
                    pylocate_error_code::pyenv_root_not_found
                );
            }

            const auto versions_dir = pyenv_dir.value() / "versions";
            std::error_code ec;
            auto iter = fs::directory_iterator(versions_dir, ec);
            if (ec)
            {
                return make_unexpected(
                    fmt::format("Could not list pyenv versions in {}: {}", versions_dir, ec.message()),
                    pylocate_error_code::pyenv_versions_not_found
                );
            }

            LOG_DEBUG << "Looking for pyenv environments in " << versions_dir;

            auto envs = std::vector<PythonEnvironment>();
            for (; iter != fs::directory_iterator(); iter.increment(ec))
            {
                const auto path = iter->path();

                std::error_code entry_ec;
                if (!iter->is_directory(entry_ec) || entry_ec)
                {
                    continue;
                }

                const auto executable = find_python_binary_path(path);
                if (!executable.has_value())
                {
                    LOG_TRACE << "No interpreter in " << path;
                    continue;
                }

                if (auto env = build_environment(executable.value(), path, manager))
                {
                    envs.push_back(std::move(env).value());
                }
                else
                {
                    LOG_TRACE << "Skipping unrecognised pyenv version " << path;
                }
            }
            if (ec)
            {
                LOG_DEBUG << "Stopped listing " << versions_dir << ": " << ec.message();
            }

            return envs;
        }
    }

    /****************
     * PyenvLocator *
     ****************/

    PyenvLocator::PyenvLocator(const HostEnvironment& host, pyenv::Platform platform)
        : m_host(host)
        , m_platform(platform)
    {
    }

    auto PyenvLocator::is_known(const fs::u8path& python_executable) const -> bool
    {
        return m_environments.find(python_executable.string()) != m_environments.end();
    }

    auto PyenvLocator::track_if_compatible(const PythonEnv& /*env*/) -> bool
    {
        return false;
    }

    auto PyenvLocator::gather() -> expected_t<void>
    {
        if (auto pyenv_binary = pyenv::get_pyenv_binary(m_host, m_platform))
        {
            LOG_DEBUG << "Found pyenv at " << pyenv_binary.value();
            m_manager = std::make_shared<const EnvironmentManager>(EnvironmentManager{
                /* .executable_path = */ std::move(pyenv_binary).value(),
                /* .version = */ std::nullopt,
                /* .tool = */ EnvironmentManagerType::pyenv,
            });
        }
        else
        {
            m_manager = nullptr;
        }

        auto envs = pyenv::list_pyenv_environments(m_manager, m_host, m_platform);
        if (!envs)
        {
            return forward_error(envs);
        }

        for (auto& env : envs.value())
        {
            // Keys are the executable path strings as listed, symlinks are not resolved.
            // Only an identical string could collide, the last one then wins.
            auto key = env.python_executable_path->string();
            m_environments.insert_or_assign(std::move(key), std::move(env));
        }
        LOG_DEBUG << "Found " << m_environments.size() << " pyenv environments";
        return {};
    }

    void PyenvLocator::report(Reporter& reporter) const
    {
        if (m_manager)
        {
            reporter.report_environment_manager(*m_manager);
        }
        for (const auto& [_, env] : m_environments)
        {
            reporter.report_environment(env);
        }
    }

    auto PyenvLocator::manager() const -> const std::shared_ptr<const EnvironmentManager>&
    {
        return m_manager;
    }

    auto PyenvLocator::environments() const
        -> const std::unordered_map<std::string, PythonEnvironment>&
    {
        return m_environments;
    }
}
