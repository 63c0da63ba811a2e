// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <cerrno>
#include <cstdlib>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/format.h>

#ifdef _WIN32
#include <mutex>

#include <Windows.h>

#include "pylocate/fs/filesystem.hpp"
#else
#include <pwd.h>
#include <unistd.h>

extern "C"
{
    extern char** environ;
}
#endif

#include "pylocate/util/environment.hpp"

namespace pylocate::util
{
    namespace
    {
        /*
         * Platform primitives. Keys and values cross this boundary as UTF-8, write
         * primitives return 0 on success and a platform error number otherwise.
         */

#ifdef _WIN32
        constexpr auto home_variable = std::string_view("USERPROFILE");

        // The CRT environment functions are not thread-safe.
        std::mutex crt_env_mutex = {};

        auto widen(std::string_view utf8) -> std::wstring
        {
            return fs::from_utf8(utf8).wstring();
        }

        auto narrow(std::wstring_view wide) -> std::string
        {
            return fs::to_utf8(std::filesystem::path(wide));
        }

        auto read_variable(const std::string& key) -> std::optional<std::string>
        {
            const auto wkey = widen(key);
            const auto check = [&](errno_t err)
            {
                if (err != 0)
                {
                    throw std::runtime_error(
                        fmt::format(R"(Could not read environment variable "{}": error {})", key, err)
                    );
                }
            };

            auto lock = std::scoped_lock(crt_env_mutex);

            std::size_t size = 0;
            check(::_wgetenv_s(&size, nullptr, 0, wkey.c_str()));
            if (size == 0)
            {
                return {};
            }
            // size counts the terminating null
            auto buffer = std::wstring(size, L'\0');
            check(::_wgetenv_s(&size, buffer.data(), buffer.size(), wkey.c_str()));
            buffer.resize(size - 1);
            return narrow(buffer);
        }

        auto write_variable(const std::string& key, const std::string& value) -> int
        {
            auto lock = std::scoped_lock(crt_env_mutex);
            return ::_wputenv_s(widen(key).c_str(), widen(value).c_str());
        }

        // Assigning an empty value removes the variable on Windows.
        auto remove_variable(const std::string& key) -> int
        {
            return write_variable(key, "");
        }

        template <typename Func>
        void for_each_entry(Func&& func)
        {
            wchar_t* const block = ::GetEnvironmentStringsW();
            if (block == nullptr)
            {
                throw std::runtime_error("Could not read the process environment block");
            }
            for (const wchar_t* entry = block; *entry != L'\0';)
            {
                const auto wide = std::wstring_view(entry);
                func(narrow(wide));
                entry += wide.size() + 1;
            }
            ::FreeEnvironmentStringsW(block);
        }

        auto fallback_home() -> std::optional<std::string>
        {
            auto home = read_variable("HOMEDRIVE").value_or("")
                        + read_variable("HOMEPATH").value_or("");
            if (home.empty())
            {
                return {};
            }
            return home;
        }
#else
        constexpr auto home_variable = std::string_view("HOME");

        auto read_variable(const std::string& key) -> std::optional<std::string>
        {
            if (const char* value = std::getenv(key.c_str()); value != nullptr)
            {
                return std::string(value);
            }
            return {};
        }

        auto write_variable(const std::string& key, const std::string& value) -> int
        {
            return (::setenv(key.c_str(), value.c_str(), 1) == 0) ? 0 : errno;
        }

        auto remove_variable(const std::string& key) -> int
        {
            return (::unsetenv(key.c_str()) == 0) ? 0 : errno;
        }

        template <typename Func>
        void for_each_entry(Func&& func)
        {
            for (char** entry = environ; *entry != nullptr; ++entry)
            {
                func(std::string(*entry));
            }
        }

        auto fallback_home() -> std::optional<std::string>
        {
            const auto* record = ::getpwuid(::getuid());
            if ((record == nullptr) || (record->pw_dir == nullptr))
            {
                return {};
            }
            return std::string(record->pw_dir);
        }
#endif
    }

    auto get_env(const std::string& key) -> std::optional<std::string>
    {
        return read_variable(key);
    }

    void set_env(const std::string& key, const std::string& value)
    {
        if (const int err = write_variable(key, value); err != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not set environment variable "{}": error {})", key, err)
            );
        }
    }

    void unset_env(const std::string& key)
    {
        if (const int err = remove_variable(key); err != 0)
        {
            throw std::runtime_error(
                fmt::format(R"(Could not unset environment variable "{}": error {})", key, err)
            );
        }
    }

    auto get_env_map() -> environment_map
    {
        auto env = environment_map();
        for_each_entry(
            [&env](const std::string& entry)
            {
                // Windows lists per-drive directories as "=C:=C:\dir", they have no name.
                const auto sep = entry.find('=');
                if (sep == 0)
                {
                    return;
                }
                if (sep == std::string::npos)
                {
                    env.emplace(entry, std::string());
                }
                else
                {
                    env.emplace(entry.substr(0, sep), entry.substr(sep + 1));
                }
            }
        );
        return env;
    }

    void set_env_map(const environment_map& env)
    {
        for (const auto& entry : get_env_map())
        {
            unset_env(entry.first);
        }
        for (const auto& [key, value] : env)
        {
            set_env(key, value);
        }
    }

    auto user_home_dir() -> std::string
    {
        if (auto home = read_variable(std::string(home_variable)); home && !home->empty())
        {
            return std::move(home).value();
        }
        if (auto home = fallback_home())
        {
            return std::move(home).value();
        }
        throw std::runtime_error(
            fmt::format("Could not determine the user home directory, {} is not set", home_variable)
        );
    }
}
