// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <ostream>

#include <nlohmann/json.hpp>

#include "pylocate/core/logging.hpp"
#include "pylocate/core/reporter.hpp"

namespace pylocate
{
    JsonRpcReporter::JsonRpcReporter(std::ostream& out)
        : m_out(out)
    {
    }

    void JsonRpcReporter::report_environment_manager(const EnvironmentManager& manager)
    {
        const auto key = manager.executable_path.string();
        if (!m_reported_managers.insert(key).second)
        {
            LOG_TRACE << "Environment manager " << manager.executable_path << " already reported";
            return;
        }
        send("envManager", manager);
    }

    void JsonRpcReporter::report_environment(const PythonEnvironment& env)
    {
        // Environments without an executable cannot be told apart, always send them
        if (env.python_executable_path.has_value())
        {
            const auto key = env.python_executable_path->string();
            if (!m_reported_environments.insert(key).second)
            {
                LOG_TRACE << "Environment " << env.python_executable_path.value()
                          << " already reported";
                return;
            }
        }
        send("pythonEnvironment", env);
    }

    void JsonRpcReporter::exit()
    {
        send("exit", nullptr);
    }

    void JsonRpcReporter::send(const std::string& method, const nlohmann::json& params)
    {
        const auto message = nlohmann::json{
            { "jsonrpc", "2.0" },
            { "method", method },
            { "params", params },
        };
        m_out << message.dump() << '\n';
        m_out.flush();
    }
}
