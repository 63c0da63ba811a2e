// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_REPORTER_HPP
#define PYLOCATE_CORE_REPORTER_HPP

#include <iosfwd>
#include <string>
#include <unordered_set>

#include <nlohmann/json_fwd.hpp>

#include "pylocate/core/python_environment.hpp"

namespace pylocate
{
    /**
     * Receives what locators found.
     */
    class Reporter
    {
    public:

        virtual ~Reporter() = default;

        virtual void report_environment_manager(const EnvironmentManager& manager) = 0;
        virtual void report_environment(const PythonEnvironment& env) = 0;
    };

    /**
     * Writes JSON-RPC 2.0 notifications, one per line.
     *
     * A manager or an environment whose executable was already written is skipped, so
     * several locators may report the same interpreter.
     */
    class JsonRpcReporter : public Reporter
    {
    public:

        explicit JsonRpcReporter(std::ostream& out);

        void report_environment_manager(const EnvironmentManager& manager) override;
        void report_environment(const PythonEnvironment& env) override;

        /// Tell the receiving end that discovery is over.
        void exit();

    private:

        void send(const std::string& method, const nlohmann::json& params);

        std::ostream& m_out;
        std::unordered_set<std::string> m_reported_managers;
        std::unordered_set<std::string> m_reported_environments;
    };
}

#endif
