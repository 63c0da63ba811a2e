// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <chrono>

#include "pylocate/api/find.hpp"
#include "pylocate/core/context.hpp"
#include "pylocate/core/host.hpp"
#include "pylocate/core/locator.hpp"
#include "pylocate/core/logging.hpp"
#include "pylocate/core/reporter.hpp"
#include "pylocate/locators/pyenv.hpp"

namespace pylocate
{
    auto make_locators(const HostEnvironment& host) -> std::vector<std::unique_ptr<Locator>>
    {
        auto locators = std::vector<std::unique_ptr<Locator>>();
        locators.push_back(std::make_unique<PyenvLocator>(host));
        return locators;
    }

    auto find_environments(const Context& context, const HostEnvironment& host, Reporter& reporter)
        -> std::size_t
    {
        const auto start = std::chrono::steady_clock::now();

        LOG_DEBUG << "Searching environments with " << context.locator_params.search_locations.size()
                  << " extra search locations";

        std::size_t gathered = 0;
        for (auto& locator : make_locators(host))
        {
            if (auto res = locator->gather(); res)
            {
                ++gathered;
            }
            else
            {
                LOG_DEBUG << "Locator gather failed: " << res.error().what();
            }
            // A failed gather may still have resolved the manager.
            locator->report(reporter);
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start
        );
        LOG_INFO << "Environment discovery done in " << elapsed.count() << "ms";
        return gathered;
    }
}
