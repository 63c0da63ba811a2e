// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_CONTEXT_HPP
#define PYLOCATE_CORE_CONTEXT_HPP

#include <vector>

#include "pylocate/core/error_handling.hpp"
#include "pylocate/core/logging.hpp"
#include "pylocate/fs/filesystem.hpp"

namespace pylocate
{
    struct LocatorParams
    {
        /// Directories searched for manager binaries before the platform defaults.
        std::vector<fs::u8path> search_locations;
    };

    struct ContextOptions
    {
        bool enable_logging = false;
    };

    class Context
    {
    public:

        explicit Context(const ContextOptions& options = {});

        LoggingParams logging_params;
        LocatorParams locator_params;

        /**
         * Apply the ``PYLOCATE_LOG_LEVEL`` and ``PYLOCATE_SEARCH_PATH`` environment variables.
         *
         * Unknown log level names are ignored with a warning.
         */
        void load_env();

        void set_log_level(log_level level);

        void enable_logging();
    };

    /**
     * Read a YAML configuration file into the context.
     *
     * Recognised keys are ``log_level`` and ``search_locations``, others are ignored.
     * Values already in the context are overwritten only for keys present in the file.
     */
    [[nodiscard]] auto load_config_file(Context& context, const fs::u8path& file)
        -> expected_t<void>;
}

#endif
