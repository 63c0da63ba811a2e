// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <array>
#include <memory>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "pylocate/core/logging.hpp"
#include "pylocate/util/string.hpp"

namespace pylocate
{
    namespace
    {
        constexpr std::array<std::string_view, 7> log_level_names = {
            "trace", "debug", "info", "warning", "error", "critical", "off",
        };

        spdlog::level::level_enum convert_log_level(log_level l)
        {
            return static_cast<spdlog::level::level_enum>(l);
        }
    }

    auto name_of(log_level level) noexcept -> std::string_view
    {
        return log_level_names[static_cast<std::size_t>(level)];
    }

    auto parse_log_level(std::string_view name) -> std::optional<log_level>
    {
        const auto lower = util::to_lower(util::strip(name));
        for (std::size_t i = 0; i < log_level_names.size(); ++i)
        {
            if (lower == log_level_names[i])
            {
                return { static_cast<log_level>(i) };
            }
        }
        // Short spellings also accepted by spdlog
        if (lower == "warn")
        {
            return { log_level::warn };
        }
        if (lower == "err")
        {
            return { log_level::err };
        }
        return {};
    }

    namespace logging
    {
        void enable_logging(const LoggingParams& params)
        {
            auto logger = std::make_shared<spdlog::logger>(
                "libpylocate",
                std::make_shared<spdlog::sinks::stderr_color_sink_mt>()
            );
            logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
                params.log_pattern,
                spdlog::pattern_time_type::local,
                "\n"
            ));
            spdlog::set_default_logger(std::move(logger));
            set_log_level(params.logging_level);
        }

        void set_log_level(log_level level)
        {
            spdlog::set_level(convert_log_level(level));
        }
    }

    /*****************
     * MessageLogger *
     *****************/

    MessageLogger::MessageLogger(log_level level)
        : m_level(level)
        , m_stream()
    {
    }

    MessageLogger::~MessageLogger()
    {
        if (m_level == log_level::off)
        {
            return;
        }
        spdlog::log(convert_log_level(m_level), m_stream.str());
    }

    std::stringstream& MessageLogger::stream()
    {
        return m_stream;
    }
}
