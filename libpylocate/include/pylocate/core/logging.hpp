// Copyright (c) 2024, pylocate contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef PYLOCATE_CORE_LOGGING_HPP
#define PYLOCATE_CORE_LOGGING_HPP

#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace pylocate
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        Values match spdlog's own levels.
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,
        off
    };

    /// @returns The name of the specified log level.
    [[nodiscard]] auto name_of(log_level level) noexcept -> std::string_view;

    /// Parse a log level name as written in configuration files, case insensitive.
    [[nodiscard]] auto parse_log_level(std::string_view name) -> std::optional<log_level>;

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern given to spdlog.
        std::string log_pattern{ "%^%-9!l%-8n%$ %v" };
    };

    namespace logging
    {
        /** Install the `libpylocate` logger as spdlog's default logger.
            Records are written to stderr using `params.log_pattern`.
         */
        void enable_logging(const LoggingParams& params);

        /// Change the minimum level of the default logger.
        void set_log_level(log_level level);
    }

    /** Accumulates a message through `stream()` and hands it to spdlog when destroyed.
        Use through the `LOG_...` macros.
     */
    class MessageLogger
    {
    public:

        explicit MessageLogger(log_level level);
        ~MessageLogger();

        MessageLogger(const MessageLogger&) = delete;
        MessageLogger& operator=(const MessageLogger&) = delete;

        std::stringstream& stream();

    private:

        log_level m_level;
        std::stringstream m_stream;
    };
}

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

#define LOG(severity) pylocate::MessageLogger(severity).stream()
#define LOG_TRACE LOG(pylocate::log_level::trace)
#define LOG_DEBUG LOG(pylocate::log_level::debug)
#define LOG_INFO LOG(pylocate::log_level::info)
#define LOG_WARNING LOG(pylocate::log_level::warn)
#define LOG_ERROR LOG(pylocate::log_level::err)
#define LOG_CRITICAL LOG(pylocate::log_level::critical)

#endif  // PYLOCATE_CORE_LOGGING_HPP
