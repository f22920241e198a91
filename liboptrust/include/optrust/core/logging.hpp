// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CORE_LOGGING_HPP
#define OPTRUST_CORE_LOGGING_HPP

#include <array>
#include <cstddef>
#include <source_location>
#include <sstream>
#include <string>
#include <string_view>

#undef LOG
#undef LOG_TRACE
#undef LOG_DEBUG
#undef LOG_INFO
#undef LOG_WARNING
#undef LOG_ERROR
#undef LOG_CRITICAL

// clang-format off
#define LOG(severity)   optrust::logging::MessageLogger(severity).stream()
#define LOG_TRACE       LOG(optrust::log_level::trace)
#define LOG_DEBUG       LOG(optrust::log_level::debug)
#define LOG_INFO        LOG(optrust::log_level::info)
#define LOG_WARNING     LOG(optrust::log_level::warn)
#define LOG_ERROR       LOG(optrust::log_level::err)
#define LOG_CRITICAL    LOG(optrust::log_level::critical)
// clang-format on

namespace optrust
{
    /** Level of logging, used to filter out logs which are at a lower level than the current one.
        @see `optrust::LoggingParams`
        @see `optrust::logging::set_log_level`
     */
    enum class log_level
    {
        trace,
        debug,
        info,
        warn,
        err,
        critical,

        // Special values:
        off,
        all
    };

    inline constexpr auto operator<=>(log_level left, log_level right) noexcept
    {
        return static_cast<int>(left) <=> static_cast<int>(right);
    }

    /// @returns The name of the specified log level as an UTF-8 null-terminated string.
    inline constexpr auto name_of(log_level level) noexcept -> const char*
    {
        constexpr std::array names{ "trace", "debug",    "info", "warning",
                                    "error", "critical", "off",  "all" };
        return names.at(static_cast<std::size_t>(level));
    }

    /** Parameters for the logging system.
     */
    struct LoggingParams
    {
        /// Minimum level a log record must have to not be filtered out.
        log_level logging_level{ log_level::warn };

        /// Formatting pattern to use in formatted logs.
        std::string_view log_pattern{ "%^%-9!l%-8n%$ %v" };

        auto operator==(const LoggingParams& other) const noexcept -> bool = default;
    };

    namespace logging
    {
        /// Name of the logger all library records are emitted through.
        inline constexpr std::string_view logger_name = "liboptrust";

        /** All the information about a log.

            @see `optrust::logging::log`
            @see The `LOG_...` macros
         */
        struct LogRecord
        {
            /// Message to be printed/captured in the logging implementation.
            std::string message;

            /// Level of this log. If lower than the current level, this log will be ignored.
            log_level level = log_level::off;

            /// Source location of this log if available, otherwise empty.
            std::source_location location = {};
        };

        /** Starts the logging system with the provided parameters.

            Records emitted before this call are forwarded to the default `spdlog` logger
            when their level passes the current threshold.
         */
        auto start_logging(LoggingParams params = {}) -> void;

        /// Flushes and stops the logging system. Calling it when not started does nothing.
        auto stop_logging() -> void;

        /// @returns `true` if `start_logging` was called and `stop_logging` was not since.
        auto is_logging_started() -> bool;

        /** Changes the current log level threshold.
            @returns The previous level.
         */
        auto set_log_level(log_level new_level) -> log_level;

        /// @returns The current log level threshold.
        auto get_log_level() -> log_level;

        /// @returns A copy of the current logging parameters.
        auto get_logging_params() -> LoggingParams;

        /// Emits the record if its level passes the current threshold.
        auto log(LogRecord record) -> void;

        /// Flushes all pending records.
        auto flush_logs() -> void;

        /** Collects a message through a stream and emits it as a `LogRecord` on destruction.

            This is the implementation of the `LOG_...` macros.
         */
        class MessageLogger
        {
        public:

            MessageLogger(
                log_level level,
                std::source_location location = std::source_location::current()
            );
            ~MessageLogger();

            MessageLogger(const MessageLogger&) = delete;
            MessageLogger& operator=(const MessageLogger&) = delete;

            std::stringstream& stream()
            {
                return m_stream;
            }

        private:

            log_level m_level;
            std::stringstream m_stream;
            std::source_location m_location;
        };
    }
}

#endif
