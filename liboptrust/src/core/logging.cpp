// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <mutex>
#include <utility>

#include "optrust/core/logging.hpp"
#include "optrust/core/logging_spdlog.hpp"

namespace optrust::logging
{
    namespace
    {
        std::mutex params_mutex = {};
        LoggingParams logging_params = {};
    }

    auto start_logging(LoggingParams params) -> void
    {
        std::scoped_lock lock{ params_mutex };
        logging_params = params;
        spdlogimpl::log_handler().start_log_handling(params);
    }

    auto stop_logging() -> void
    {
        spdlogimpl::log_handler().stop_log_handling();
    }

    auto is_logging_started() -> bool
    {
        return spdlogimpl::log_handler().is_started();
    }

    auto set_log_level(log_level new_level) -> log_level
    {
        std::scoped_lock lock{ params_mutex };
        const auto previous_level = std::exchange(logging_params.logging_level, new_level);
        spdlogimpl::log_handler().set_log_level(new_level);
        return previous_level;
    }

    auto get_log_level() -> log_level
    {
        std::scoped_lock lock{ params_mutex };
        return logging_params.logging_level;
    }

    auto get_logging_params() -> LoggingParams
    {
        std::scoped_lock lock{ params_mutex };
        return logging_params;
    }

    auto log(LogRecord record) -> void
    {
        if (record.level < get_log_level() || record.level >= log_level::off)
        {
            return;
        }
        spdlogimpl::log_handler().log(record);
    }

    auto flush_logs() -> void
    {
        spdlogimpl::log_handler().flush();
    }

    ///////////////////////////////////////////////////////////////////
    // MessageLogger

    MessageLogger::MessageLogger(log_level level, std::source_location location)
        : m_level(level)
        , m_location(std::move(location))
    {
    }

    MessageLogger::~MessageLogger()
    {
        log(LogRecord{
            .message = m_stream.str(),
            .level = m_level,
            .location = std::move(m_location),
        });
    }
}
