// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#include <atomic>
#include <string>

#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "optrust/core/logging_spdlog.hpp"

namespace optrust::logging::spdlogimpl
{
    struct LogHandler_spdlog::Impl
    {
        std::atomic_bool is_active{ false };
    };

    LogHandler_spdlog::LogHandler_spdlog()
        : pimpl(std::make_unique<Impl>())
    {
    }

    LogHandler_spdlog::~LogHandler_spdlog() = default;

    auto LogHandler_spdlog::start_log_handling(LoggingParams params, spdlog::sink_ptr sink) -> void
    {
        if (pimpl->is_active)
        {
            stop_log_handling();
        }

        if (!sink)
        {
            sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        }

        auto logger = std::make_shared<spdlog::logger>(std::string(logger_name), std::move(sink));
        logger->set_formatter(std::make_unique<spdlog::pattern_formatter>(
            std::string(params.log_pattern),
            spdlog::pattern_time_type::local,
            std::string("\n")
        ));
        logger->set_level(to_spdlog(params.logging_level));
        logger->flush_on(spdlog::level::err);

        spdlog::drop(std::string(logger_name));
        spdlog::set_default_logger(std::move(logger));

        pimpl->is_active = true;
    }

    auto LogHandler_spdlog::stop_log_handling() -> void
    {
        if (!pimpl->is_active)
        {
            return;
        }

        if (auto logger = spdlog::get(std::string(logger_name)))
        {
            logger->flush();
        }
        spdlog::drop(std::string(logger_name));
        pimpl->is_active = false;
    }

    auto LogHandler_spdlog::set_log_level(log_level new_level) -> void
    {
        if (auto logger = spdlog::get(std::string(logger_name)))
        {
            logger->set_level(to_spdlog(new_level));
        }
    }

    auto LogHandler_spdlog::log(const LogRecord& record) -> void
    {
        auto logger = spdlog::get(std::string(logger_name));
        if (!logger)
        {
            logger = spdlog::default_logger();
        }
        if (!logger)
        {
            return;
        }

        logger->log(
            spdlog::source_loc{
                record.location.file_name(),
                static_cast<int>(record.location.line()),
                record.location.function_name(),
            },
            to_spdlog(record.level),
            record.message
        );
    }

    auto LogHandler_spdlog::flush() -> void
    {
        spdlog::apply_all([](std::shared_ptr<spdlog::logger> l) { l->flush(); });
    }

    auto LogHandler_spdlog::is_started() const -> bool
    {
        return pimpl->is_active;
    }

    auto log_handler() -> LogHandler_spdlog&
    {
        static LogHandler_spdlog handler;
        return handler;
    }
}
