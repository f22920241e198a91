// Copyright (c) 2025, optrust Contributors
//
// Distributed under the terms of the BSD 3-Clause License.
//
// The full license is in the file LICENSE, distributed with this software.

#ifndef OPTRUST_CORE_LOGGING_SPDLOG_HPP
#define OPTRUST_CORE_LOGGING_SPDLOG_HPP

#include <memory>

#include <spdlog/common.h>

#include "optrust/core/logging.hpp"

namespace optrust::logging::spdlogimpl
{
    /// @returns The provided `log_level` value converted to the equivalent value for `spdlog`.
    inline constexpr auto to_spdlog(log_level level) -> spdlog::level::level_enum
    {
        static_assert(
            static_cast<int>(log_level::all) == static_cast<int>(spdlog::level::level_enum::n_levels)
        );
        return static_cast<spdlog::level::level_enum>(level);
    }

    /** Log handling implementation using the `spdlog` library.

        Translates the calls of `optrust::logging` into calls to `spdlog`'s API.
        Every logger is owned by the `spdlog` registry.
    */
    class LogHandler_spdlog
    {
    public:

        LogHandler_spdlog();
        ~LogHandler_spdlog();

        LogHandler_spdlog(const LogHandler_spdlog& other) = delete;
        LogHandler_spdlog& operator=(const LogHandler_spdlog& other) = delete;

        /** Registers the library logger and makes it the default `spdlog` logger.

            When `sink` is null, records go to a coloured `stderr` sink.
         */
        auto start_log_handling(LoggingParams params, spdlog::sink_ptr sink = nullptr) -> void;
        auto stop_log_handling() -> void;

        auto set_log_level(log_level new_level) -> void;

        auto log(const LogRecord& record) -> void;

        auto flush() -> void;

        auto is_started() const -> bool;

    private:

        struct Impl;
        std::unique_ptr<Impl> pimpl;
    };

    /// The handler used by `optrust::logging`.
    auto log_handler() -> LogHandler_spdlog&;
}

#endif
