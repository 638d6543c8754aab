/// @copyright
/// Copyright (C) OpenCyphal Development Team  <opencyphal.org>
/// Copyright Amazon.com Inc. or its affiliates.
/// SPDX-License-Identifier: MIT

#ifndef LIBPARCEL_LOGGING_HPP_INCLUDED
#define LIBPARCEL_LOGGING_HPP_INCLUDED

#include "config.hpp"

#include <spdlog/logger.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <utility>

namespace libparcel
{

/// @brief Gets the logger of the library.
///
/// On first use the logger is looked up in the spdlog registry by `config::Logging::LoggerName()`,
/// so an application could install its own logger (with its own sinks and level) beforehand.
/// Otherwise a new colored stdout logger is created and registered with `config::Logging::DefaultLevel()`.
///
inline spdlog::logger& getLogger()
{
    static const std::shared_ptr<spdlog::logger> logger = [] {
        if (auto existing = spdlog::get(config::Logging::LoggerName()))
        {
            return existing;
        }

        auto sink    = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        auto created = std::make_shared<spdlog::logger>(config::Logging::LoggerName(), std::move(sink));
        created->set_level(config::Logging::DefaultLevel());
        spdlog::register_logger(created);
        return created;
    }();

    return *logger;
}

}  // namespace libparcel

#endif  // LIBPARCEL_LOGGING_HPP_INCLUDED
