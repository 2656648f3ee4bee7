/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file logger.hpp
 * @brief Access to the "impcurl" spdlog logger
 *
 * The logger is created on first use and writes to stderr.
 * Its level is read from the IMPCURL_LOG_LEVEL environment variable (trace, debug, info, warn, error, critical, off)
 * and defaults to "error".
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_LOGGER_H
#define INCLUDE_IMPCURL_LOGGER_H

#include <memory>

#include <spdlog/spdlog.h>

namespace impcurl
{
constexpr const char* LOGGER_NAME{ "impcurl" };
constexpr const char* LOG_LEVEL_ENV{ "IMPCURL_LOG_LEVEL" };

std::shared_ptr<spdlog::logger> logger();

void set_log_level(spdlog::level::level_enum lvl);

} // namespace impcurl

#endif // INCLUDE_IMPCURL_LOGGER_H
