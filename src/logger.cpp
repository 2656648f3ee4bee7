/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/logger.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <mutex>
#include <string_view>

namespace impcurl
{
/**
 * @brief logger - Get the library logger, creating it the first time
 *
 * If a logger named "impcurl" was already registered by the application, it is used as is.
 * @return the shared logger
 */
std::shared_ptr<spdlog::logger>
logger()
{
    static std::once_flag                  _once;
    static std::shared_ptr<spdlog::logger> _logger;

    std::call_once(_once, []() {
        if (_logger = spdlog::get(LOGGER_NAME); nullptr != _logger) return;

        _logger = spdlog::stderr_color_mt(LOGGER_NAME);
        _logger->set_level(spdlog::level::err);

        if (const char* env{ std::getenv(LOG_LEVEL_ENV) }; nullptr != env)
        {
            auto lvl{ spdlog::level::from_str(env) };

            // from_str() falls back to "off" for unknown names
            if (spdlog::level::off != lvl || std::string_view{ env } == "off")
                _logger->set_level(lvl);
            else
                _logger->warn("ignoring unknown {} value '{}'", LOG_LEVEL_ENV, env);
        }
    });

    return _logger;
}

/**
 * @brief set_log_level - Change the level of the library logger
 * @param lvl The new level
 */
void
set_log_level(spdlog::level::level_enum lvl)
{
    logger()->set_level(lvl);
}

} // namespace impcurl
