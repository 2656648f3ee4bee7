/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/config.hpp>
#include <impcurl/logger.hpp>

#include <cstdlib>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace impcurl
{
namespace
{
std::mutex       defaults_mutex{};
request_defaults current_defaults{};

bool
is_readable_file(const std::string& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && !ec;
}

} // namespace

//---------------------------------------------------------------------------------------------------------------------
// DEFAULTS
//---------------------------------------------------------------------------------------------------------------------

request_defaults
config::defaults()
{
    std::lock_guard<std::mutex> lck{ defaults_mutex };
    return current_defaults;
}

void
config::set_defaults(const request_defaults& d)
{
    std::lock_guard<std::mutex> lck{ defaults_mutex };
    current_defaults = d;
}

//---------------------------------------------------------------------------------------------------------------------
// CA BUNDLE
//---------------------------------------------------------------------------------------------------------------------

const std::vector<std::string>&
config::ca_bundle_locations() noexcept
{
    static const std::vector<std::string> locations{ "/etc/ssl/certs/ca-certificates.crt",
                                                     "/etc/pki/tls/certs/ca-bundle.crt",
                                                     "/usr/share/ssl/certs/ca-bundle.crt",
                                                     "/usr/local/share/certs/ca-root-nss.crt" };
    return locations;
}

/**
 * @brief ca_bundle - Find the CA bundle to verify peers with
 *
 * The IMPCURL_CA_BUNDLE environment variable wins when it names a file. Otherwise the first existing file of
 * ca_bundle_locations() is used.
 * @return The path, or nothing to let libcurl use its built-in default
 */
std::optional<std::string>
config::ca_bundle()
{
    if (const char* env{ std::getenv(CA_BUNDLE_ENV) }; nullptr != env && '\0' != *env)
    {
        if (is_readable_file(env)) return std::string{ env };
        logger()->warn("{}={} is not a file, ignored", CA_BUNDLE_ENV, env);
    }

    for (const auto& path : ca_bundle_locations())
        if (is_readable_file(path)) return path;

    return std::nullopt;
}

} // namespace impcurl
