/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file config.hpp
 * @brief Process-wide configuration of the requests
 *
 * The defaults are used by every request that does not override them (\see request_options).
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_CONFIG_H
#define INCLUDE_IMPCURL_CONFIG_H

#include <optional>
#include <string>
#include <vector>

namespace impcurl
{
struct request_defaults
{
    long timeout_ms{ 30000 };
    bool follow_redirects{ true };
    long max_redirects{ 5 };
    bool verify_ssl{ true };
};

/*********************************************************************************************************************/
class config
{
public:
    static constexpr const char* CA_BUNDLE_ENV{ "IMPCURL_CA_BUNDLE" };

    config() = delete;

    static request_defaults defaults();
    static void             set_defaults(const request_defaults& d);

    static const std::vector<std::string>& ca_bundle_locations() noexcept;
    static std::optional<std::string>      ca_bundle();
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_CONFIG_H
