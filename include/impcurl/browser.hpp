/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file browser.hpp
 * @brief Browser header profiles
 *
 * A profile mimics the HTTP layer of a browser: user agent, Accept* headers and HTTP version.
 * It does not touch the TLS fingerprint, which only libcurl-impersonate can provide (\see handle::impersonate).
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_BROWSER_H
#define INCLUDE_IMPCURL_BROWSER_H

#include <string>
#include <vector>

#include "handle.hpp"

namespace impcurl
{
struct browser_profile
{
    std::string name;
    std::string user_agent;
    std::string accept;
    std::string accept_language;
    std::string accept_encoding;
    long        http_version;
};

/*********************************************************************************************************************/
class browser
{
public:
    browser() = delete;

    static const std::vector<browser_profile>& profiles() noexcept;
    static std::vector<std::string>            available();
    static const browser_profile*              find(const std::string& name) noexcept;

    static handle::THeaders headers(const browser_profile& p);

    static void apply_profile(handle& h, const std::string& name);
    static void apply_profile(handle& h, const browser_profile& p);
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_BROWSER_H
