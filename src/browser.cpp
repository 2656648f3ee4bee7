/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/browser.hpp>

#include <curl/curl.h>

#include <stdexcept>

namespace impcurl
{
//---------------------------------------------------------------------------------------------------------------------
// PROFILES
//---------------------------------------------------------------------------------------------------------------------

const std::vector<browser_profile>&
browser::profiles() noexcept
{
    static const std::vector<browser_profile> table{
        { "chrome110",
          "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) Chrome/110.0.0.0 "
          "Safari/537.36",
          "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,image/apng,*/*;q=0.8,"
          "application/signed-exchange;v=b3;q=0.7",
          "en-US,en;q=0.9",
          "gzip, deflate, br",
          CURL_HTTP_VERSION_2_0 },
        { "firefox109",
          "Mozilla/5.0 (Windows NT 10.0; Win64; x64; rv:109.0) Gecko/20100101 Firefox/109.0",
          "text/html,application/xhtml+xml,application/xml;q=0.9,image/avif,image/webp,*/*;q=0.8",
          "en-US,en;q=0.5",
          "gzip, deflate, br",
          CURL_HTTP_VERSION_2_0 },
        { "safari15_5",
          "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) AppleWebKit/605.1.15 (KHTML, like Gecko) Version/15.5 "
          "Safari/605.1.15",
          "text/html,application/xhtml+xml,application/xml;q=0.9,*/*;q=0.8",
          "en-US,en;q=0.9",
          "gzip, deflate, br",
          CURL_HTTP_VERSION_2_0 }
    };
    return table;
}

std::vector<std::string>
browser::available()
{
    std::vector<std::string> ret;
    for (const auto& p : profiles())
        ret.emplace_back(p.name);
    return ret;
}

const browser_profile*
browser::find(const std::string& name) noexcept
{
    for (const auto& p : profiles())
        if (p.name == name) return &p;
    return nullptr;
}

/**
 * @brief headers - The request headers sent by a profile
 * Accept-Encoding is not part of them: it goes through CURLOPT_ACCEPT_ENCODING so that libcurl decodes the body.
 */
handle::THeaders
browser::headers(const browser_profile& p)
{
    return { { "Accept", p.accept },
             { "Accept-Language", p.accept_language },
             { "Cache-Control", "no-cache" },
             { "Upgrade-Insecure-Requests", "1" } };
}

//---------------------------------------------------------------------------------------------------------------------
// APPLICATION
//---------------------------------------------------------------------------------------------------------------------

void
browser::apply_profile(handle& h, const std::string& name)
{
    const auto* p{ find(name) };
    if (nullptr == p) throw std::invalid_argument{ "unknown browser profile: " + name };
    apply_profile(h, *p);
}

void
browser::apply_profile(handle& h, const browser_profile& p)
{
    h.set_opt(CURLOPT_USERAGENT, p.user_agent);
    h.set_opt(CURLOPT_ACCEPT_ENCODING, p.accept_encoding);
    h.set_opt(CURLOPT_HTTP_VERSION, p.http_version);
    h.set_headers(headers(p));
}

} // namespace impcurl
