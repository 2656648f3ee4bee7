/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/browser.hpp>
#include <impcurl/config.hpp>
#include <impcurl/decoder.hpp>
#include <impcurl/error.hpp>
#include <impcurl/logger.hpp>
#include <impcurl/request.hpp>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <new>
#include <string_view>

namespace impcurl
{
namespace
{
using TUrl = std::unique_ptr<CURLU, decltype(&curl_url_cleanup)>;

TUrl
make_url(const std::string& str)
{
    TUrl u{ curl_url(), &curl_url_cleanup };
    if (nullptr == u) throw std::bad_alloc{};

    if (auto rc{ curl_url_set(u.get(), CURLUPART_URL, str.c_str(), CURLU_DEFAULT_SCHEME | CURLU_NON_SUPPORT_SCHEME) };
        CURLUE_OK != rc)
        throw error("invalid url \"" + str + "\": " + curl_url_strerror(rc), rc);
    return u;
}

std::string
url_part(CURLU* u, CURLUPart part, unsigned int flags = 0)
{
    char* out{ nullptr };
    if (CURLUE_OK != curl_url_get(u, part, &out, flags) || nullptr == out) return {};

    std::string ret{ out };
    curl_free(out);
    return ret;
}

std::string_view
trim(std::string_view str) noexcept
{
    const auto first{ str.find_first_not_of(" \t\r\n") };
    if (std::string_view::npos == first) return {};
    const auto last{ str.find_last_not_of(" \t\r\n") };
    return str.substr(first, last - first + 1);
}

std::string
to_lower(std::string_view str)
{
    std::string ret{ str };
    std::transform(std::begin(ret), std::end(ret), std::begin(ret), [](unsigned char c) { return std::tolower(c); });
    return ret;
}

std::string
to_upper(std::string_view str)
{
    std::string ret{ str };
    std::transform(std::begin(ret), std::end(ret), std::begin(ret), [](unsigned char c) { return std::toupper(c); });
    return ret;
}

bool
starts_with(std::string_view str, std::string_view prefix) noexcept
{
    return str.substr(0, prefix.size()) == prefix;
}

/**
 * @brief debug_to_logger - CURLOPT_DEBUGFUNCTION of verbose requests
 */
int
debug_to_logger(int type, const char* data, size_t size)
{
    const auto text{ trim(std::string_view{ data, size }) };

    switch (type)
    {
        case CURLINFO_TEXT:
            logger()->info("* {}", text);
            break;
        case CURLINFO_HEADER_OUT:
            logger()->info("> {}", text);
            break;
        case CURLINFO_HEADER_IN:
            logger()->info("< {}", text);
            break;
        default:
            break;
    }
    return 0;
}

/**
 * @brief merge_headers - Add (or replace, names being case-insensitive) headers to a base set
 */
void
merge_headers(handle::THeaders& base, const handle::THeaders& extra)
{
    for (const auto& [name, value] : extra)
    {
        auto it{ std::find_if(std::begin(base), std::end(base), [key{ to_lower(name) }](const auto& h) {
            return to_lower(h.first) == key;
        }) };

        if (std::end(base) != it)
            it->second = value;
        else
            base.emplace_back(name, value);
    }
}

void
set_proxy(handle& h, const std::string& proxy)
{
    h.set_opt(CURLOPT_PROXY, proxy);
    if (!starts_with(to_lower(proxy), "socks")) h.set_opt(CURLOPT_HTTPPROXYTUNNEL, 1L);

    TUrl u{ nullptr, &curl_url_cleanup };
    try
    {
        u = make_url(proxy);
    }
    catch (const error& e)
    {
        throw option_error("CURLOPT_PROXY", e.what(), e.code());
    }

    if (auto user{ url_part(u.get(), CURLUPART_USER, CURLU_URLDECODE) }; !user.empty())
    {
        h.set_opt(CURLOPT_PROXYUSERNAME, user);
        h.set_opt(CURLOPT_PROXYPASSWORD, url_part(u.get(), CURLUPART_PASSWORD, CURLU_URLDECODE));
    }
}

void
set_tls(handle& h, const request_options& opts)
{
    if (!opts.verify_ssl.value_or(config::defaults().verify_ssl))
    {
        h.set_opt(CURLOPT_SSL_VERIFYPEER, 0L);
        h.set_opt(CURLOPT_SSL_VERIFYHOST, 0L);
        h.set_opt(CURLOPT_PROXY_SSL_VERIFYPEER, 0L);
        h.set_opt(CURLOPT_PROXY_SSL_VERIFYHOST, 0L);
        return;
    }

    auto bundle{ opts.ca_bundle.empty() ? config::ca_bundle() : std::optional<std::string>{ opts.ca_bundle } };
    if (!bundle) return;

    h.set_opt(CURLOPT_CAINFO, *bundle);
    h.set_opt(CURLOPT_PROXY_CAINFO, *bundle);
}

/**
 * @brief redirect_target - Where a 3xx response points to
 * @return The absolute URL, or an empty string when the response is not a redirect
 */
std::string
redirect_target(const handle& h, long status)
{
    if (status < 300 || status > 399 || 304 == status) return {};

    if (auto target{ h.get_info_string(CURLINFO_REDIRECT_URL) }; !target.empty()) return target;

    const auto headers{ parse_headers(h.response_headers()) };
    const auto it{ headers.find("location") };
    if (std::end(headers) == it || it->second.empty()) return {};

    const auto base{ h.get_info_string(CURLINFO_EFFECTIVE_URL) };
    return base.empty() ? it->second : resolve_url(base, it->second);
}

} // namespace

//---------------------------------------------------------------------------------------------------------------------
// URLS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief build_url - Append query parameters to an URL
 * @param url The URL, that may already have a query
 * @param params The parameters, URL-encoded (spaces become '+')
 * @return The URL (untouched when there is no parameter)
 *
 * @throw error if the URL can not be parsed
 */
std::string
build_url(const std::string& url, const std::vector<std::pair<std::string, std::string>>& params)
{
    if (params.empty()) return url;

    auto u{ make_url(url) };
    for (const auto& [name, value] : params)
    {
        const auto part{ name + "=" + value };
        if (auto rc{ curl_url_set(u.get(), CURLUPART_QUERY, part.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE) };
            CURLUE_OK != rc)
            throw error("invalid query parameter \"" + name + "\": " + curl_url_strerror(rc), rc);
    }
    return url_part(u.get(), CURLUPART_URL);
}

/**
 * @brief resolve_url - Resolve a (possibly relative) reference against a base URL
 */
std::string
resolve_url(const std::string& base, const std::string& ref)
{
    auto u{ make_url(base) };
    if (auto rc{ curl_url_set(u.get(), CURLUPART_URL, ref.c_str(), CURLU_NON_SUPPORT_SCHEME) }; CURLUE_OK != rc)
        throw error("invalid url reference \"" + ref + "\": " + curl_url_strerror(rc), rc);
    return url_part(u.get(), CURLUPART_URL);
}

//---------------------------------------------------------------------------------------------------------------------
// BUILDING BLOCKS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief resolve - Fill the unset values of the options with config::defaults()
 */
request_options
resolve(request_options opts)
{
    const auto d{ config::defaults() };

    if (!opts.timeout_ms) opts.timeout_ms = d.timeout_ms;
    if (!opts.follow_redirects) opts.follow_redirects = d.follow_redirects;
    if (!opts.max_redirects) opts.max_redirects = d.max_redirects;
    if (!opts.verify_ssl) opts.verify_ssl = d.verify_ssl;
    opts.method = to_upper(opts.method);
    return opts;
}

hop
first_hop(const request_options& opts)
{
    return hop{ build_url(opts.url, opts.params), to_upper(opts.method), true, 0 };
}

/**
 * @brief prepare - Configure a transfer for one hop of a request
 * @param h A fresh (or reset) handle
 * @param opts The request
 * @param cur The hop: URL, method, and whether the body is sent
 *
 * @throw option_error if an option is refused, or if the impersonation target is neither supported by libcurl nor a
 * known browser profile
 */
void
prepare(handle& h, const request_options& opts, const hop& cur)
{
    const browser_profile* profile{ nullptr };

    // Impersonation first: libcurl-impersonate merges the headers set afterwards with its own
    if (!opts.impersonate.empty())
    {
        if (auto rc{ h.impersonate(opts.impersonate, true) }; CURLE_OK != rc)
        {
            profile = browser::find(opts.impersonate);
            if (nullptr == profile) throw option_error("impersonate", handle::strerror(rc), rc);

            logger()->debug("impersonation unavailable ({}), using the {} header profile",
                            handle::strerror(rc),
                            profile->name);
            h.set_opt(CURLOPT_USERAGENT, profile->user_agent);
            h.set_opt(CURLOPT_ACCEPT_ENCODING, profile->accept_encoding);
            h.set_opt(CURLOPT_HTTP_VERSION, profile->http_version);
        }
    }

    h.set_opt(CURLOPT_URL, cur.url);
    h.set_opt(CURLOPT_FOLLOWLOCATION, 0L);

    // Method
    const auto& method{ cur.method };
    const bool  has_body{ cur.with_body &&
                         (!opts.body.empty() || "POST" == method || "PUT" == method || "PATCH" == method) };

    if ("GET" == method)
    {
        if (has_body)
            h.set_opt(CURLOPT_CUSTOMREQUEST, method);
        else
            h.set_opt(CURLOPT_HTTPGET, 1L);
    }
    else if ("HEAD" == method)
        h.set_opt(CURLOPT_NOBODY, 1L);
    else if ("POST" == method)
        h.set_opt(CURLOPT_POST, 1L);
    else
        h.set_opt(CURLOPT_CUSTOMREQUEST, method);

    if (has_body) h.set_opt(CURLOPT_POSTFIELDS, bytes{ std::begin(opts.body), std::end(opts.body) });

    // Headers
    handle::THeaders headers{ (nullptr != profile) ? browser::headers(*profile) : handle::THeaders{} };
    merge_headers(headers, opts.headers);
    if (!headers.empty()) h.set_headers(headers);

    // Cookies: enable the cookie engine, without reading any file
    h.set_opt(CURLOPT_COOKIEFILE, std::string{});
    if (!opts.cookie.empty()) h.set_opt(CURLOPT_COOKIE, opts.cookie);

    if (opts.auth)
    {
        h.set_opt(CURLOPT_USERNAME, opts.auth->username);
        h.set_opt(CURLOPT_PASSWORD, opts.auth->password);
    }

    h.set_opt(CURLOPT_TIMEOUT_MS, opts.timeout_ms.value_or(config::defaults().timeout_ms));

    if (!opts.proxy.empty()) set_proxy(h, opts.proxy);
    set_tls(h, opts);

    if (!opts.referer.empty()) h.set_opt(CURLOPT_REFERER, opts.referer);
    if (!opts.accept_encoding.empty()) h.set_opt(CURLOPT_ACCEPT_ENCODING, opts.accept_encoding);
    if (!opts.user_agent.empty()) h.set_opt(CURLOPT_USERAGENT, opts.user_agent);

    if (opts.verbose)
    {
        h.set_opt(CURLOPT_VERBOSE, 1L);
        h.set_cb_debug(debug_to_logger);
    }
}

/**
 * @brief finalize - Build the response of a completed transfer
 * @param h The completed transfer
 * @param redirect_count Redirects followed before this transfer
 * @param decode_body Decode the body with its Content-Encoding (\see decodes_itself)
 *
 * A body that can not be decoded is kept as received, with a warning.
 */
response
finalize(const handle& h, long redirect_count, bool decode_body)
{
    response ret;

    ret.status         = h.get_info_long(CURLINFO_RESPONSE_CODE);
    ret.status_text    = status_text(ret.status);
    ret.raw_headers    = h.response_headers();
    ret.headers        = parse_headers(ret.raw_headers);
    ret.raw_body       = h.response_data();
    ret.body           = ret.raw_body;
    ret.url            = h.get_info_string(CURLINFO_EFFECTIVE_URL);
    ret.redirect_count = redirect_count;

    if (const auto it{ ret.headers.find("content-encoding") }; decode_body && std::end(ret.headers) != it)
    {
        try
        {
            ret.body = impcurl::decode_body(ret.raw_body, it->second);
        }
        catch (const decode_error& e)
        {
            logger()->warn("{}: body kept as received ({}: {})", ret.url, it->second, e.what());
        }
    }
    return ret;
}

/**
 * @brief decodes_itself - Whether libcurl decodes the bodies of a request (CURLOPT_ACCEPT_ENCODING is set)
 */
bool
decodes_itself(const request_options& opts) noexcept
{
    return !opts.accept_encoding.empty() || !opts.impersonate.empty();
}

//---------------------------------------------------------------------------------------------------------------------
// TYPED BODIES
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set_json - Serialize a JSON value as the body of a request, with its Content-Type
 */
void
set_json(request_options& opts, const nlohmann::json& value)
{
    opts.body = value.dump();
    merge_headers(opts.headers, { { "Content-Type", "application/json" } });
}

/**
 * @brief set_form - URL-encode fields as the body of a request, with its Content-Type
 *
 * @throw error if a field can not be encoded
 */
void
set_form(request_options& opts, const std::vector<std::pair<std::string, std::string>>& fields)
{
    auto u{ make_url("http://localhost/") };
    for (const auto& [name, value] : fields)
    {
        const auto part{ name + "=" + value };
        if (auto rc{ curl_url_set(u.get(), CURLUPART_QUERY, part.c_str(), CURLU_APPENDQUERY | CURLU_URLENCODE) };
            CURLUE_OK != rc)
            throw error("invalid form field \"" + name + "\": " + curl_url_strerror(rc), rc);
    }

    opts.body = url_part(u.get(), CURLUPART_QUERY);
    merge_headers(opts.headers, { { "Content-Type", "application/x-www-form-urlencoded" } });
}

/**
 * @brief follow - Decide whether a completed hop is a redirect to follow, and move to the next hop if so
 * @param h The completed transfer
 * @param opts The request
 * @param cur The current hop, updated with the target when following
 * @return true if another hop must be performed
 *
 * @throw too_many_redirects_error if the redirect ceiling of the request is reached
 */
bool
follow(const handle& h, const request_options& opts, hop& cur)
{
    if (!opts.follow_redirects.value_or(config::defaults().follow_redirects)) return false;

    const auto status{ h.get_info_long(CURLINFO_RESPONSE_CODE) };
    auto       target{ redirect_target(h, status) };
    if (target.empty()) return false;

    const auto max{ opts.max_redirects.value_or(config::defaults().max_redirects) };
    if (cur.redirects >= max)
        throw too_many_redirects_error(
          "maximum (" + std::to_string(max) + ") redirects followed, next one is " + target, CURLE_TOO_MANY_REDIRECTS);

    ++cur.redirects;
    if ((303 == status && "HEAD" != cur.method) || ((301 == status || 302 == status) && "POST" == cur.method))
    {
        cur.method    = "GET";
        cur.with_body = false;
    }
    logger()->debug("{} redirect to {} ({})", status, target, cur.method);
    cur.url = std::move(target);
    return true;
}

/**
 * @brief parse_headers - Build the header map of a response
 *
 * Every status line ("HTTP/...") starts a new header block: only the headers of the last block are kept (the
 * previous ones belong to an interim response or to the proxy).
 */
std::map<std::string, std::string>
parse_headers(const std::vector<std::string>& lines)
{
    std::map<std::string, std::string> ret;

    for (const auto& line : lines)
    {
        if (starts_with(line, "HTTP/"))
        {
            ret.clear();
            continue;
        }

        const auto sep{ line.find(':') };
        if (std::string::npos == sep) continue;

        auto key{ to_lower(trim(std::string_view{ line }.substr(0, sep))) };
        if (key.empty()) continue;
        ret.insert_or_assign(std::move(key), std::string{ trim(std::string_view{ line }.substr(sep + 1)) });
    }
    return ret;
}

std::string
status_text(long status)
{
    static const std::map<long, std::string> texts{ { 100, "Continue" },
                                                    { 101, "Switching Protocols" },
                                                    { 200, "OK" },
                                                    { 201, "Created" },
                                                    { 202, "Accepted" },
                                                    { 204, "No Content" },
                                                    { 206, "Partial Content" },
                                                    { 301, "Moved Permanently" },
                                                    { 302, "Found" },
                                                    { 303, "See Other" },
                                                    { 304, "Not Modified" },
                                                    { 307, "Temporary Redirect" },
                                                    { 308, "Permanent Redirect" },
                                                    { 400, "Bad Request" },
                                                    { 401, "Unauthorized" },
                                                    { 403, "Forbidden" },
                                                    { 404, "Not Found" },
                                                    { 405, "Method Not Allowed" },
                                                    { 408, "Request Timeout" },
                                                    { 409, "Conflict" },
                                                    { 429, "Too Many Requests" },
                                                    { 500, "Internal Server Error" },
                                                    { 502, "Bad Gateway" },
                                                    { 503, "Service Unavailable" },
                                                    { 504, "Gateway Timeout" } };

    const auto it{ texts.find(status) };
    return (std::end(texts) != it) ? it->second : "Unknown";
}

//---------------------------------------------------------------------------------------------------------------------
// BLOCKING REQUESTS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief request - Perform a request in the calling thread
 * @return The response of the last hop
 *
 * @throw transfer_error if a transfer fails (the HTTP status is not an error)
 * @throw too_many_redirects_error, option_error, error (invalid URL)
 */
response
request(const request_options& opts, engine& eng)
{
    const auto o{ resolve(opts) };
    auto       cur{ first_hop(o) };

    for (;;)
    {
        handle h{ eng };
        prepare(h, o, cur);

        logger()->debug("{} {}", cur.method, cur.url);
        if (auto rc{ h.perform() }; CURLE_OK != rc) throw transfer_error(eng.easy_strerror(rc), rc);
        if (!follow(h, o, cur)) return finalize(h, cur.redirects, !decodes_itself(o));
    }
}

response
get(const std::string& url, request_options opts)
{
    opts.url    = url;
    opts.method = "GET";
    return request(opts);
}

response
post(const std::string& url, std::string body, request_options opts)
{
    opts.url    = url;
    opts.method = "POST";
    opts.body   = std::move(body);
    return request(opts);
}

response
put(const std::string& url, std::string body, request_options opts)
{
    opts.url    = url;
    opts.method = "PUT";
    opts.body   = std::move(body);
    return request(opts);
}

response
patch(const std::string& url, std::string body, request_options opts)
{
    opts.url    = url;
    opts.method = "PATCH";
    opts.body   = std::move(body);
    return request(opts);
}

response
del(const std::string& url, request_options opts)
{
    opts.url    = url;
    opts.method = "DELETE";
    return request(opts);
}

/*********************************************************************************************************************/
//---------------------------------------------------------------------------------------------------------------------
// CLIENT
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief exchange - A request in progress in a multi session
 *
 * It owns the transfer of the current hop, and is kept alive by the continuations of that transfer.
 */
struct client::exchange
{
    mhandle&                session;
    engine&                 eng;
    request_options         opts;
    hop                     cur;
    std::unique_ptr<handle> hdl;
    TCbResponse             on_response;
    TCbFailure              on_failure;

    void fail(std::exception_ptr e)
    {
        hdl.reset();
        if (on_failure)
            on_failure(e);
        else
            logger()->error("request to {} failed without failure callback", cur.url);
    }
};

client::client(mhandle& session, engine& eng)
  : session__{ session }
  , engine__{ eng }
{}

/**
 * @brief step - Start the transfer of the current hop of an exchange
 * The previous transfer, if any, is closed.
 */
void
client::step(const std::shared_ptr<exchange>& x)
{
    try
    {
        x->hdl = std::make_unique<handle>(x->eng);
        prepare(*x->hdl, x->opts, x->cur);
    }
    catch (const std::exception&)
    {
        x->fail(std::current_exception());
        return;
    }

    logger()->debug("{} {}", x->cur.method, x->cur.url);
    x->session.add_handle(
      *x->hdl,
      [x](handle& h) {
          bool again{ false };
          try
          {
              again = follow(h, x->opts, x->cur);
          }
          catch (const std::exception&)
          {
              x->fail(std::current_exception());
              return;
          }

          if (again)
          {
              step(x);
              return;
          }

          auto res{ finalize(h, x->cur.redirects, !decodes_itself(x->opts)) };
          x->hdl.reset();
          if (x->on_response) x->on_response(std::move(res));
      },
      [x](std::exception_ptr e) { x->fail(e); });
}

/**
 * @brief request - Perform a request in the multi session of the client
 * @param opts The request
 * @param on_response Called with the response of the last hop
 * @param on_failure Called with the exception of the first failure (\see impcurl::request for the errors)
 *
 * Both callbacks are called from the loop of the session, except when the first transfer can not be started.
 */
void
client::request(const request_options& opts, TCbResponse on_response, TCbFailure on_failure)
{
    auto x{ std::make_shared<exchange>(
      exchange{ session__, engine__, resolve(opts), hop{}, nullptr, std::move(on_response), std::move(on_failure) }) };

    try
    {
        x->cur = first_hop(x->opts);
    }
    catch (const std::exception&)
    {
        x->fail(std::current_exception());
        return;
    }
    step(x);
}

/**
 * @warning The future is only fulfilled by the loop: do not wait for it in the loop thread
 */
std::future<response>
client::request(const request_options& opts)
{
    auto promise{ std::make_shared<std::promise<response>>() };
    auto ret{ promise->get_future() };

    request(
      opts,
      [promise](response r) { promise->set_value(std::move(r)); },
      [promise](std::exception_ptr e) { promise->set_exception(e); });

    return ret;
}

} // namespace impcurl
