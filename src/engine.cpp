/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/engine.hpp>
#include <impcurl/logger.hpp>

#include <curl/curl.h>
#include <dlfcn.h>

namespace impcurl
{
//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief curl - The engine backed by the linked libcurl
 *
 * It is created on first use, which also performs the libcurl global initialisation.
 */
engine&
engine::curl()
{
    static curl_engine _engine;
    return _engine;
}

curl_engine::curl_engine()
{
    if (auto ret{ curl_global_init(CURL_GLOBAL_DEFAULT) }; CURLE_OK != ret)
        logger()->error("curl_global_init failed: {}", curl_easy_strerror(ret));

    impersonate__ = reinterpret_cast<TImpersonateFn>(dlsym(RTLD_DEFAULT, "curl_easy_impersonate"));
    logger()->debug("{} - impersonation {}", curl_version(), (nullptr != impersonate__) ? "available" : "unavailable");
}

curl_engine::~curl_engine() noexcept
{
    curl_global_cleanup();
}

//---------------------------------------------------------------------------------------------------------------------
// EASY INTERFACE
// \see https://curl.se/libcurl/c/libcurl-easy.html
//---------------------------------------------------------------------------------------------------------------------

void*
curl_engine::easy_init() noexcept
{
    return curl_easy_init();
}

void
curl_engine::easy_cleanup(void* easy) noexcept
{
    curl_easy_cleanup(static_cast<CURL*>(easy));
}

void
curl_engine::easy_reset(void* easy) noexcept
{
    curl_easy_reset(static_cast<CURL*>(easy));
}

void*
curl_engine::easy_duphandle(void* easy) noexcept
{
    return curl_easy_duphandle(static_cast<CURL*>(easy));
}

int
curl_engine::easy_setopt_long(void* easy, int id, long val) noexcept
{
    return curl_easy_setopt(static_cast<CURL*>(easy), static_cast<CURLoption>(id), val);
}

int
curl_engine::easy_setopt_offset(void* easy, int id, int64_t val) noexcept
{
    return curl_easy_setopt(static_cast<CURL*>(easy), static_cast<CURLoption>(id), static_cast<curl_off_t>(val));
}

int
curl_engine::easy_setopt_string(void* easy, int id, const char* val) noexcept
{
    return curl_easy_setopt(static_cast<CURL*>(easy), static_cast<CURLoption>(id), val);
}

int
curl_engine::easy_setopt_ptr(void* easy, int id, const void* val) noexcept
{
    return curl_easy_setopt(static_cast<CURL*>(easy), static_cast<CURLoption>(id), val);
}

/**
 * @brief easy_setopt_function - Register a trampoline as a transfer callback
 *
 * curl_easy_setopt() is variadic: the function pointer must be passed with its exact type.
 */
int
curl_engine::easy_setopt_function(void* easy, int id, const callback_bridge::trampoline& fn) noexcept
{
    using S = callback_bridge::signature;

    auto* hdl{ static_cast<CURL*>(easy) };
    auto  opt{ static_cast<CURLoption>(id) };

    switch (fn.sig)
    {
        case S::buffer:
        case S::read: return curl_easy_setopt(hdl, opt, reinterpret_cast<curl_write_callback>(fn.fn));
        case S::progress: return curl_easy_setopt(hdl, opt, reinterpret_cast<curl_xferinfo_callback>(fn.fn));
        case S::debug: return curl_easy_setopt(hdl, opt, reinterpret_cast<curl_debug_callback>(fn.fn));
        default: break;
    }
    return CURLE_BAD_FUNCTION_ARGUMENT;
}

int
curl_engine::easy_perform(void* easy) noexcept
{
    return curl_easy_perform(static_cast<CURL*>(easy));
}

int
curl_engine::easy_pause(void* easy, int bitmask) noexcept
{
    return curl_easy_pause(static_cast<CURL*>(easy), bitmask);
}

int
curl_engine::easy_getinfo_string(void* easy, int id, const char*& val) noexcept
{
    char* v{ nullptr };
    auto  ret{ curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &v) };
    val = v;
    return ret;
}

int
curl_engine::easy_getinfo_long(void* easy, int id, long& val) noexcept
{
    return curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &val);
}

int
curl_engine::easy_getinfo_double(void* easy, int id, double& val) noexcept
{
    return curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &val);
}

int
curl_engine::easy_getinfo_offset(void* easy, int id, int64_t& val) noexcept
{
    curl_off_t v{ 0 };
    auto       ret{ curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &v) };
    val = static_cast<int64_t>(v);
    return ret;
}

int
curl_engine::easy_getinfo_ptr(void* easy, int id, void*& val) noexcept
{
    return curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &val);
}

int
curl_engine::easy_getinfo_socket(void* easy, int id, curl_socket_t& val) noexcept
{
    return curl_easy_getinfo(static_cast<CURL*>(easy), static_cast<CURLINFO>(id), &val);
}

/**
 * @brief easy_impersonate - Setup a transfer to look like a given browser
 * @see https://github.com/lwthiker/curl-impersonate#libcurl-impersonate
 * @return CURLE_NOT_BUILT_IN if the linked libcurl is not libcurl-impersonate
 */
int
curl_engine::easy_impersonate(void* easy, const char* target, bool default_headers) noexcept
{
    if (nullptr == impersonate__) return CURLE_NOT_BUILT_IN;
    return impersonate__(static_cast<CURL*>(easy), target, default_headers ? 1 : 0);
}

std::string
curl_engine::easy_strerror(int code) const
{
    return curl_easy_strerror(static_cast<CURLcode>(code));
}

/**
 * @brief option_name - Get the symbolic name of an easy option (e.g. "CURLOPT_URL")
 * @see https://curl.se/libcurl/c/curl_easy_option_by_id.html
 */
std::string
curl_engine::option_name(int id) const
{
    if (const auto* opt{ curl_easy_option_by_id(static_cast<CURLoption>(id)) }; nullptr != opt && nullptr != opt->name)
        return std::string{ "CURLOPT_" } + opt->name;
    return "CURLOPT #" + std::to_string(id);
}

//---------------------------------------------------------------------------------------------------------------------
// LISTS
//---------------------------------------------------------------------------------------------------------------------

curl_slist*
curl_engine::slist_append(curl_slist* l, const char* str) noexcept
{
    return curl_slist_append(l, str);
}

void
curl_engine::slist_free_all(curl_slist* l) noexcept
{
    curl_slist_free_all(l);
}

//---------------------------------------------------------------------------------------------------------------------
// MULTI INTERFACE
// \see https://curl.se/libcurl/c/libcurl-multi.html
//---------------------------------------------------------------------------------------------------------------------

void*
curl_engine::multi_init() noexcept
{
    return curl_multi_init();
}

int
curl_engine::multi_cleanup(void* multi) noexcept
{
    return curl_multi_cleanup(static_cast<CURLM*>(multi));
}

int
curl_engine::multi_add_handle(void* multi, void* easy) noexcept
{
    return curl_multi_add_handle(static_cast<CURLM*>(multi), static_cast<CURL*>(easy));
}

int
curl_engine::multi_remove_handle(void* multi, void* easy) noexcept
{
    return curl_multi_remove_handle(static_cast<CURLM*>(multi), static_cast<CURL*>(easy));
}

int
curl_engine::multi_socket_action(void* multi, curl_socket_t s, int ev_bitmask, int* running) noexcept
{
    return curl_multi_socket_action(static_cast<CURLM*>(multi), s, ev_bitmask, running);
}

int
curl_engine::multi_assign(void* multi, curl_socket_t s, void* socketp) noexcept
{
    return curl_multi_assign(static_cast<CURLM*>(multi), s, socketp);
}

int
curl_engine::multi_setopt_long(void* multi, int id, long val) noexcept
{
    return curl_multi_setopt(static_cast<CURLM*>(multi), static_cast<CURLMoption>(id), val);
}

int
curl_engine::multi_setopt_ptr(void* multi, int id, const void* val) noexcept
{
    return curl_multi_setopt(static_cast<CURLM*>(multi), static_cast<CURLMoption>(id), val);
}

int
curl_engine::multi_setopt_function(void* multi, int id, const callback_bridge::trampoline& fn) noexcept
{
    using S = callback_bridge::signature;

    auto* hdl{ static_cast<CURLM*>(multi) };
    auto  opt{ static_cast<CURLMoption>(id) };

    switch (fn.sig)
    {
        case S::timer: return curl_multi_setopt(hdl, opt, reinterpret_cast<curl_multi_timer_callback>(fn.fn));
        case S::socket: return curl_multi_setopt(hdl, opt, reinterpret_cast<curl_socket_callback>(fn.fn));
        default: break;
    }
    return CURLM_BAD_FUNCTION_ARGUMENT;
}

const CURLMsg*
curl_engine::multi_info_read(void* multi, int* msgs_in_queue) noexcept
{
    return curl_multi_info_read(static_cast<CURLM*>(multi), msgs_in_queue);
}

std::string
curl_engine::multi_strerror(int code) const
{
    return curl_multi_strerror(static_cast<CURLMcode>(code));
}

std::string
curl_engine::version() const
{
    return curl_version();
}

} // namespace impcurl
