/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file engine.hpp
 * @brief The native transfer engine, as seen by impcurl
 * \see https://curl.se/libcurl/c/ for more informations
 *
 * Every libcurl call made by impcurl::handle, impcurl::list and impcurl::mhandle goes through this interface.
 * engine::curl() gives the implementation backed by the libcurl (or libcurl-impersonate) the program is linked
 * against. Another implementation can be injected in the handles and sessions, e.g. to record or script the native
 * calls in tests.
 *
 * The functions mirror the libcurl API: integer codes are CURLcode (easy functions) or CURLMcode (multi functions).
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_ENGINE_H
#define INCLUDE_IMPCURL_ENGINE_H

#include <cstdint>
#include <string>

#include <curl/curl.h>

#include "callback_bridge.hpp"

namespace impcurl
{
/*********************************************************************************************************************/
class engine
{
public:
    virtual ~engine() noexcept = default;

    // Single transfer session (CURL easy handle)
    virtual void* easy_init() noexcept                = 0;
    virtual void  easy_cleanup(void* easy) noexcept   = 0;
    virtual void  easy_reset(void* easy) noexcept     = 0;
    virtual void* easy_duphandle(void* easy) noexcept = 0;

    virtual int easy_setopt_long(void* easy, int id, long val) noexcept                                  = 0;
    virtual int easy_setopt_offset(void* easy, int id, int64_t val) noexcept                             = 0;
    virtual int easy_setopt_string(void* easy, int id, const char* val) noexcept                         = 0;
    virtual int easy_setopt_ptr(void* easy, int id, const void* val) noexcept                            = 0;
    virtual int easy_setopt_function(void* easy, int id, const callback_bridge::trampoline& fn) noexcept = 0;

    virtual int easy_perform(void* easy) noexcept            = 0;
    virtual int easy_pause(void* easy, int bitmask) noexcept = 0;

    virtual int easy_getinfo_string(void* easy, int id, const char*& val) noexcept = 0;
    virtual int easy_getinfo_long(void* easy, int id, long& val) noexcept          = 0;
    virtual int easy_getinfo_double(void* easy, int id, double& val) noexcept      = 0;
    virtual int easy_getinfo_offset(void* easy, int id, int64_t& val) noexcept    = 0;
    virtual int easy_getinfo_ptr(void* easy, int id, void*& val) noexcept          = 0;
    virtual int easy_getinfo_socket(void* easy, int id, curl_socket_t& val) noexcept = 0;

    virtual int         easy_impersonate(void* easy, const char* target, bool default_headers) noexcept = 0;
    virtual std::string easy_strerror(int code) const                                                  = 0;
    virtual std::string option_name(int id) const                                                      = 0;

    // Native linked lists (struct curl_slist)
    virtual curl_slist* slist_append(curl_slist* l, const char* str) noexcept = 0;
    virtual void        slist_free_all(curl_slist* l) noexcept                = 0;

    // Multi transfer engine (CURLM multi handle)
    virtual void* multi_init() noexcept            = 0;
    virtual int   multi_cleanup(void* multi) noexcept = 0;

    virtual int multi_add_handle(void* multi, void* easy) noexcept    = 0;
    virtual int multi_remove_handle(void* multi, void* easy) noexcept = 0;
    virtual int multi_socket_action(void* multi, curl_socket_t s, int ev_bitmask, int* running) noexcept = 0;
    virtual int multi_assign(void* multi, curl_socket_t s, void* socketp) noexcept                    = 0;

    virtual int multi_setopt_long(void* multi, int id, long val) noexcept                                  = 0;
    virtual int multi_setopt_ptr(void* multi, int id, const void* val) noexcept                            = 0;
    virtual int multi_setopt_function(void* multi, int id, const callback_bridge::trampoline& fn) noexcept = 0;

    virtual const CURLMsg* multi_info_read(void* multi, int* msgs_in_queue) noexcept = 0;
    virtual std::string    multi_strerror(int code) const                            = 0;

    virtual std::string version() const = 0;

    static engine& curl();
};

/*********************************************************************************************************************/
/**
 * @brief curl_engine - The engine calling the libcurl the program is linked against
 *
 * curl_easy_impersonate() only exists in libcurl-impersonate: it is looked up at runtime, so that the library still
 * works (without impersonation) with a stock libcurl.
 */
class curl_engine : public engine
{
private:
    using TImpersonateFn = CURLcode (*)(CURL*, const char*, int);

    TImpersonateFn impersonate__{ nullptr };

public:
    curl_engine();
    ~curl_engine() noexcept override;

    void* easy_init() noexcept override;
    void  easy_cleanup(void* easy) noexcept override;
    void  easy_reset(void* easy) noexcept override;
    void* easy_duphandle(void* easy) noexcept override;

    int easy_setopt_long(void* easy, int id, long val) noexcept override;
    int easy_setopt_offset(void* easy, int id, int64_t val) noexcept override;
    int easy_setopt_string(void* easy, int id, const char* val) noexcept override;
    int easy_setopt_ptr(void* easy, int id, const void* val) noexcept override;
    int easy_setopt_function(void* easy, int id, const callback_bridge::trampoline& fn) noexcept override;

    int easy_perform(void* easy) noexcept override;
    int easy_pause(void* easy, int bitmask) noexcept override;

    int easy_getinfo_string(void* easy, int id, const char*& val) noexcept override;
    int easy_getinfo_long(void* easy, int id, long& val) noexcept override;
    int easy_getinfo_double(void* easy, int id, double& val) noexcept override;
    int easy_getinfo_offset(void* easy, int id, int64_t& val) noexcept override;
    int easy_getinfo_ptr(void* easy, int id, void*& val) noexcept override;
    int easy_getinfo_socket(void* easy, int id, curl_socket_t& val) noexcept override;

    int         easy_impersonate(void* easy, const char* target, bool default_headers) noexcept override;
    std::string easy_strerror(int code) const override;
    std::string option_name(int id) const override;

    curl_slist* slist_append(curl_slist* l, const char* str) noexcept override;
    void        slist_free_all(curl_slist* l) noexcept override;

    void* multi_init() noexcept override;
    int   multi_cleanup(void* multi) noexcept override;

    int multi_add_handle(void* multi, void* easy) noexcept override;
    int multi_remove_handle(void* multi, void* easy) noexcept override;
    int multi_socket_action(void* multi, curl_socket_t s, int ev_bitmask, int* running) noexcept override;
    int multi_assign(void* multi, curl_socket_t s, void* socketp) noexcept override;

    int multi_setopt_long(void* multi, int id, long val) noexcept override;
    int multi_setopt_ptr(void* multi, int id, const void* val) noexcept override;
    int multi_setopt_function(void* multi, int id, const callback_bridge::trampoline& fn) noexcept override;

    const CURLMsg* multi_info_read(void* multi, int* msgs_in_queue) noexcept override;
    std::string    multi_strerror(int code) const override;

    std::string version() const override;
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_ENGINE_H
