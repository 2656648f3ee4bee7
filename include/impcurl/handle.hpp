/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file handle.hpp
 * @brief Wrapper around curl easy handle
 * \see https://everything.curl.dev/libcurl/easyhandle for more informations
 *
 * Basically, this is a handle to a transfer.
 * It provides functionalities such as :
 * <ul>
 * <li> Control over how the upcoming transfer will be performed (\see handle::set_opt) </li>
 * <li> Means to register custom callbacks (\see https://everything.curl.dev/libcurl/callbacks) </li>
 * <li> Built-in accumulation of the response body and header lines </li>
 * <li> Browser impersonation, when linked against libcurl-impersonate </li>
 * <li> Reusability and easy duplication options </li>
 * </ul>
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_HANDLE_H
#define INCLUDE_IMPCURL_HANDLE_H

#include <cstddef> // size_t
#include <cstdint> // uintptr_t
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "callback_bridge.hpp"
#include "engine.hpp"
#include "list.hpp"

namespace impcurl
{
class mhandle;

using bytes = std::vector<char>;

/**
 * @brief option_value - The value of a transfer (or session) option
 *
 * <ul>
 * <li> long : CURLOPTTYPE_LONG and CURLOPTTYPE_OFF_T options </li>
 * <li> bool : CURLOPTTYPE_LONG options, as 0/1 </li>
 * <li> std::string : string options (the string is retained by the handle) </li>
 * <li> callback_bridge::closure : CURLOPTTYPE_FUNCTIONPOINT options (the matching *DATA option is set as well) </li>
 * <li> std::vector<std::string> : curl_slist options (e.g. CURLOPT_HTTPHEADER) </li>
 * <li> bytes : a buffer retained by the handle (e.g. CURLOPT_POSTFIELDS) or a CURLOPTTYPE_BLOB option </li>
 * <li> void* : any other pointer option </li>
 * </ul>
 */
using option_value =
  std::variant<long, bool, std::string, callback_bridge::closure, std::vector<std::string>, bytes, void*>;

/**
 * @brief info_value - The value of a transfer information (\see handle::get_info)
 * The alternative depends on the type embedded in the information id: std::string (CURLINFO_STRING), long
 * (CURLINFO_LONG and CURLINFO_SOCKET), double (CURLINFO_DOUBLE), long long (CURLINFO_OFF_T), void* (CURLINFO_PTR).
 * std::monostate is only used for an unknown type.
 */
using info_value = std::variant<std::monostate, std::string, long, double, long long, void*>;

/*********************************************************************************************************************/
class handle
{
    friend class mhandle;

public:
    using THeaders = std::vector<std::pair<std::string, std::string>>;

private:
    engine&  engine__;
    mhandle* multi_handler__{ nullptr };
    void*    curl_handle__{ nullptr }; /*< CURL easy handle - you do NOT want to mess with this */
    int      flags__{ 0 };

    std::map<int, list>                     lists__{};     /*!< Native lists, by option */
    std::map<int, std::string>              strings__{};   /*!< String options, by option */
    std::map<int, bytes>                    buffers__{};   /*!< Buffer options, by option */
    std::map<int, callback_bridge::id_type> callbacks__{}; /*!< Callback bridges, by function option */

    std::string              body__{};
    std::vector<std::string> headers__{};

    handle(engine& eng, void* raw);

    handle(const handle&) = delete;
    handle& operator=(const handle&) = delete;
    handle(handle&&)                 = delete;
    handle& operator=(handle&&) = delete;

    void init();
    void release_resources() noexcept;
    void install_default_callbacks();

protected:
    void set_opt_long(int id, long val);
    void set_opt_string(int id, std::string val);
    void set_opt_callback(int id, callback_bridge::closure cb);
    void set_opt_list(int id, const std::vector<std::string>& val);
    void set_opt_bytes(int id, bytes val);
    void set_opt_ptr(int id, void* val);

    [[noreturn]] void throw_option_error(int id, const std::string& what, int code) const;

public:
    explicit handle(engine& eng = engine::curl());
    ~handle() noexcept;

    std::unique_ptr<handle> duplicate() const;

    void*     raw() const noexcept { return curl_handle__; }
    uintptr_t id() const noexcept { return reinterpret_cast<uintptr_t>(curl_handle__); }
    engine&   get_engine() const noexcept { return engine__; }
    bool      is_registered() const noexcept { return nullptr != multi_handler__; }
    bool      is_closed() const noexcept { return nullptr == curl_handle__; }

    // Options
    void set_opt(int id, option_value val);
    void set_opt(int id, const char* val) { set_opt(id, option_value{ std::string{ val } }); }
    void set_headers(const THeaders& headers);

    void set_cb_write(callback_bridge::TCbBuffer cb);
    void set_cb_header(callback_bridge::TCbBuffer cb);
    void set_cb_read(callback_bridge::TCbRead cb);
    void set_cb_progress(callback_bridge::TCbProgress cb);
    void set_cb_debug(callback_bridge::TCbDebug cb);

    // Informations
    info_value               get_info(int id) const noexcept;
    std::string              get_info_string(int id) const noexcept;
    long                     get_info_long(int id) const noexcept;
    double                   get_info_double(int id) const noexcept;
    long long                get_info_offset(int id) const noexcept;
    std::vector<std::string> get_info_list(int id) const;

    // Operations
    int  perform() noexcept;
    int  impersonate(const std::string& target, bool default_headers = true) noexcept;
    void reset();
    void close() noexcept;

    bool pause(int bitmask) noexcept;
    bool unpause(int bitmask) noexcept;
    bool is_paused(int bitmask) const noexcept;

    // Response accumulators
    const std::string&              response_data() const noexcept { return body__; }
    const std::vector<std::string>& response_headers() const noexcept { return headers__; }
    void                            clear_response() noexcept;

    static std::string strerror(int code);
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_HANDLE_H
