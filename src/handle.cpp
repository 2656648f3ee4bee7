/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/error.hpp>
#include <impcurl/handle.hpp>
#include <impcurl/logger.hpp>
#include <impcurl/mhandle.hpp>

#include <curl/curl.h>

#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace impcurl
{
namespace
{
/**
 * @brief callback_slot - What a function option expects
 */
struct callback_slot
{
    int                        data; /*!< The option carrying the user pointer of the function */
    callback_bridge::signature sig;  /*!< The C prototype of the function */
};

const std::map<int, callback_slot>&
callback_slots()
{
    using S = callback_bridge::signature;

    static const std::map<int, callback_slot> _slots{
        { CURLOPT_WRITEFUNCTION, { CURLOPT_WRITEDATA, S::buffer } },
        { CURLOPT_HEADERFUNCTION, { CURLOPT_HEADERDATA, S::buffer } },
        { CURLOPT_READFUNCTION, { CURLOPT_READDATA, S::read } },
        { CURLOPT_XFERINFOFUNCTION, { CURLOPT_XFERINFODATA, S::progress } },
        { CURLOPT_DEBUGFUNCTION, { CURLOPT_DEBUGDATA, S::debug } }
    };
    return _slots;
}

constexpr int
option_type(int id) noexcept
{
    return (id / 10000) * 10000;
}

std::string_view
trim(std::string_view str) noexcept
{
    constexpr std::string_view _blanks{ " \t\r\n" };

    const auto first{ str.find_first_not_of(_blanks) };
    if (std::string_view::npos == first) return {};
    return str.substr(first, str.find_last_not_of(_blanks) - first + 1);
}

} // namespace

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief handle - Create a transfer
 * @param eng The engine performing the native calls
 *
 * @throw init_error if the native session could not be allocated
 */
handle::handle(engine& eng)
  : engine__{ eng }
  , curl_handle__{ eng.easy_init() }
{
    init();
}

handle::handle(engine& eng, void* raw)
  : engine__{ eng }
  , curl_handle__{ raw }
{
    init();
}

/**
 * @brief destructor
 * Performs RAII cleaning (\see handle::close)
 *
 * @note You should avoid (as much as possible) to destroy handles.
 * Reusability of handlers is the key for high performances. :)
 */
handle::~handle() noexcept
{
    close();
}

void
handle::init()
{
    if (nullptr == curl_handle__) throw init_error("unable to create a transfer session", CURLE_FAILED_INIT);

    try
    {
        set_opt_ptr(CURLOPT_PRIVATE, this);
        set_opt_long(CURLOPT_NOSIGNAL, 1L); // multi-threaded applications
        install_default_callbacks();
    }
    catch (const error&)
    {
        engine__.easy_cleanup(std::exchange(curl_handle__, nullptr));
        release_resources();
        throw;
    }
}

/**
 * @brief install_default_callbacks - Feed the response accumulators
 *
 * Header lines are stored without their line terminator, and the empty line closing each header block is skipped.
 */
void
handle::install_default_callbacks()
{
    set_opt_callback(CURLOPT_WRITEFUNCTION, callback_bridge::TCbBuffer{ [this](const char* ptr, size_t sz) -> size_t {
                         body__.append(ptr, sz);
                         return sz;
                     } });

    set_opt_callback(CURLOPT_HEADERFUNCTION, callback_bridge::TCbBuffer{ [this](const char* ptr, size_t sz) -> size_t {
                         if (auto line{ trim(std::string_view{ ptr, sz }) }; !line.empty())
                             headers__.emplace_back(line);
                         return sz;
                     } });
}

/**
 * @brief release_resources - Forget every option value retained for the native session
 *
 * @warning The native session must not use them anymore (i.e. it has been reset or cleaned up)
 */
void
handle::release_resources() noexcept
{
    for (const auto& [opt, id] : callbacks__)
        callback_bridge::release(id);

    callbacks__.clear();
    lists__.clear();
    strings__.clear();
    buffers__.clear();
}

/**
 * @brief duplicate - Perform a copy of the transfer setup
 *
 * Allows to avoid repeating series of set_opt()...
 * Strings, lists and buffers are copied. Callbacks are NOT: the copy accumulates its own response.
 * @return A new handle, sharing the engine of this one
 */
std::unique_ptr<handle>
handle::duplicate() const
{
    if (is_closed()) throw init_error("unable to duplicate a closed transfer", CURLE_FAILED_INIT);

    std::unique_ptr<handle> ret{ new handle(engine__, engine__.easy_duphandle(curl_handle__)) };

    // The native copy still points to our own bridges
    for (const auto& [opt, id] : callbacks__)
    {
        if (CURLOPT_WRITEFUNCTION == opt || CURLOPT_HEADERFUNCTION == opt) continue;

        const auto& slot{ callback_slots().at(opt) };
        if (auto rc{ engine__.easy_setopt_function(ret->curl_handle__, opt, { slot.sig, nullptr, nullptr }) };
            CURLE_OK != rc)
            ret->throw_option_error(opt, engine__.easy_strerror(rc), rc);
        if (auto rc{ engine__.easy_setopt_ptr(ret->curl_handle__, slot.data, nullptr) }; CURLE_OK != rc)
            ret->throw_option_error(slot.data, engine__.easy_strerror(rc), rc);
    }

    for (const auto& [opt, l] : lists__)
        ret->set_opt_list(opt, l.to_vector());

    for (const auto& [opt, str] : strings__)
        ret->set_opt_string(opt, str);

    for (const auto& [opt, buf] : buffers__)
        ret->set_opt_bytes(opt, buf);

    return ret;
}

//---------------------------------------------------------------------------------------------------------------------
// OPTIONS
// \see https://curl.se/libcurl/c/curl_easy_setopt.html
//---------------------------------------------------------------------------------------------------------------------

void
handle::throw_option_error(int id, const std::string& what, int code) const
{
    throw option_error(engine__.option_name(id), what, code);
}

/**
 * @brief set_opt_long - Set an option of type long (or curl_off_t)
 */
void
handle::set_opt_long(int id, long val)
{
    int ret{ CURLE_OK };

    switch (option_type(id))
    {
        case CURLOPTTYPE_LONG: ret = engine__.easy_setopt_long(curl_handle__, id, val); break;
        case CURLOPTTYPE_OFF_T: ret = engine__.easy_setopt_offset(curl_handle__, id, val); break;
        default: throw_option_error(id, "not a numeric option", CURLE_BAD_FUNCTION_ARGUMENT);
    }

    if (CURLE_OK != ret) throw_option_error(id, engine__.easy_strerror(ret), ret);
}

/**
 * @brief set_opt_string - Set an option of type string
 *
 * The string is retained until the option is set again, the handle is reset or closed.
 */
void
handle::set_opt_string(int id, std::string val)
{
    if (CURLOPTTYPE_STRINGPOINT != option_type(id))
        throw_option_error(id, "not a string option", CURLE_BAD_FUNCTION_ARGUMENT);

    // The only string option libcurl does not copy
    if (CURLOPT_POSTFIELDS == id) return set_opt_bytes(id, bytes(std::cbegin(val), std::cend(val)));

    if (auto ret{ engine__.easy_setopt_string(curl_handle__, id, val.c_str()) }; CURLE_OK != ret)
        throw_option_error(id, engine__.easy_strerror(ret), ret);

    strings__.insert_or_assign(id, std::move(val));
}

/**
 * @brief set_opt_callback - Register a closure as a transfer callback
 *
 * The matching user pointer option is set as well, and any closure previously registered for this option is released.
 */
void
handle::set_opt_callback(int id, callback_bridge::closure cb)
{
    const auto slot{ callback_slots().find(id) };

    if (std::end(callback_slots()) == slot) throw_option_error(id, "unsupported callback option", CURLE_UNKNOWN_OPTION);
    if (slot->second.sig != callback_bridge::signature_of(cb))
        throw_option_error(id, "callback does not match the option prototype", CURLE_BAD_FUNCTION_ARGUMENT);

    const auto reg{ callback_bridge::acquire(std::move(cb)) };

    auto ret{ engine__.easy_setopt_function(curl_handle__, id, reg.native) };
    if (CURLE_OK == ret) ret = engine__.easy_setopt_ptr(curl_handle__, slot->second.data, reg.native.userdata);
    if (CURLE_OK == ret && CURLOPT_XFERINFOFUNCTION == id)
        ret = engine__.easy_setopt_long(curl_handle__, CURLOPT_NOPROGRESS, 0L);

    if (CURLE_OK != ret)
    {
        callback_bridge::release(reg.id);
        throw_option_error(id, engine__.easy_strerror(ret), ret);
    }

    if (auto it{ callbacks__.find(id) }; std::end(callbacks__) != it)
        callback_bridge::release(std::exchange(it->second, reg.id));
    else
        callbacks__.emplace(id, reg.id);
}

/**
 * @brief set_opt_list - Set an option of type curl_slist
 *
 * The native list is owned by the handle. The list previously set for this option is freed.
 */
void
handle::set_opt_list(int id, const std::vector<std::string>& val)
{
    if (CURLOPTTYPE_SLISTPOINT != option_type(id))
        throw_option_error(id, "not a list option", CURLE_BAD_FUNCTION_ARGUMENT);

    list l{ engine__, val };
    if (auto ret{ engine__.easy_setopt_ptr(curl_handle__, id, l.raw()) }; CURLE_OK != ret)
        throw_option_error(id, engine__.easy_strerror(ret), ret);

    lists__.insert_or_assign(id, std::move(l));
}

/**
 * @brief set_opt_bytes - Set an option pointing to a buffer
 *
 * CURLOPTTYPE_BLOB options get a native copy of the buffer. Otherwise the buffer is retained by the handle.
 * The size of CURLOPT_POSTFIELDS is set as well (CURLOPT_POSTFIELDSIZE_LARGE), so that it may contain zeros.
 */
void
handle::set_opt_bytes(int id, bytes val)
{
    int ret{ CURLE_OK };

    if (CURLOPTTYPE_BLOB == option_type(id))
    {
        curl_blob blob{ val.data(), val.size(), CURL_BLOB_COPY };
        if (ret = engine__.easy_setopt_ptr(curl_handle__, id, &blob); CURLE_OK != ret)
            throw_option_error(id, engine__.easy_strerror(ret), ret);
        return;
    }

    if (CURLOPTTYPE_OBJECTPOINT != option_type(id))
        throw_option_error(id, "not a buffer option", CURLE_BAD_FUNCTION_ARGUMENT);

    if (CURLOPT_POSTFIELDS == id)
    {
        ret = engine__.easy_setopt_offset(curl_handle__, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<int64_t>(val.size()));
        if (CURLE_OK != ret) throw_option_error(CURLOPT_POSTFIELDSIZE_LARGE, engine__.easy_strerror(ret), ret);
    }

    // Moving the vector keeps its storage
    const char* data{ val.empty() ? "" : val.data() };
    if (ret = engine__.easy_setopt_ptr(curl_handle__, id, data); CURLE_OK != ret)
        throw_option_error(id, engine__.easy_strerror(ret), ret);

    buffers__.insert_or_assign(id, std::move(val));
}

void
handle::set_opt_ptr(int id, void* val)
{
    if (CURLOPTTYPE_OBJECTPOINT != option_type(id))
        throw_option_error(id, "not a pointer option", CURLE_BAD_FUNCTION_ARGUMENT);

    if (auto ret{ engine__.easy_setopt_ptr(curl_handle__, id, val) }; CURLE_OK != ret)
        throw_option_error(id, engine__.easy_strerror(ret), ret);
}

/**
 * @brief set_opt - Set an option modifying the behaviour of the transfer
 * @param id The identifier of the option to set (CURLOPT_*)
 * @param val The value to set the option to (\see option_value)
 *
 * @throw option_error if the value does not fit the option, if the native layer refuses it, or if the handle is
 * currently owned by a multi session
 * @see https://curl.se/libcurl/c/curl_easy_setopt.html
 */
void
handle::set_opt(int id, option_value val)
{
    if (is_closed()) throw_option_error(id, "the transfer is closed", CURLE_FAILED_INIT);
    if (is_registered()) throw_option_error(id, "the transfer is owned by a multi session", CURLE_FAILED_INIT);

    std::visit(
      [this, id](auto&& v) {
          using T = std::decay_t<decltype(v)>;

          if constexpr (std::is_same_v<T, long>)
              set_opt_long(id, v);
          else if constexpr (std::is_same_v<T, bool>)
              set_opt_long(id, v ? 1L : 0L);
          else if constexpr (std::is_same_v<T, std::string>)
              set_opt_string(id, std::move(v));
          else if constexpr (std::is_same_v<T, callback_bridge::closure>)
              set_opt_callback(id, std::move(v));
          else if constexpr (std::is_same_v<T, std::vector<std::string>>)
              set_opt_list(id, v);
          else if constexpr (std::is_same_v<T, bytes>)
              set_opt_bytes(id, std::move(v));
          else
              set_opt_ptr(id, v);
      },
      std::move(val));
}

/**
 * @brief set_headers - Set the request headers (CURLOPT_HTTPHEADER)
 * @param headers The name/value pairs, in the order they must be sent
 *
 * @note An empty value sends the header without value (curl "Name;" syntax)
 */
void
handle::set_headers(const THeaders& headers)
{
    std::vector<std::string> lines;

    lines.reserve(std::size(headers));
    for (const auto& [name, value] : headers)
        lines.emplace_back(value.empty() ? name + ";" : name + ": " + value);

    set_opt(CURLOPT_HTTPHEADER, option_value{ std::move(lines) });
}

//---------------------------------------------------------------------------------------------------------------------
// CALLBACKS
// \see https://everything.curl.dev/libcurl/callbacks
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief set_cb_write - set callback for writting received data
 * @param cb The callback called everytime a chunk of data has been received and needs to be processed (save).
 *
 * @warning The received data is not accumulated anymore (\see handle::response_data)
 */
void
handle::set_cb_write(callback_bridge::TCbBuffer cb)
{
    set_opt(CURLOPT_WRITEFUNCTION,
            callback_bridge::closure{ callback_bridge::TCbBuffer{ [this, cb{ std::move(cb) }](const char* ptr, size_t sz) {
                auto ret{ cb(ptr, sz) };

                // This is a magic return code for the write callback that, when returned, will signal libcurl to
                // pause receiving on the current transfer.
                if (CURL_WRITEFUNC_PAUSE == ret) flags__ |= CURLPAUSE_RECV;
                return ret;
            } } });
}

/**
 * @brief set_cb_header - Set the callback that receives header data
 *
 * @warning The received header lines are not accumulated anymore (\see handle::response_headers)
 */
void
handle::set_cb_header(callback_bridge::TCbBuffer cb)
{
    set_opt(CURLOPT_HEADERFUNCTION, callback_bridge::closure{ std::move(cb) });
}

/**
 * @brief set_cb_read - Set the read callback for data uploads
 * @param cb The callback called everytime the session needs to read data in order to send it to the peer.
 * e.g. In case of upload or POST requests.
 */
void
handle::set_cb_read(callback_bridge::TCbRead cb)
{
    set_opt(CURLOPT_READFUNCTION,
            callback_bridge::closure{ callback_bridge::TCbRead{ [this, cb{ std::move(cb) }](char* buffer, size_t sz) {
                auto ret{ cb(buffer, sz) };

                if (CURL_READFUNC_PAUSE == ret) flags__ |= CURLPAUSE_SEND;
                return ret;
            } } });
}

/**
 * @brief set_cb_progress - Set the progress meter callback
 * @param cb Called with (dltotal, dlnow, ultotal, ulnow). A non-zero return aborts the transfer.
 */
void
handle::set_cb_progress(callback_bridge::TCbProgress cb)
{
    set_opt(CURLOPT_XFERINFOFUNCTION, callback_bridge::closure{ std::move(cb) });
}

/**
 * @brief set_cb_debug - Set the debug callback
 * @param cb Called with the curl_infotype, the data and its size. It must return 0.
 *
 * @note It is only called once CURLOPT_VERBOSE is set
 */
void
handle::set_cb_debug(callback_bridge::TCbDebug cb)
{
    set_opt(CURLOPT_DEBUGFUNCTION, callback_bridge::closure{ std::move(cb) });
}

//---------------------------------------------------------------------------------------------------------------------
// INFORMATIONS
// Every getter gives the zero value of its type when the information is not available.
// \see https://curl.se/libcurl/c/curl_easy_getinfo.html
//---------------------------------------------------------------------------------------------------------------------

std::string
handle::get_info_string(int id) const noexcept
{
    const char* val{ nullptr };

    if (is_closed() || CURLINFO_STRING != (id & CURLINFO_TYPEMASK)) return {};
    if (CURLE_OK != engine__.easy_getinfo_string(curl_handle__, id, val) || nullptr == val) return {};
    return val;
}

long
handle::get_info_long(int id) const noexcept
{
    long val{ 0 };

    if (is_closed() || CURLINFO_LONG != (id & CURLINFO_TYPEMASK)) return 0;
    return (CURLE_OK == engine__.easy_getinfo_long(curl_handle__, id, val)) ? val : 0;
}

double
handle::get_info_double(int id) const noexcept
{
    double val{ 0. };

    if (is_closed() || CURLINFO_DOUBLE != (id & CURLINFO_TYPEMASK)) return 0.;
    return (CURLE_OK == engine__.easy_getinfo_double(curl_handle__, id, val)) ? val : 0.;
}

long long
handle::get_info_offset(int id) const noexcept
{
    int64_t val{ 0 };

    if (is_closed() || CURLINFO_OFF_T != (id & CURLINFO_TYPEMASK)) return 0;
    return (CURLE_OK == engine__.easy_getinfo_offset(curl_handle__, id, val)) ? val : 0;
}

/**
 * @brief get_info_list - Get an information of type curl_slist
 * @param id CURLINFO_SSL_ENGINES or CURLINFO_COOKIELIST
 * @return The strings of the list, which is freed
 */
std::vector<std::string>
handle::get_info_list(int id) const
{
    std::vector<std::string> ret;
    void*                    raw{ nullptr };

    if (is_closed() || (CURLINFO_SSL_ENGINES != id && CURLINFO_COOKIELIST != id)) return ret;
    if (CURLE_OK != engine__.easy_getinfo_ptr(curl_handle__, id, raw)) return ret;

    for (auto* n{ static_cast<curl_slist*>(raw) }; nullptr != n; n = n->next)
        ret.emplace_back(n->data);
    engine__.slist_free_all(static_cast<curl_slist*>(raw));

    return ret;
}

/**
 * @brief get_info - retrieve an information from the handle
 * @param id the identifier of the info to get (\see CURL::CURLINFO_ enumerate)
 * @return The value, its type being selected by the type embedded in \a id (\see info_value)
 *
 * @note CURLINFO_SOCKET informations default to CURL_SOCKET_BAD
 * @see https://curl.se/libcurl/c/curl_easy_getinfo.html
 */
info_value
handle::get_info(int id) const noexcept
{
    switch (id & CURLINFO_TYPEMASK)
    {
        case CURLINFO_STRING: return info_value{ get_info_string(id) };
        case CURLINFO_LONG: return info_value{ get_info_long(id) };
        case CURLINFO_DOUBLE: return info_value{ get_info_double(id) };
        case CURLINFO_OFF_T: return info_value{ get_info_offset(id) };
        case CURLINFO_SOCKET: {
            curl_socket_t s{ CURL_SOCKET_BAD };
            if (is_closed() || CURLE_OK != engine__.easy_getinfo_socket(curl_handle__, id, s)) s = CURL_SOCKET_BAD;
            return info_value{ static_cast<long>(s) };
        }
        case CURLINFO_PTR: {
            void* p{ nullptr };
            if (is_closed() || CURLE_OK != engine__.easy_getinfo_ptr(curl_handle__, id, p)) p = nullptr;
            return info_value{ p };
        }
        default: break;
    }
    return info_value{};
}

//---------------------------------------------------------------------------------------------------------------------
// OPERATIONS
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief perform - Perform a blocking transfer
 * You should first setup the handle hehaviour with handle::set_opt()
 * @return The native result code (CURLcode), CURLE_FAILED_INIT if the handle is closed or owned by a multi session
 *
 * @note If you want to do many transfers, you are encouraged to use the same handle (connection reusage).
 * @see https://curl.se/libcurl/c/curl_easy_perform.html
 */
int
handle::perform() noexcept
{
    if (is_closed() || is_registered()) return CURLE_FAILED_INIT;

    auto ret{ engine__.easy_perform(curl_handle__) };
    if (CURLE_OK != ret) logger()->debug("transfer {:#x} failed: {}", id(), engine__.easy_strerror(ret));
    return ret;
}

/**
 * @brief impersonate - Make the transfer look like it is done by a given browser
 * @param target The browser name (e.g. "chrome110", "firefox109", "safari15_5")
 * @param default_headers Whether the browser's default headers should be sent as well
 * @return The native result code, CURLE_NOT_BUILT_IN if the library is not linked against libcurl-impersonate
 */
int
handle::impersonate(const std::string& target, bool default_headers) noexcept
{
    if (is_closed() || is_registered()) return CURLE_FAILED_INIT;

    auto ret{ engine__.easy_impersonate(curl_handle__, target.c_str(), default_headers) };
    if (CURLE_OK != ret) logger()->warn("unable to impersonate '{}': {}", target, engine__.easy_strerror(ret));
    return ret;
}

/**
 * @brief reset - Reinitializes all options of a session
 * The handle is removed from its multi session first, if any: its failure continuation (cancelled_error) is called
 * once the handle is reset, and may destroy it.
 * @note It does not change connections, session ID cache, DNS cache, cookies...
 * @see https://curl.se/libcurl/c/curl_easy_reset.html
 */
void
handle::reset()
{
    std::optional<mhandle::completion> cancelled;
    if (nullptr != multi_handler__) cancelled = multi_handler__->cancel(*this);

    if (!is_closed())
    {
        try
        {
            engine__.easy_reset(curl_handle__);
            release_resources();
            clear_response();
            flags__ = 0;

            set_opt_ptr(CURLOPT_PRIVATE, this);
            set_opt_long(CURLOPT_NOSIGNAL, 1L);
            install_default_callbacks();
        }
        catch (const std::exception&)
        {
            if (cancelled) mhandle::complete(*cancelled);
            throw;
        }
    }

    // Last use of this handle
    if (cancelled) mhandle::complete(*cancelled);
}

/**
 * @brief close - Release the native session and everything retained for it
 *
 * The handle is removed from its multi session first, if any: its failure continuation (cancelled_error) is called
 * once everything is released, and may destroy the handle.
 * Calling it on a closed handle does nothing.
 */
void
handle::close() noexcept
{
    std::optional<mhandle::completion> cancelled;
    if (nullptr != multi_handler__) cancelled = multi_handler__->cancel(*this);

    if (!is_closed())
    {
        engine__.easy_cleanup(std::exchange(curl_handle__, nullptr));
        release_resources();
    }

    // Last use of this handle
    if (cancelled) mhandle::complete(*cancelled);
}

void
handle::clear_response() noexcept
{
    body__.clear();
    headers__.clear();
}

//---------------------------------------------------------------------------------------------------------------------
// UN/PAUSE TRANSFER
// \see https://curl.se/libcurl/c/curl_easy_pause.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief pause - Pause the transfer in one or both directions
 *
 * @param bitmask CURL pause mask (CURLPAUSE_RECV, CURLPAUSE_SEND, CURLPAUSE_ALL, CURLPAUSE_CONT)
 * @return true if the command was successfull, false otherwise
 */
bool
handle::pause(int bitmask) noexcept
{
    if (is_closed()) return false;

    const auto prev{ flags__ };
    flags__ |= (bitmask & CURLPAUSE_ALL);
    return (flags__ == prev) || (CURLE_OK == engine__.easy_pause(curl_handle__, flags__ & CURLPAUSE_ALL));
}

/**
 * @brief unpause - Unpause the transfer in one or both directions
 *
 * @param bitmask CURL pause mask (CURLPAUSE_RECV, CURLPAUSE_SEND, CURLPAUSE_ALL, CURLPAUSE_CONT)
 * @return true if the command was successfull, false otherwise
 */
bool
handle::unpause(int bitmask) noexcept
{
    if (is_closed()) return false;

    const auto prev{ flags__ };
    flags__ &= ~(bitmask & CURLPAUSE_ALL);
    return (flags__ == prev) || (CURLE_OK == engine__.easy_pause(curl_handle__, flags__ & CURLPAUSE_ALL));
}

bool
handle::is_paused(int bitmask) const noexcept
{
    return (0 != (flags__ & bitmask));
}

/**
 * @brief strerror - Gives the human readable string of a native result code (CURLcode)
 */
std::string
handle::strerror(int code)
{
    return engine::curl().easy_strerror(code);
}

} // namespace impcurl
