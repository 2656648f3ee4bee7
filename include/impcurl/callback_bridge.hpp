/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file callback_bridge.hpp
 * @brief Bridge between C++ closures and the C function pointers libcurl calls
 * \see https://everything.curl.dev/libcurl/callbacks for more informations
 *
 * libcurl only knows about plain function pointers and an opaque user pointer.
 * The bridge keeps every closure in a process-wide table, indexed by a monotonically increasing id, and hands out a
 * \a trampoline: a C function matching the libcurl signature, and the user pointer to register alongside it (it
 * encodes the id).
 * The closure stays alive until callback_bridge::release() is called with its id, whatever happens to the C++ object
 * that registered it.
 *
 * @warning A trampoline never lets an exception escape to libcurl. It logs it and returns the value that tells libcurl
 * to abort (or ignore) the current operation.
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_CALLBACK_BRIDGE_H
#define INCLUDE_IMPCURL_CALLBACK_BRIDGE_H

#include <cstddef> // size_t
#include <cstdint> // int64_t, uint64_t
#include <functional>
#include <variant>

#include <curl/curl.h>

namespace impcurl
{
/*********************************************************************************************************************/
class callback_bridge
{
public:
    using id_type = std::uint64_t;

    using TCbBuffer   = std::function<size_t(const char*, size_t)>; /*!< write and header callbacks */
    using TCbRead     = std::function<size_t(char*, size_t)>;
    using TCbProgress = std::function<int(int64_t, int64_t, int64_t, int64_t)>; // curl_off_t <- int64_t
    using TCbDebug    = std::function<int(int, const char*, size_t)>;
    using TCbTimer    = std::function<int(long)>;
    using TCbSocket   = std::function<int(curl_socket_t, int, void*)>;

    using closure = std::variant<TCbBuffer, TCbRead, TCbProgress, TCbDebug, TCbTimer, TCbSocket>;

    /**
     * @brief signature describes the C prototype of a trampoline
     */
    enum class signature
    {
        buffer,   /*!< size_t(char*, size_t, size_t, void*) - CURLOPT_WRITEFUNCTION, CURLOPT_HEADERFUNCTION */
        read,     /*!< size_t(char*, size_t, size_t, void*) - CURLOPT_READFUNCTION */
        progress, /*!< int(void*, curl_off_t, curl_off_t, curl_off_t, curl_off_t) - CURLOPT_XFERINFOFUNCTION */
        debug,    /*!< int(CURL*, curl_infotype, char*, size_t, void*) - CURLOPT_DEBUGFUNCTION */
        timer,    /*!< int(CURLM*, long, void*) - CURLMOPT_TIMERFUNCTION */
        socket    /*!< int(CURL*, curl_socket_t, int, void*, void*) - CURLMOPT_SOCKETFUNCTION */
    };

    using native_fn = void (*)(void); /*!< Type-erased C function pointer, cast back according to the signature */

    struct trampoline
    {
        signature sig;                 /*!< The C prototype of fn */
        native_fn fn{ nullptr };       /*!< The function to register (e.g. CURLOPT_WRITEFUNCTION) */
        void*     userdata{ nullptr }; /*!< The pointer to register with it (e.g. CURLOPT_WRITEDATA) */
    };

    struct registration
    {
        id_type    id{ 0 };
        trampoline native{};
    };

    callback_bridge() = delete;

    static registration acquire(closure cb);
    static void         release(id_type id) noexcept;
    static size_t       size() noexcept;

    static signature signature_of(const closure& cb) noexcept;
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_CALLBACK_BRIDGE_H
