/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/callback_bridge.hpp>
#include <impcurl/logger.hpp>

#include <map>
#include <memory>
#include <mutex>

namespace impcurl
{
namespace
{
using TClosurePtr = std::shared_ptr<const callback_bridge::closure>;

std::mutex&
table_mutex()
{
    static std::mutex _mutex;
    return _mutex;
}

std::map<callback_bridge::id_type, TClosurePtr>&
table()
{
    static std::map<callback_bridge::id_type, TClosurePtr> _table;
    return _table;
}

callback_bridge::id_type
next_id() noexcept
{
    static callback_bridge::id_type _next{ 0 };
    return ++_next; // called with table_mutex() held
}

void*
id2userdata(callback_bridge::id_type id) noexcept
{
    return reinterpret_cast<void*>(static_cast<std::uintptr_t>(id));
}

/**
 * @brief lookup - Find the closure registered under the id encoded in a libcurl user pointer
 * @return The closure, or nullptr if it has been released
 *
 * The closure is returned as a shared pointer so that a concurrent release does not destroy it while it runs.
 */
TClosurePtr
lookup(void* userdata) noexcept
{
    const auto                  id{ static_cast<callback_bridge::id_type>(reinterpret_cast<std::uintptr_t>(userdata)) };
    std::lock_guard<std::mutex> lock{ table_mutex() };

    if (auto it{ table().find(id) }; std::end(table()) != it) return it->second;
    return nullptr;
}

/**
 * @brief invoke - Run a closure, never letting an exception reach libcurl
 *
 * @param userdata The user pointer libcurl gave back to the trampoline
 * @param sentinel The value to return if the closure is gone or throws
 * @param fn How to call the closure
 */
template<class TCb, class TRet, class TFn>
TRet
invoke(void* userdata, TRet sentinel, TFn&& fn) noexcept
{
    auto cb{ lookup(userdata) };
    if (nullptr == cb) return sentinel;

    const auto* target{ std::get_if<TCb>(cb.get()) };
    if (nullptr == target || !(*target)) return sentinel;

    try
    {
        return fn(*target);
    }
    catch (const std::exception& e)
    {
        logger()->error("callback #{} threw: {}", reinterpret_cast<std::uintptr_t>(userdata), e.what());
    }
    catch (...)
    {
        logger()->error("callback #{} threw a non-standard exception", reinterpret_cast<std::uintptr_t>(userdata));
    }
    return sentinel;
}

//---------------------------------------------------------------------------------------------------------------------
// TRAMPOLINES
// The C functions actually registered in libcurl
//---------------------------------------------------------------------------------------------------------------------

size_t
buffer_trampoline(char* ptr, size_t size, size_t nmemb, void* userdata)
{
    return invoke<callback_bridge::TCbBuffer>(
      userdata, size_t{ 0 }, [&](const callback_bridge::TCbBuffer& cb) { return cb(ptr, size * nmemb); });
}

size_t
read_trampoline(char* buffer, size_t size, size_t nitems, void* userdata)
{
    return invoke<callback_bridge::TCbRead>(userdata,
                                            static_cast<size_t>(CURL_READFUNC_ABORT),
                                            [&](const callback_bridge::TCbRead& cb) { return cb(buffer, size * nitems); });
}

int
progress_trampoline(void* clientp, curl_off_t dltotal, curl_off_t dlnow, curl_off_t ultotal, curl_off_t ulnow)
{
    // Any non-zero value aborts the transfer
    return invoke<callback_bridge::TCbProgress>(clientp, 1, [&](const callback_bridge::TCbProgress& cb) {
        return cb(dltotal, dlnow, ultotal, ulnow);
    });
}

int
debug_trampoline(CURL* /*hndl*/, curl_infotype type, char* data, size_t size, void* clientp)
{
    return invoke<callback_bridge::TCbDebug>(
      clientp, 0, [&](const callback_bridge::TCbDebug& cb) { return cb(static_cast<int>(type), data, size); });
}

int
timer_trampoline(CURLM* /*multi*/, long timeout_ms, void* userp)
{
    return invoke<callback_bridge::TCbTimer>(
      userp, -1, [&](const callback_bridge::TCbTimer& cb) { return cb(timeout_ms); });
}

int
socket_trampoline(CURL* /*easy*/, curl_socket_t s, int what, void* userp, void* socketp)
{
    return invoke<callback_bridge::TCbSocket>(
      userp, -1, [&](const callback_bridge::TCbSocket& cb) { return cb(s, what, socketp); });
}

callback_bridge::native_fn
trampoline_of(callback_bridge::signature sig) noexcept
{
    using S = callback_bridge::signature;
    using F = callback_bridge::native_fn;

    switch (sig)
    {
        case S::buffer: return reinterpret_cast<F>(&buffer_trampoline);
        case S::read: return reinterpret_cast<F>(&read_trampoline);
        case S::progress: return reinterpret_cast<F>(&progress_trampoline);
        case S::debug: return reinterpret_cast<F>(&debug_trampoline);
        case S::timer: return reinterpret_cast<F>(&timer_trampoline);
        case S::socket: return reinterpret_cast<F>(&socket_trampoline);
    }
    return nullptr;
}

} // namespace

//---------------------------------------------------------------------------------------------------------------------
// REGISTRATION
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief signature_of - Get the C prototype matching a closure
 */
callback_bridge::signature
callback_bridge::signature_of(const closure& cb) noexcept
{
    static constexpr signature _byIndex[]{ signature::buffer, signature::read,  signature::progress,
                                           signature::debug,  signature::timer, signature::socket };
    return _byIndex[cb.index()];
}

/**
 * @brief acquire - Keep a closure alive and get the trampoline that calls it
 *
 * @param cb The closure
 * @return The id to give back to callback_bridge::release(), and the function/user pointer pair to register in libcurl
 */
callback_bridge::registration
callback_bridge::acquire(closure cb)
{
    const auto   sig{ signature_of(cb) };
    auto         ptr{ std::make_shared<const closure>(std::move(cb)) };
    registration ret;

    {
        std::lock_guard<std::mutex> lock{ table_mutex() };
        ret.id = next_id();
        table().emplace(ret.id, std::move(ptr));
    }

    ret.native = trampoline{ sig, trampoline_of(sig), id2userdata(ret.id) };
    return ret;
}

/**
 * @brief release - Forget a closure
 *
 * Releasing an unknown (or already released) id does nothing.
 * @param id The id returned by callback_bridge::acquire()
 */
void
callback_bridge::release(id_type id) noexcept
{
    TClosurePtr victim;
    {
        std::lock_guard<std::mutex> lock{ table_mutex() };
        if (auto it{ table().find(id) }; std::end(table()) != it)
        {
            victim = std::move(it->second);
            table().erase(it);
        }
    }
    // victim is destroyed here, outside of the lock: the closure may own objects that release other closures
}

/**
 * @brief size - Number of closures currently alive
 */
size_t
callback_bridge::size() noexcept
{
    std::lock_guard<std::mutex> lock{ table_mutex() };
    return table().size();
}

} // namespace impcurl
