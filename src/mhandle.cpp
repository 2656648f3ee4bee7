/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/error.hpp>
#include <impcurl/handle.hpp>
#include <impcurl/logger.hpp>
#include <impcurl/mhandle.hpp>

#include <Loop.h>
#include <curl/curl.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <type_traits>
#include <utility>

using namespace loop;

namespace impcurl
{
namespace
{
using TLock = std::lock_guard<std::recursive_mutex>;

std::string
multi_option_name(int id)
{
    static const std::map<int, std::string> _names{
        { CURLMOPT_SOCKETFUNCTION, "CURLMOPT_SOCKETFUNCTION" },
        { CURLMOPT_SOCKETDATA, "CURLMOPT_SOCKETDATA" },
        { CURLMOPT_PIPELINING, "CURLMOPT_PIPELINING" },
        { CURLMOPT_TIMERFUNCTION, "CURLMOPT_TIMERFUNCTION" },
        { CURLMOPT_TIMERDATA, "CURLMOPT_TIMERDATA" },
        { CURLMOPT_MAXCONNECTS, "CURLMOPT_MAXCONNECTS" },
        { CURLMOPT_MAX_HOST_CONNECTIONS, "CURLMOPT_MAX_HOST_CONNECTIONS" },
        { CURLMOPT_MAX_PIPELINE_LENGTH, "CURLMOPT_MAX_PIPELINE_LENGTH" },
        { CURLMOPT_PIPELINING_SITE_BL, "CURLMOPT_PIPELINING_SITE_BL" },
        { CURLMOPT_PIPELINING_SERVER_BL, "CURLMOPT_PIPELINING_SERVER_BL" },
        { CURLMOPT_MAX_TOTAL_CONNECTIONS, "CURLMOPT_MAX_TOTAL_CONNECTIONS" },
        { CURLMOPT_PUSHFUNCTION, "CURLMOPT_PUSHFUNCTION" },
        { CURLMOPT_PUSHDATA, "CURLMOPT_PUSHDATA" },
        { CURLMOPT_MAX_CONCURRENT_STREAMS, "CURLMOPT_MAX_CONCURRENT_STREAMS" }
    };

    if (auto it{ _names.find(id) }; std::end(_names) != it) return it->second;
    return "CURLMOPT #" + std::to_string(id);
}

constexpr int
option_type(int id) noexcept
{
    return (id / 10000) * 10000;
}

} // namespace

//---------------------------------------------------------------------------------------------------------------------
// CONSTRUCTORS/DESTRUCTOR
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief mhandle - Constructor
 * @param loop The loop that will be used by the session to drive its transfer(s).
 * @param eng The engine performing the native calls
 *
 * @throw init_error if the native multi session could not be created
 * @warning The loop should outlive the session
 * @warning The session must be created in the thread running the loop. Only add_handle() may be called from others.
 */
mhandle::mhandle(loop::Loop& loop, engine& eng)
  : engine__{ eng }
  , loop__{ loop }
  , curl_multi__{ eng.multi_init() }
  , timeout__{ std::make_unique<Loop::Timeout>(loop__) }
  , kick__{ std::make_unique<Loop::Timeout>(loop__) }
{
    if (nullptr == curl_multi__) throw init_error("unable to create the multi transfer engine", CURLM_OUT_OF_MEMORY);

    timeout__->onTimeout([this]() { perform_action(); });
    kick__->onTimeout([this]() { perform_action(); });

    try
    {
        timer_cb__  = install_callback(CURLMOPT_TIMERFUNCTION,
                                      CURLMOPT_TIMERDATA,
                                      callback_bridge::TCbTimer{ [this](long ms) { return on_timer(ms); } });
        socket_cb__ = install_callback(
          CURLMOPT_SOCKETFUNCTION,
          CURLMOPT_SOCKETDATA,
          callback_bridge::TCbSocket{ [this](curl_socket_t s, int what, void* sp) { return on_socket(s, what, sp); } });

        if (wakeup_fd__ = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC); wakeup_fd__ < 0)
            throw init_error(std::string{ "unable to create the wake-up event: " } + std::strerror(errno), errno);

        wakeup__ = std::make_unique<Loop::IO>(wakeup_fd__, loop__);
        wakeup__->onEvent([this](int) { adopt_inbox(); });
        wakeup__->setRequestedEvents(Loop::IO::READ);
    }
    catch (const init_error&)
    {
        close();
        release_wakeup();
        throw;
    }
}

/**
 * @brief ~mhandle - Destructor
 * Every transfer still pending fails with closed_error (\see mhandle::close)
 */
mhandle::~mhandle() noexcept
{
    close();
    release_wakeup();
}

/**
 * @brief release_wakeup - Destroy the IOs, then close the wake-up event they may watch
 */
void
mhandle::release_wakeup() noexcept
{
    retired__.clear();
    wakeup__.reset();
    if (wakeup_fd__ >= 0) ::close(std::exchange(wakeup_fd__, -1));
}

callback_bridge::id_type
mhandle::install_callback(int fn_opt, int data_opt, callback_bridge::closure cb)
{
    const auto reg{ callback_bridge::acquire(std::move(cb)) };

    auto ret{ engine__.multi_setopt_function(curl_multi__, fn_opt, reg.native) };
    if (CURLM_OK == ret) ret = engine__.multi_setopt_ptr(curl_multi__, data_opt, reg.native.userdata);
    if (CURLM_OK != ret)
    {
        callback_bridge::release(reg.id);
        throw init_error(multi_option_name(fn_opt) + ": " + engine__.multi_strerror(ret), ret);
    }
    return reg.id;
}

//---------------------------------------------------------------------------------------------------------------------
// CALLBACKS
// The sessions are event-driven (by miniloop) and need to setup callbacks to miniloop in order to work properly
// Neither of them calls curl back: the actual work is always done by a loop event (\see mhandle::perform_action)
// \see https://curl.se/libcurl/c/libcurl-multi.html
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief on_timer - Called by curl when it wants to be called back after some time
 *
 * @param timeout_ms The delay (0 meaning as soon as possible), or -1 to delete the timer
 * @return 0
 */
int
mhandle::on_timer(long timeout_ms)
{
    // At most one timer: a new request replaces the previous one
    timeout__->cancel();
    if (timeout_ms >= 0) timeout__->set(timeout_ms);

    return 0;
}

/**
 * @brief on_socket - Called by curl when it is interested in socket events
 *
 * @param s The socket of interest
 * @param what The event(s) of interest on the socket (CURL_POLL_*)
 * @param socketp The IO assigned to the socket, if any (\see curl_multi_assign)
 * @return 0, -1 if the socket could not be watched
 */
int
mhandle::on_socket(curl_socket_t s, int what, void* socketp)
{
    Loop::IO* io{ static_cast<Loop::IO*>(socketp) };

    if (CURL_POLL_REMOVE == what)
    {
        if (auto it{ ios__.find(s) }; std::end(ios__) != it)
        {
            // We may be running inside this IO's own event handler
            it->second->setRequestedEvents(0);
            retired__.push_back(std::move(it->second));
            ios__.erase(it);
        }
        return 0;
    }

    if (nullptr == io)
    {
        auto& slot{ ios__[s] };
        if (nullptr == slot)
        {
            slot = std::make_unique<Loop::IO>(s, loop__);
            slot->onEvent([this, io = slot.get()](int evt) {
                int evt_bitmask{ 0 };

                if (evt & Loop::IO::READ) evt_bitmask |= CURL_CSELECT_IN;
                if (evt & Loop::IO::WRITE) evt_bitmask |= CURL_CSELECT_OUT;

                perform_action(io->getFd(), evt_bitmask);
            });
        }
        io = slot.get();

        if (auto ret{ engine__.multi_assign(curl_multi__, s, io) }; CURLM_OK != ret)
            logger()->warn("unable to assign socket {}: {}", s, engine__.multi_strerror(ret));
    }

    short int evts{ 0 };
    switch (what)
    {
        case CURL_POLL_INOUT: evts |= (Loop::IO::READ | Loop::IO::WRITE); break;
        case CURL_POLL_IN: evts |= Loop::IO::READ; break;
        case CURL_POLL_OUT: evts |= Loop::IO::WRITE; break;
        default: break;
    }

    io->setFd(s);
    io->setRequestedEvents(evts);

    return 0;
}

/**
 * @brief set_cb_error - Set error callback
 *
 * @param cb The callback used when driving the multi-session fails (with the CURLMcode)
 */
void
mhandle::set_cb_error(TCbError cb) noexcept
{
    TLock lock{ mutex__ };
    cb_error__ = std::move(cb);
}

//---------------------------------------------------------------------------------------------------------------------
// DRIVING
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief perform_action - Let curl advance the transfers
 *
 * It is called by the loop, either when a socket is ready or when a timer expires.
 * Completed transfers are then reported to their owners.
 * @param s The ready socket, or CURL_SOCKET_TIMEOUT
 * @param ev_bitmask The events of the socket (CURL_CSELECT_IN, CURL_CSELECT_OUT)
 *
 * @note Does nothing once the session is closed
 * @see https://curl.se/libcurl/c/curl_multi_socket_action.html
 */
void
mhandle::perform_action(curl_socket_t s, int ev_bitmask)
{
    std::vector<completion> done;
    TCbError                on_error;
    int                     err{ CURLM_OK };

    {
        TLock lock{ mutex__ };

        if (is_closed()) return;
        if (CURL_SOCKET_TIMEOUT == s) retired__.clear();

        const auto prev{ running_handles__ };
        int        running{ 0 };

        if (err = engine__.multi_socket_action(curl_multi__, s, ev_bitmask, &running); CURLM_OK != err)
        {
            logger()->error("socket action on {} failed: {}", s, engine__.multi_strerror(err));
            on_error = cb_error__;
        }
        else
        {
            running_handles__ = running;

            // A decreasing number of running transfers hints that some of them are done
            if (running < prev || static_cast<size_t>(running) < std::size(pending__)) done = drain_completions();
        }
    }

    if (CURLM_OK != err && on_error) on_error(err);

    for (auto& c : done)
        complete(c);
}

/**
 * @brief drain_completions - Read the messages of curl
 *
 * Each CURLMSG_DONE message of a transfer we own removes it from the registry and from curl.
 * Messages of unknown transfers (e.g. cancelled ones) are discarded.
 * At most MAX_DRAIN_PER_STEP messages are read: if some are left, another drive step is scheduled.
 * @return The transfers to complete, which must be done once the lock is released
 *
 * @see https://curl.se/libcurl/c/curl_multi_info_read.html
 */
std::vector<mhandle::completion>
mhandle::drain_completions()
{
    std::vector<completion> ret;
    int                     left{ 0 };

    for (int i{ 0 }; i < MAX_DRAIN_PER_STEP; ++i)
    {
        const CURLMsg* msg{ engine__.multi_info_read(curl_multi__, &left) };

        if (nullptr == msg) break;
        if (CURLMSG_DONE != msg->msg) continue;

        // The message does not survive curl_multi_remove_handle()
        const auto key{ reinterpret_cast<uintptr_t>(msg->easy_handle) };
        const auto code{ static_cast<int>(msg->data.result) };

        auto it{ pending__.find(key) };
        if (std::end(pending__) == it)
        {
            logger()->debug("discarding completion of unknown transfer {:#x}", key);
            continue;
        }

        completion c{ std::move(it->second), nullptr };
        pending__.erase(it);
        detach(*c.rec.hdl);

        if (CURLE_OK != code) c.err = std::make_exception_ptr(transfer_error(engine__.easy_strerror(code), code));

        logger()->debug("transfer {:#x} done: {}", key, code);
        ret.push_back(std::move(c));
    }

    if (left > 0)
    {
        logger()->debug("{} messages left for the next drive step", left);
        kick__->set(0);
    }

    return ret;
}

/**
 * @brief detach - Give the transfer back to its owner
 * @warning The transfer must have been removed from the registry
 */
void
mhandle::detach(handle& h) noexcept
{
    if (auto ret{ engine__.multi_remove_handle(curl_multi__, h.raw()) }; CURLM_OK != ret)
        logger()->warn("unable to remove transfer {:#x}: {}", h.id(), engine__.multi_strerror(ret));
    h.multi_handler__ = nullptr;
}

/**
 * @brief complete - Invoke the continuation of a completed transfer
 */
void
mhandle::complete(completion& c) noexcept
{
    try
    {
        if (nullptr == c.err)
        {
            if (c.rec.on_success) c.rec.on_success(*c.rec.hdl);
        }
        else if (c.rec.on_failure)
        {
            c.rec.on_failure(c.err);
        }
    }
    catch (const std::exception& e)
    {
        logger()->error("transfer continuation threw: {}", e.what());
    }
}

//---------------------------------------------------------------------------------------------------------------------
// HANDLERS INTERFACE
//---------------------------------------------------------------------------------------------------------------------

/**
 * @brief add_handle - Adds an handle (a transfer) to the multi session.
 *
 * By doing so, you give control of the transfer over the multi session until one of the continuations is called.
 * Exactly one of them will be called, exactly once, and never from within this function call (except on failure to
 * add the transfer).
 * The multi session controls a cache of connections that are shared between its transfers.
 * @param h The handle to add
 * @param on_success Called with the handle when the transfer succeeded
 * @param on_failure Called when the transfer failed (transfer_error), was removed (cancelled_error), when the session
 * is closed (closed_error) or if the transfer could not be added (attach_error, closed_error)
 *
 * @note The transfer is started on the next loop iteration
 * @note It may be called from any thread. The continuations are called from the loop thread, except on failure to
 * add the transfer.
 * @note If you want to add an handle from another session, you must first remove it from its previous session.
 */
void
mhandle::add_handle(handle& h, TCbSuccess on_success, TCbFailure on_failure)
{
    std::exception_ptr err{ nullptr };
    pending            rec{ &h, std::move(on_success), std::move(on_failure) };

    {
        TLock lock{ mutex__ };

        if (is_closed())
            err = std::make_exception_ptr(closed_error("the multi session is closed"));
        else if (h.is_closed())
            err = std::make_exception_ptr(attach_error("the transfer is closed", CURLM_BAD_EASY_HANDLE));
        else if (nullptr != h.multi_handler__)
            err = std::make_exception_ptr(attach_error(
              (this == h.multi_handler__) ? "the transfer is already owned by this session"
                                          : "the transfer is already owned by another session",
              CURLM_ADDED_ALREADY));
        else if (std::this_thread::get_id() != loop_thread__)
        {
            // Neither curl nor the loop are touched here: the loop thread adopts the transfer once woken up
            h.multi_handler__ = this;
            inbox__.insert_or_assign(h.id(), std::move(rec));
            logger()->debug("transfer {:#x} queued by another thread", h.id());
            wake();
            return;
        }
        else if (err = attach(rec); nullptr == err)
            return;
    }

    logger()->warn("unable to add transfer {:#x}", h.id());
    if (rec.on_failure) rec.on_failure(err);
}

/**
 * @brief attach - Give a transfer to curl and register it
 * @return nullptr on success, the exception to fail the transfer with otherwise (the record is left untouched)
 * @warning Loop thread only, with the lock held
 */
std::exception_ptr
mhandle::attach(pending& rec)
{
    handle& h{ *rec.hdl };

    if (auto ret{ engine__.multi_add_handle(curl_multi__, h.raw()) }; CURLM_OK != ret)
        return std::make_exception_ptr(attach_error(engine__.multi_strerror(ret), ret));

    h.multi_handler__ = this;
    pending__.insert_or_assign(h.id(), std::move(rec));
    running_handles__ = static_cast<int>(std::size(pending__));

    logger()->debug("transfer {:#x} added ({} pending)", h.id(), std::size(pending__));
    kick__->set(0);
    return nullptr;
}

/**
 * @brief adopt_inbox - Give curl the transfers queued by other threads
 * Called by the loop when the wake-up event is readable.
 */
void
mhandle::adopt_inbox()
{
    std::vector<completion> failed;

    {
        TLock lock{ mutex__ };

        if (is_closed()) return;

        std::uint64_t count{ 0 };
        if (::read(wakeup_fd__, &count, sizeof(count)) < 0 && EAGAIN != errno)
            logger()->warn("unable to read the wake-up event: {}", std::strerror(errno));

        auto queued{ std::exchange(inbox__, {}) };
        for (auto& [key, rec] : queued)
        {
            rec.hdl->multi_handler__ = nullptr;
            if (auto err{ attach(rec) }; nullptr != err) failed.push_back({ std::move(rec), err });
        }
    }

    for (auto& c : failed)
        complete(c);
}

void
mhandle::wake() noexcept
{
    const std::uint64_t one{ 1 };
    if (::write(wakeup_fd__, &one, sizeof(one)) < 0 && EAGAIN != errno)
        logger()->error("unable to wake the loop up: {}", std::strerror(errno));
}

/**
 * @brief add_handle - Adds an handle (a transfer) to the multi session.
 *
 * @param h The handle to add
 * @return A future, given the handle when the transfer succeeds, or the exception of its failure
 *
 * @warning The future is only fulfilled by the loop: do not wait for it in the loop thread
 */
std::future<handle*>
mhandle::add_handle(handle& h)
{
    auto promise{ std::make_shared<std::promise<handle*>>() };
    auto ret{ promise->get_future() };

    add_handle(
      h,
      [promise](handle& done) { promise->set_value(&done); },
      [promise](std::exception_ptr e) { promise->set_exception(e); });

    return ret;
}

/**
 * @brief remove_handle - Removes a given handle (a transfer) from the multi_handle.
 *
 * If the transfer was pending, it fails with cancelled_error.
 * After removal, it is perfectly legal to reuse the handle (e.g. by assigning it to another multi_handle)
 * Removing a handle that is not owned by this session does nothing.
 * @param h The handle to remove
 *
 * @throw closed_error if the session is closed
 */
void
mhandle::remove_handle(handle& h)
{
    std::optional<completion> c;

    {
        TLock lock{ mutex__ };

        if (is_closed()) throw closed_error("the multi session is closed");
        c = cancel(h);
    }

    if (c) complete(*c);
}

/**
 * @brief cancel - Take a transfer back from the session, without calling its continuation
 * @return The cancelled transfer, to complete once the caller is done with the handle
 */
std::optional<mhandle::completion>
mhandle::cancel(handle& h) noexcept
{
    TLock lock{ mutex__ };

    if (is_closed() || this != h.multi_handler__) return std::nullopt;

    std::optional<completion> ret;
    if (auto it{ inbox__.find(h.id()) }; std::end(inbox__) != it)
    {
        // Never given to curl
        ret = completion{ std::move(it->second), nullptr };
        inbox__.erase(it);
        h.multi_handler__ = nullptr;
    }
    else
    {
        if (auto pit{ pending__.find(h.id()) }; std::end(pending__) != pit)
        {
            ret = completion{ std::move(pit->second), nullptr };
            pending__.erase(pit);
        }
        detach(h);
    }

    if (ret)
    {
        logger()->debug("transfer {:#x} cancelled", h.id());
        ret->err = std::make_exception_ptr(cancelled_error("the transfer has been removed from its multi session"));
    }
    return ret;
}

/**
 * @brief close - Stop the session
 *
 * Every pending transfer is removed from the session, then fails with closed_error once the native session is
 * released. Once closed, the session can not be used anymore: calling close() again does nothing.
 */
void
mhandle::close() noexcept
{
    std::vector<completion> victims;

    {
        TLock lock{ mutex__ };

        if (is_closed()) return;

        timeout__->cancel();
        kick__->cancel();

        for (auto& [key, rec] : pending__)
        {
            detach(*rec.hdl);
            victims.push_back({ std::move(rec), nullptr });
        }
        pending__.clear();

        for (auto& [key, rec] : inbox__)
        {
            rec.hdl->multi_handler__ = nullptr;
            victims.push_back({ std::move(rec), nullptr });
        }
        inbox__.clear();

        // The IOs are not destroyed yet: we may be running inside one of them
        for (auto& [s, io] : ios__)
        {
            io->setRequestedEvents(0);
            retired__.push_back(std::move(io));
        }
        ios__.clear();
        if (nullptr != wakeup__)
        {
            wakeup__->setRequestedEvents(0);
            retired__.push_back(std::move(wakeup__));
        }

        if (auto ret{ engine__.multi_setopt_function(curl_multi__,
                                                     CURLMOPT_TIMERFUNCTION,
                                                     { callback_bridge::signature::timer, nullptr, nullptr }) };
            CURLM_OK != ret)
            logger()->warn("unable to unset the timer function: {}", engine__.multi_strerror(ret));
        if (auto ret{ engine__.multi_setopt_function(curl_multi__,
                                                     CURLMOPT_SOCKETFUNCTION,
                                                     { callback_bridge::signature::socket, nullptr, nullptr }) };
            CURLM_OK != ret)
            logger()->warn("unable to unset the socket function: {}", engine__.multi_strerror(ret));

        callback_bridge::release(std::exchange(timer_cb__, 0));
        callback_bridge::release(std::exchange(socket_cb__, 0));

        if (auto ret{ engine__.multi_cleanup(std::exchange(curl_multi__, nullptr)) }; CURLM_OK != ret)
            logger()->error("multi session cleanup failed: {}", engine__.multi_strerror(ret));

        running_handles__ = 0;
        arrays__.clear();
        arrays_raw__.clear();
    }

    logger()->debug("multi session closed ({} pending transfers)", std::size(victims));

    for (auto& c : victims)
    {
        c.err = std::make_exception_ptr(closed_error("the multi session has been closed"));
        complete(c);
    }
}

size_t
mhandle::enumerate_added_handles() const noexcept
{
    TLock lock{ mutex__ };
    return std::size(pending__) + std::size(inbox__);
}

int
mhandle::enumerate_running_handles() const noexcept
{
    TLock lock{ mutex__ };
    return running_handles__;
}

bool
mhandle::is_pending(const handle& h) const noexcept
{
    TLock lock{ mutex__ };
    return (this == h.multi_handler__) &&
           (std::end(pending__) != pending__.find(h.id()) || std::end(inbox__) != inbox__.find(h.id()));
}

bool
mhandle::is_closed() const noexcept
{
    TLock lock{ mutex__ };
    return nullptr == curl_multi__;
}

/**
 * @brief raw get the raw curl multi-handle (CURLM::handle)
 *
 * @warning You should not be using this, unless you absolutely need to use curl features that are not provided by
 * the \a impcurl library.
 * @return then raw multi-handle, nullptr once closed
 */
void*
mhandle::raw() const noexcept
{
    return curl_multi__;
}

/**
 * @brief version - The version string of the native engine (\see curl_version)
 */
std::string
mhandle::version()
{
    return engine::curl().version();
}

//---------------------------------------------------------------------------------------------------------------------
// OPTIONS
// Change specific multi handle options - allowing to control the way it will behave.
// \see https://curl.se/libcurl/c/curl_multi_setopt.html
//---------------------------------------------------------------------------------------------------------------------

void
mhandle::throw_option_error(int id, const std::string& what, int code) const
{
    throw option_error(multi_option_name(id), what, code);
}

void
mhandle::set_opt_long(int id, long val)
{
    if (CURLOPTTYPE_LONG != option_type(id)) throw_option_error(id, "not a long option", CURLM_BAD_FUNCTION_ARGUMENT);

    if (auto ret{ engine__.multi_setopt_long(curl_multi__, id, val) }; CURLM_OK != ret)
        throw_option_error(id, engine__.multi_strerror(ret), ret);
}

/**
 * @brief set_opt_array - Set an option of type char** (NULL terminated array)
 * The strings are retained until the option is set again or the session is closed.
 */
void
mhandle::set_opt_array(int id, std::vector<std::string> val)
{
    if (CURLOPTTYPE_OBJECTPOINT != option_type(id))
        throw_option_error(id, "not a string array option", CURLM_BAD_FUNCTION_ARGUMENT);

    std::vector<const char*> raw;
    raw.reserve(std::size(val) + 1);
    for (const auto& v : val)
        raw.push_back(v.c_str());
    raw.push_back(nullptr);

    if (auto ret{ engine__.multi_setopt_ptr(curl_multi__, id, raw.data()) }; CURLM_OK != ret)
        throw_option_error(id, engine__.multi_strerror(ret), ret);

    // Moving the vectors keeps their storage (and the strings' one)
    arrays__.insert_or_assign(id, std::move(val));
    arrays_raw__.insert_or_assign(id, std::move(raw));
}

void
mhandle::set_opt_ptr(int id, void* val)
{
    if (CURLOPTTYPE_OBJECTPOINT != option_type(id))
        throw_option_error(id, "not a pointer option", CURLM_BAD_FUNCTION_ARGUMENT);

    if (auto ret{ engine__.multi_setopt_ptr(curl_multi__, id, val) }; CURLM_OK != ret)
        throw_option_error(id, engine__.multi_strerror(ret), ret);
}

/**
 * @brief set_opt - Set an option modifying the behaviour of the session
 *
 * @param id The identifier of the option to set (CURLMOPT_*)
 * @param val The value to set: long, bool, std::vector<std::string> (string arrays) or void*
 *
 * @throw closed_error if the session is closed
 * @throw option_error if the value does not fit the option, or if the native layer refuses it
 * @note The timer and socket options are reserved to the session itself
 * @see https://curl.se/libcurl/c/curl_multi_setopt.html
 */
void
mhandle::set_opt(int id, option_value val)
{
    TLock lock{ mutex__ };

    if (is_closed()) throw closed_error("the multi session is closed");

    switch (id)
    {
        case CURLMOPT_TIMERFUNCTION:
        case CURLMOPT_TIMERDATA:
        case CURLMOPT_SOCKETFUNCTION:
        case CURLMOPT_SOCKETDATA: throw_option_error(id, "reserved to the session", CURLM_BAD_FUNCTION_ARGUMENT);
        default: break;
    }

    std::visit(
      [this, id](auto&& v) {
          using T = std::decay_t<decltype(v)>;

          if constexpr (std::is_same_v<T, long>)
              set_opt_long(id, v);
          else if constexpr (std::is_same_v<T, bool>)
              set_opt_long(id, v ? 1L : 0L);
          else if constexpr (std::is_same_v<T, std::vector<std::string>>)
              set_opt_array(id, std::move(v));
          else if constexpr (std::is_same_v<T, void*>)
              set_opt_ptr(id, v);
          else
              throw_option_error(id, "unsupported value type", CURLM_BAD_FUNCTION_ARGUMENT);
      },
      std::move(val));
}

/**
 * @brief set_max_concurrent_streams - Set the maximum number of concurrent stream (HTTP/2)
 *
 * @param max The maximum number of concurrent streams for connection done using HTTP/2
 *
 * @note This is a convenience function - it could be performed using the generic method \see mhandle::set_opt()
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_CONCURRENT_STREAMS.html
 */
void
mhandle::set_max_concurrent_streams(long max)
{
    set_opt(CURLMOPT_MAX_CONCURRENT_STREAMS, option_value{ max });
}

/**
 * @brief set_max_host_connections - Set the maximum connections to host
 *
 * @param max The maximum amount of simultaneously open connections to a single host (hostname + port)
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_HOST_CONNECTIONS.html
 */
void
mhandle::set_max_host_connections(long max)
{
    set_opt(CURLMOPT_MAX_HOST_CONNECTIONS, option_value{ max });
}

/**
 * @brief set_max_total_connections - Set the maximum number of simultaneously open connections
 *
 * When reaching the limit, the transfers will be pending until there are available connections
 * @see https://curl.se/libcurl/c/CURLMOPT_MAX_TOTAL_CONNECTIONS.html
 */
void
mhandle::set_max_total_connections(long max)
{
    set_opt(CURLMOPT_MAX_TOTAL_CONNECTIONS, option_value{ max });
}

/**
 * @brief set_maxconnects - Set the size of the connections cache
 * @see https://curl.se/libcurl/c/CURLMOPT_MAXCONNECTS.html
 */
void
mhandle::set_maxconnects(long max)
{
    set_opt(CURLMOPT_MAXCONNECTS, option_value{ max });
}

/**
 * @brief set_pipelining - Enable/disable HTTP pipelining and multiplexing
 *
 * @param mask CURLPIPE_NOTHING | CURLPIPE_HTTP1 | CURLPIPE_MULTIPLEX
 * @see https://curl.se/libcurl/c/CURLMOPT_PIPELINING.html
 */
void
mhandle::set_pipelining(long mask)
{
    set_opt(CURLMOPT_PIPELINING, option_value{ mask });
}

} // namespace impcurl
