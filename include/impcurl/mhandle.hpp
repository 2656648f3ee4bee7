/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file mhandle.hpp
 * @brief Wrapper around curl multi handle - It represents a session that can own several (thousands) transfers
 * @see https://everything.curl.dev/libcurl/drive/multi-socket for more informations
 *
 * In a nutshell, here are the key informations to know about the mhandle:
 * <ul>
 * <li>It allows to perform multiple parallel transfers</li>
 * <li>All the transfers are done in a single thread</li>
 * <li>It is driven by a miniloop event-loop: curl timers become loop::Loop::Timeout, curl sockets loop::Loop::IO</li>
 * <li>Each added transfer completes exactly once: with its handle, or with an exception (\see error.hpp)</li>
 * </ul>
 *
 * Completions are only ever decided by the curl message queue (CURLMSG_DONE). The number of running transfers is
 * merely used as a hint to read it.
 *
 * Only the thread running the loop touches curl and the loop. Transfers added from another thread are queued, and the
 * loop is woken up (eventfd) to hand them to curl.
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_MHANDLE_H
#define INCLUDE_IMPCURL_MHANDLE_H

#include <cstddef> // size_t
#include <cstdint> // uintptr_t
#include <exception>
#include <functional> // std::function
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <Loop.h>

#include "callback_bridge.hpp"
#include "engine.hpp"
#include "handle.hpp"

namespace impcurl
{
template<class T>
using uptr = std::unique_ptr<T>;

/*********************************************************************************************************************/
class mhandle
{
    friend class handle;

public:
    using TCbSuccess = std::function<void(handle&)>;
    using TCbFailure = std::function<void(std::exception_ptr)>;
    using TCbError   = std::function<void(int)>;

    static constexpr int MAX_DRAIN_PER_STEP{ 64 }; /*!< Completion messages read by a single drive step */

private:
    /**
     * @brief pending - A transfer owned by the session, waiting for its completion
     */
    struct pending
    {
        handle*    hdl{ nullptr };
        TCbSuccess on_success{};
        TCbFailure on_failure{};
    };

    /**
     * @brief completion - A pending transfer, removed from the registry, and how it ended
     */
    struct completion
    {
        pending            rec;
        std::exception_ptr err{ nullptr }; /*!< nullptr on success */
    };

    engine&     engine__;
    loop::Loop& loop__;
    void*       curl_multi__{ nullptr }; /*!< Raw curl multi-handle (CURL::CURLM) - nullptr once closed */

    mutable std::recursive_mutex mutex__{};

    std::map<uintptr_t, pending>              pending__{}; /*!< Registry of the transfers, by handle identity */
    std::map<uintptr_t, pending>              inbox__{};   /*!< Transfers added by other threads, not given to curl yet */
    std::map<curl_socket_t, uptr<loop::Loop::IO>> ios__{};     /*!< Pool of IOs, by socket */
    std::vector<uptr<loop::Loop::IO>>         retired__{}; /*!< IOs of removed sockets, destroyed later */
    std::map<int, std::vector<std::string>>   arrays__{};  /*!< String array options values */
    std::map<int, std::vector<const char*>>   arrays_raw__{};

    int running_handles__{ 0 }; /*!< Last observed number of running transfers */

    callback_bridge::id_type timer_cb__{ 0 };
    callback_bridge::id_type socket_cb__{ 0 };

    TCbError cb_error__{};

    uptr<loop::Loop::Timeout> timeout__{ nullptr }; /*!< The timer requested by curl */
    uptr<loop::Loop::Timeout> kick__{ nullptr };    /*!< Deferred drive step after a transfer was added */

    std::thread::id      loop_thread__{ std::this_thread::get_id() };
    int                  wakeup_fd__{ -1 };      /*!< eventfd written by other threads */
    uptr<loop::Loop::IO> wakeup__{ nullptr };

    mhandle(const mhandle&) = delete;
    mhandle& operator=(const mhandle&) = delete;
    mhandle(mhandle&&)                 = delete;
    mhandle& operator=(mhandle&&) = delete;

    callback_bridge::id_type install_callback(int fn_opt, int data_opt, callback_bridge::closure cb);

    int on_timer(long timeout_ms);
    int on_socket(curl_socket_t s, int what, void* socketp);

    void set_opt_long(int id, long val);
    void set_opt_array(int id, std::vector<std::string> val);
    void set_opt_ptr(int id, void* val);

    [[noreturn]] void throw_option_error(int id, const std::string& what, int code) const;

    std::exception_ptr        attach(pending& rec);
    void                      adopt_inbox();
    void                      wake() noexcept;
    void                      release_wakeup() noexcept;
    std::optional<completion> cancel(handle& h) noexcept;

protected:
    std::vector<completion> drain_completions();
    void                    detach(handle& h) noexcept;

    static void complete(completion& c) noexcept;

public:
    explicit mhandle(loop::Loop& loop, engine& eng = engine::curl());
    ~mhandle() noexcept;

    void                 add_handle(handle& h, TCbSuccess on_success, TCbFailure on_failure);
    std::future<handle*> add_handle(handle& h);
    void                 remove_handle(handle& h);

    void perform_action(curl_socket_t s = CURL_SOCKET_TIMEOUT, int ev_bitmask = 0);
    void close() noexcept;

    size_t enumerate_added_handles() const noexcept;
    int    enumerate_running_handles() const noexcept;
    bool   is_pending(const handle& h) const noexcept;
    bool   is_closed() const noexcept;

    void set_cb_error(TCbError cb) noexcept;

    void set_opt(int id, option_value val);

    // Convenience methods used for setting options
    void set_max_concurrent_streams(long max);
    void set_max_host_connections(long max);
    void set_max_total_connections(long max);
    void set_maxconnects(long max);
    void set_pipelining(long mask);
    //----------------------------------------------//

    void* raw() const noexcept;

    static std::string version();
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_MHANDLE_H
