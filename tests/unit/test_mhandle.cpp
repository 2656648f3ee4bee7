/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file test_mhandle.cpp
 * @brief Unit tests for the multi transfer session
 *
 * Most tests drive the session by hand (mhandle::perform_action), the fake engine deciding when transfers complete.
 * A few of them let the loop drive it.
 */

#include <gtest/gtest.h>

#include <impcurl/callback_bridge.hpp>
#include <impcurl/error.hpp>
#include <impcurl/handle.hpp>
#include <impcurl/mhandle.hpp>

#include "fake_engine.hpp"

#include <Loop.h>
#include <curl/curl.h>
#include <unistd.h>

#include <atomic>
#include <deque>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace impcurl::test
{
// ============================================================================
// Fixture
// ============================================================================

/**
 * @brief outcome - How (and how many times) a transfer was resolved
 */
struct outcome
{
    int                successes{ 0 };
    int                failures{ 0 };
    std::exception_ptr error{ nullptr };

    int total() const { return successes + failures; }
};

class MultiHandleTest : public ::testing::Test
{
protected:
    void SetUp() override { bridges_ = callback_bridge::size(); }

    void TearDown() override
    {
        EXPECT_EQ(engine_.double_frees, 0);
        EXPECT_EQ(engine_.use_after_free, 0);
        EXPECT_EQ(callback_bridge::size(), bridges_);
    }

    void add(mhandle& m, handle& h, outcome& o)
    {
        m.add_handle(
          h,
          [&o](handle&) { ++o.successes; },
          [&o](std::exception_ptr e) {
              ++o.failures;
              o.error = e;
          });
    }

    template<class TError>
    static bool failed_with(const outcome& o)
    {
        if (nullptr == o.error) return false;
        try
        {
            std::rethrow_exception(o.error);
        }
        catch (const TError&)
        {
            return true;
        }
        catch (const std::exception&)
        {
            return false;
        }
    }

    static int code_of(const outcome& o)
    {
        try
        {
            std::rethrow_exception(o.error);
        }
        catch (const error& e)
        {
            return e.code();
        }
        catch (const std::exception&)
        {
            return -1;
        }
    }

    fake_engine engine_;
    loop::Loop  loop_;
    size_t      bridges_{ 0 };
};

// ============================================================================
// Construction
// ============================================================================

TEST_F(MultiHandleTest, ConstructionRegistersTimerAndSocketFunctions)
{
    mhandle m{ loop_, engine_ };

    EXPECT_FALSE(m.is_closed());
    EXPECT_NE(engine_.multi_functions.at(CURLMOPT_TIMERFUNCTION).fn, nullptr);
    EXPECT_NE(engine_.multi_functions.at(CURLMOPT_SOCKETFUNCTION).fn, nullptr);
    EXPECT_EQ(callback_bridge::size(), bridges_ + 2);
}

TEST_F(MultiHandleTest, ConstructionFailureThrowsInitError)
{
    engine_.fail_multi_init = true;
    EXPECT_THROW(mhandle{ loop_, engine_ }, init_error);

    engine_.fail_multi_init = false;
    engine_.fail_option     = CURLMOPT_SOCKETFUNCTION;
    EXPECT_THROW(mhandle{ loop_, engine_ }, init_error);
    EXPECT_EQ(engine_.multi_cleanups, 1);
}

// ============================================================================
// Completion
// ============================================================================

TEST_F(MultiHandleTest, SuccessfulTransferResolvesOnce)
{
    engine_.script("http://fake/ok", { CURLE_OK, 200, {}, "body", {} });

    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;
    handle* done{ nullptr };

    h.set_opt(CURLOPT_URL, "http://fake/ok");
    m.add_handle(
      h, [&](handle& hh) { done = &hh; ++o.successes; }, [&o](std::exception_ptr) { ++o.failures; });

    EXPECT_TRUE(m.is_pending(h));
    EXPECT_TRUE(h.is_registered());
    EXPECT_EQ(m.enumerate_added_handles(), 1u);
    EXPECT_EQ(o.total(), 0);

    engine_.finish(h.raw());
    m.perform_action();
    m.perform_action();

    EXPECT_EQ(o.successes, 1);
    EXPECT_EQ(o.failures, 0);
    EXPECT_EQ(done, &h);
    EXPECT_EQ(h.response_data(), "body");
    EXPECT_FALSE(m.is_pending(h));
    EXPECT_FALSE(h.is_registered());
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
}

TEST_F(MultiHandleTest, NativeFailureRejectsWithTransferError)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    add(m, h, o);
    engine_.finish(h.raw(), CURLE_OPERATION_TIMEDOUT);
    m.perform_action();

    ASSERT_EQ(o.failures, 1);
    EXPECT_EQ(o.successes, 0);
    EXPECT_TRUE(failed_with<transfer_error>(o));
    EXPECT_EQ(code_of(o), CURLE_OPERATION_TIMEDOUT);

    try
    {
        std::rethrow_exception(o.error);
    }
    catch (const transfer_error& e)
    {
        EXPECT_NE(std::string{ e.what() }.find("Timeout was reached"), std::string::npos);
    }
}

TEST_F(MultiHandleTest, FutureFormCarriesTheOutcome)
{
    mhandle m{ loop_, engine_ };
    handle  ok{ engine_ };
    handle  ko{ engine_ };

    auto f_ok{ m.add_handle(ok) };
    auto f_ko{ m.add_handle(ko) };

    engine_.finish(ok.raw(), CURLE_OK);
    engine_.finish(ko.raw(), CURLE_COULDNT_CONNECT);
    m.perform_action();

    EXPECT_EQ(f_ok.get(), &ok);
    EXPECT_THROW(f_ko.get(), transfer_error);
}

TEST_F(MultiHandleTest, HandleCanBeAddedAgainAfterCompletion)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome first;
    outcome second;

    add(m, h, first);
    engine_.finish(h.raw(), CURLE_OK);
    m.perform_action();

    add(m, h, second);
    EXPECT_TRUE(m.is_pending(h));
    engine_.finish(h.raw(), CURLE_OK);
    m.perform_action();

    EXPECT_EQ(first.successes, 1);
    EXPECT_EQ(second.successes, 1);
}

TEST_F(MultiHandleTest, DriveStepWithoutTransferIsHarmless)
{
    mhandle m{ loop_, engine_ };

    m.perform_action();
    m.perform_action(CURL_SOCKET_TIMEOUT, 0);

    EXPECT_EQ(engine_.socket_actions, 2);
    EXPECT_EQ(m.enumerate_running_handles(), 0);
}

TEST_F(MultiHandleTest, UnknownCompletionsAreDiscarded)
{
    engine_.purge_on_remove = false;

    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    add(m, h, o);
    engine_.finish(h.raw(), CURLE_OK);
    m.remove_handle(h);
    m.perform_action();

    EXPECT_EQ(o.failures, 1);
    EXPECT_EQ(o.successes, 0);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
}

TEST_F(MultiHandleTest, DrainIsCappedPerStep)
{
    constexpr int count{ mhandle::MAX_DRAIN_PER_STEP + 16 };

    mhandle                              m{ loop_, engine_ };
    std::vector<std::unique_ptr<handle>> handles;
    std::vector<outcome>                 outcomes(count);

    for (int i{ 0 }; i < count; ++i)
    {
        handles.push_back(std::make_unique<handle>(engine_));
        add(m, *handles.back(), outcomes[i]);
    }
    for (auto& h : handles)
        engine_.finish(h->raw(), CURLE_OK);

    m.perform_action();
    EXPECT_EQ(m.enumerate_added_handles(), 16u);

    m.perform_action();
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
    for (const auto& o : outcomes)
        EXPECT_EQ(o.successes, 1);
}

TEST_F(MultiHandleTest, DriveFailureIsReported)
{
    mhandle m{ loop_, engine_ };
    int     reported{ 0 };

    m.set_cb_error([&reported](int code) { reported = code; });
    engine_.socket_action_result = CURLM_INTERNAL_ERROR;
    m.perform_action();

    EXPECT_EQ(reported, CURLM_INTERNAL_ERROR);
}

// ============================================================================
// Registration
// ============================================================================

TEST_F(MultiHandleTest, AddingTwiceIsRefused)
{
    outcome first;
    outcome again;
    outcome elsewhere;
    mhandle m{ loop_, engine_ };
    mhandle other{ loop_, engine_ };
    handle  h{ engine_ };

    add(m, h, first);
    add(m, h, again);
    add(other, h, elsewhere);

    EXPECT_TRUE(failed_with<attach_error>(again));
    EXPECT_EQ(code_of(again), CURLM_ADDED_ALREADY);
    EXPECT_TRUE(failed_with<attach_error>(elsewhere));
    EXPECT_EQ(first.total(), 0);
    EXPECT_TRUE(m.is_pending(h));
    EXPECT_EQ(engine_.count("multi_add_handle"), 1u);
}

TEST_F(MultiHandleTest, NativeAddFailureLeavesTheHandleUsable)
{
    engine_.script("http://fake/ok", { CURLE_OK, 200, {}, "alone", {} });

    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    h.set_opt(CURLOPT_URL, "http://fake/ok");
    engine_.add_handle_result = CURLM_OUT_OF_MEMORY;
    add(m, h, o);

    EXPECT_TRUE(failed_with<attach_error>(o));
    EXPECT_EQ(code_of(o), CURLM_OUT_OF_MEMORY);
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
    EXPECT_FALSE(h.is_registered());

    EXPECT_EQ(h.perform(), CURLE_OK);
    EXPECT_EQ(h.response_data(), "alone");
}

TEST_F(MultiHandleTest, ClosedHandleIsRefused)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    h.close();
    add(m, h, o);

    EXPECT_TRUE(failed_with<attach_error>(o));
    EXPECT_EQ(engine_.count("multi_add_handle"), 0u);
}

TEST_F(MultiHandleTest, RegisteredHandleRefusesOptions)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };

    add(m, h, o);

    EXPECT_THROW(h.set_opt(CURLOPT_URL, "http://fake/other"), option_error);
    EXPECT_EQ(h.perform(), CURLE_FAILED_INIT);
}

TEST_F(MultiHandleTest, RemoveCancelsOnce)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    handle  stranger{ engine_ };
    outcome o;

    add(m, h, o);
    m.remove_handle(h);
    m.remove_handle(h);
    m.remove_handle(stranger);

    EXPECT_EQ(o.failures, 1);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
    EXPECT_FALSE(h.is_registered());
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
}

TEST_F(MultiHandleTest, CancellationWinsOverAQueuedCompletion)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    add(m, h, o);
    engine_.finish(h.raw(), CURLE_OK);
    m.remove_handle(h);
    m.perform_action();

    EXPECT_EQ(o.total(), 1);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
}

TEST_F(MultiHandleTest, ClosingAHandleCancelsItsTransfer)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    add(m, h, o);
    h.close();

    EXPECT_TRUE(failed_with<cancelled_error>(o));
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
    EXPECT_EQ(engine_.count("easy_cleanup"), 1u);
}

TEST_F(MultiHandleTest, CancelledContinuationMayDestroyItsHandleOnClose)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    auto    h{ std::make_unique<handle>(engine_) };
    auto*   target{ h.get() };

    m.add_handle(
      *h,
      [&](handle&) { ++o.successes; },
      [&](std::exception_ptr e) {
          ++o.failures;
          o.error = e;
          h.reset();
      });

    target->close();

    EXPECT_EQ(h, nullptr);
    EXPECT_EQ(o.total(), 1);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
    EXPECT_EQ(engine_.count("easy_cleanup"), 1u);
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
}

TEST_F(MultiHandleTest, CancelledContinuationMayDestroyItsHandleOnReset)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    auto    h{ std::make_unique<handle>(engine_) };
    auto*   target{ h.get() };

    m.add_handle(
      *h,
      [&](handle&) { ++o.successes; },
      [&](std::exception_ptr e) {
          ++o.failures;
          o.error = e;
          h.reset();
      });

    target->reset();

    EXPECT_EQ(h, nullptr);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
    EXPECT_EQ(engine_.count("easy_reset"), 1u);
    EXPECT_EQ(engine_.count("easy_cleanup"), 1u);
}

TEST_F(MultiHandleTest, RegisteredTransferCanBePaused)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };

    add(m, h, o);

    EXPECT_TRUE(h.pause(CURLPAUSE_RECV));
    EXPECT_TRUE(h.is_paused(CURLPAUSE_RECV));
    EXPECT_EQ(engine_.easies.at(h.raw()).paused, CURLPAUSE_RECV);

    EXPECT_TRUE(h.unpause(CURLPAUSE_RECV));
    EXPECT_FALSE(h.is_paused(CURLPAUSE_RECV));
    EXPECT_EQ(engine_.easies.at(h.raw()).paused, 0);

    EXPECT_TRUE(m.is_pending(h));
    EXPECT_EQ(o.total(), 0);
}

// ============================================================================
// Close
// ============================================================================

TEST_F(MultiHandleTest, CloseRejectsEveryPendingTransfer)
{
    handle  a{ engine_ };
    handle  b{ engine_ };
    outcome oa;
    outcome ob;

    {
        mhandle m{ loop_, engine_ };
        add(m, a, oa);
        add(m, b, ob);

        m.close();
        m.close();

        EXPECT_TRUE(m.is_closed());
        EXPECT_EQ(m.raw(), nullptr);
        EXPECT_EQ(engine_.multi_cleanups, 1);
    }

    EXPECT_EQ(engine_.multi_cleanups, 1);
    EXPECT_TRUE(failed_with<closed_error>(oa));
    EXPECT_TRUE(failed_with<closed_error>(ob));
    EXPECT_EQ(oa.total(), 1);
    EXPECT_EQ(ob.total(), 1);
    EXPECT_FALSE(a.is_registered());
}

TEST_F(MultiHandleTest, ClosedSessionRefusesEverything)
{
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    outcome o;

    m.close();
    const auto native_calls{ engine_.calls.size() };

    add(m, h, o);
    m.perform_action();

    EXPECT_TRUE(failed_with<closed_error>(o));
    EXPECT_THROW(m.add_handle(h).get(), closed_error);
    EXPECT_THROW(m.remove_handle(h), closed_error);
    EXPECT_THROW(m.set_maxconnects(4), closed_error);
    EXPECT_EQ(engine_.calls.size(), native_calls);
}

TEST_F(MultiHandleTest, CloseFromAContinuation)
{
    mhandle m{ loop_, engine_ };
    handle  first{ engine_ };
    handle  second{ engine_ };
    outcome o2;

    m.add_handle(
      first, [&m](handle&) { m.close(); }, [](std::exception_ptr) {});
    add(m, second, o2);

    engine_.finish(first.raw(), CURLE_OK);
    m.perform_action();

    EXPECT_TRUE(m.is_closed());
    EXPECT_TRUE(failed_with<closed_error>(o2));
}

// ============================================================================
// Options
// ============================================================================

TEST_F(MultiHandleTest, OptionsReachTheEngine)
{
    mhandle m{ loop_, engine_ };

    m.set_max_concurrent_streams(100);
    m.set_max_host_connections(6);
    m.set_max_total_connections(12);
    m.set_maxconnects(3);
    m.set_pipelining(CURLPIPE_MULTIPLEX);
    m.set_opt(CURLMOPT_PIPELINING_SITE_BL, std::vector<std::string>{ "a.example", "b.example" });

    EXPECT_EQ(engine_.multi_longs.at(CURLMOPT_MAX_CONCURRENT_STREAMS), 100);
    EXPECT_EQ(engine_.multi_longs.at(CURLMOPT_MAX_HOST_CONNECTIONS), 6);
    EXPECT_EQ(engine_.multi_longs.at(CURLMOPT_MAX_TOTAL_CONNECTIONS), 12);
    EXPECT_EQ(engine_.multi_longs.at(CURLMOPT_MAXCONNECTS), 3);
    EXPECT_EQ(engine_.multi_longs.at(CURLMOPT_PIPELINING), CURLPIPE_MULTIPLEX);

    auto array{ static_cast<const char* const*>(engine_.multi_ptrs.at(CURLMOPT_PIPELINING_SITE_BL)) };
    EXPECT_STREQ(array[0], "a.example");
    EXPECT_STREQ(array[1], "b.example");
    EXPECT_EQ(array[2], nullptr);
}

TEST_F(MultiHandleTest, InvalidOptionsAreRejected)
{
    mhandle m{ loop_, engine_ };

    EXPECT_THROW(m.set_opt(CURLMOPT_TIMERDATA, static_cast<void*>(nullptr)), option_error);
    EXPECT_THROW(m.set_opt(CURLMOPT_SOCKETFUNCTION, static_cast<void*>(nullptr)), option_error);
    EXPECT_THROW(m.set_opt(CURLMOPT_MAXCONNECTS, std::string{ "3" }), option_error);
    EXPECT_THROW(m.set_opt(CURLMOPT_MAXCONNECTS, std::vector<std::string>{ "3" }), option_error);

    engine_.fail_option = CURLMOPT_MAXCONNECTS;
    try
    {
        m.set_maxconnects(3);
        FAIL() << "option_error expected";
    }
    catch (const option_error& e)
    {
        EXPECT_EQ(e.option(), "CURLMOPT_MAXCONNECTS");
        EXPECT_EQ(e.code(), CURLM_UNKNOWN_OPTION);
    }
}

// ============================================================================
// Native callbacks
// ============================================================================

TEST_F(MultiHandleTest, TimerRequestsAreAccepted)
{
    mhandle m{ loop_, engine_ };

    EXPECT_EQ(engine_.fire_timer(0), 0);
    EXPECT_EQ(engine_.fire_timer(250), 0);
    EXPECT_EQ(engine_.fire_timer(-1), 0);
}

TEST_F(MultiHandleTest, SocketsAreWatchedAndForgotten)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);

    {
        mhandle m{ loop_, engine_ };

        EXPECT_EQ(engine_.fire_socket(fds[0], CURL_POLL_IN), 0);
        EXPECT_EQ(engine_.count("multi_assign"), 1u);
        EXPECT_EQ(engine_.fire_socket(fds[0], CURL_POLL_INOUT), 0);
        EXPECT_EQ(engine_.count("multi_assign"), 1u);
        EXPECT_EQ(engine_.fire_socket(fds[0], CURL_POLL_REMOVE), 0);

        EXPECT_EQ(engine_.fire_socket(fds[1], CURL_POLL_OUT), 0);
    }

    ::close(fds[0]);
    ::close(fds[1]);
}

// ============================================================================
// Loop driven
// ============================================================================

TEST_F(MultiHandleTest, LoopDrivesAddedTransfers)
{
    engine_.auto_complete = true;
    engine_.script("http://fake/ok", { CURLE_OK, 200, {}, "looped", {} });

    outcome o;
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };

    loop::Loop::Timeout guard{ loop_ };
    guard.onTimeout([this]() { loop_.exit(); });
    guard.set(2000);

    h.set_opt(CURLOPT_URL, "http://fake/ok");
    m.add_handle(
      h,
      [&](handle&) {
          ++o.successes;
          loop_.exit();
      },
      [&](std::exception_ptr) {
          ++o.failures;
          loop_.exit();
      });

    // Nothing is driven from within add_handle
    EXPECT_EQ(engine_.socket_actions, 0);

    loop_.run();
    guard.cancel();

    EXPECT_EQ(o.successes, 1);
    EXPECT_EQ(h.response_data(), "looped");
}

TEST_F(MultiHandleTest, TimerRequestsReplaceEachOther)
{
    mhandle m{ loop_, engine_ };

    loop::Loop::Timeout guard{ loop_ };
    guard.onTimeout([this]() { loop_.exit(); });
    guard.set(100);

    // A single timer is outstanding: deleting it leaves none
    engine_.fire_timer(0);
    engine_.fire_timer(0);
    engine_.fire_timer(10);
    engine_.fire_timer(-1);

    loop_.run();

    EXPECT_EQ(engine_.socket_actions, 0);
}

TEST_F(MultiHandleTest, ReplacedTimerFiresOnceAtTheNewDelay)
{
    mhandle m{ loop_, engine_ };

    loop::Loop::Timeout guard{ loop_ };
    guard.onTimeout([this]() { loop_.exit(); });
    guard.set(40);

    engine_.fire_timer(50);
    engine_.fire_timer(10);

    loop_.run();

    EXPECT_EQ(engine_.socket_actions, 1);
}

// ============================================================================
// Other threads
// ============================================================================

TEST_F(MultiHandleTest, TransferAddedFromAnotherThreadIsDrivenByTheLoop)
{
    engine_.auto_complete = true;
    engine_.script("http://fake/ok", { CURLE_OK, 200, {}, "threaded", {} });

    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };
    h.set_opt(CURLOPT_URL, "http://fake/ok");

    std::atomic<bool> done{ false };
    handle*           result{ nullptr };

    std::thread worker([&]() {
        auto f{ m.add_handle(h) };
        try
        {
            result = f.get();
        }
        catch (const std::exception&)
        {
            result = nullptr;
        }
        done = true;
    });

    // The loop exits once the worker got its result
    int                   ticks{ 0 };
    loop::Loop::Timeout   poll{ loop_ };
    std::function<void()> check{ [&]() {
        if (done || ++ticks > 400)
            loop_.exit();
        else
            poll.set(5);
    } };
    poll.onTimeout(check);
    poll.set(5);

    loop_.run();
    worker.join();

    EXPECT_TRUE(done);
    EXPECT_EQ(result, &h);
    EXPECT_EQ(h.response_data(), "threaded");
    EXPECT_EQ(engine_.count("multi_add_handle"), 1u);
    EXPECT_EQ(m.enumerate_added_handles(), 0u);
}

TEST_F(MultiHandleTest, TransferQueuedByAnotherThreadWaitsForTheLoop)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };

    std::thread worker([&]() { add(m, h, o); });
    worker.join();

    // Nothing native happens outside of the loop thread
    EXPECT_EQ(engine_.count("multi_add_handle"), 0u);
    EXPECT_TRUE(m.is_pending(h));
    EXPECT_EQ(m.enumerate_added_handles(), 1u);

    outcome again;
    add(m, h, again);
    EXPECT_TRUE(failed_with<attach_error>(again));

    m.remove_handle(h);
    EXPECT_TRUE(failed_with<cancelled_error>(o));
    EXPECT_EQ(engine_.count("multi_remove_handle"), 0u);
    EXPECT_FALSE(m.is_pending(h));
}

TEST_F(MultiHandleTest, CloseRejectsTransfersQueuedByAnotherThread)
{
    outcome o;
    mhandle m{ loop_, engine_ };
    handle  h{ engine_ };

    std::thread worker([&]() { add(m, h, o); });
    worker.join();

    m.close();

    EXPECT_EQ(o.total(), 1);
    EXPECT_TRUE(failed_with<closed_error>(o));
    EXPECT_EQ(engine_.count("multi_add_handle"), 0u);
}

// ============================================================================
// Interleavings
// ============================================================================

TEST_F(MultiHandleTest, RandomInterleavingsResolveEachTransferAtMostOnce)
{
    constexpr int transfers{ 24 };
    constexpr int steps{ 600 };

    for (unsigned seed{ 1 }; seed <= 20; ++seed)
    {
        std::mt19937                         rng{ seed };
        std::vector<std::unique_ptr<handle>> handles;
        std::vector<std::deque<outcome>>     rounds(transfers);

        {
            mhandle m{ loop_, engine_ };

            for (int i{ 0 }; i < transfers; ++i)
                handles.push_back(std::make_unique<handle>(engine_));

            for (int s{ 0 }; s < steps; ++s)
            {
                const auto i{ static_cast<size_t>(rng() % transfers) };
                auto&      h{ *handles[i] };

                switch (rng() % 5)
                {
                    case 0:
                        if (!h.is_registered())
                        {
                            rounds[i].emplace_back();
                            add(m, h, rounds[i].back());
                        }
                        break;
                    case 1:
                        if (m.is_pending(h) && 0 == engine_.finished.count(h.raw()))
                            engine_.finish(h.raw(), (rng() % 2) ? CURLE_OK : CURLE_RECV_ERROR);
                        break;
                    case 2: m.remove_handle(h); break;
                    default: m.perform_action(); break;
                }

                // Registry invariant
                size_t pending{ 0 };
                for (const auto& hh : handles)
                    if (m.is_pending(*hh)) ++pending;
                ASSERT_EQ(pending, m.enumerate_added_handles());
            }
        }

        for (const auto& per_handle : rounds)
        {
            for (const auto& o : per_handle)
                EXPECT_EQ(o.total(), 1) << "seed " << seed;
        }
        for (const auto& h : handles)
            EXPECT_FALSE(h->is_registered());
    }
}

} // namespace impcurl::test
