/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file test_callback_bridge.cpp
 * @brief Unit tests for the closure table and its trampolines
 */

#include <gtest/gtest.h>

#include <impcurl/callback_bridge.hpp>

#include <curl/curl.h>

#include <stdexcept>
#include <string>

namespace impcurl::test
{
// ============================================================================
// Fixture
// ============================================================================

class CallbackBridgeTest : public ::testing::Test
{
protected:
    void SetUp() override { baseline_ = callback_bridge::size(); }

    void TearDown() override
    {
        for (auto id : acquired_)
            callback_bridge::release(id);
        EXPECT_EQ(callback_bridge::size(), baseline_);
    }

    callback_bridge::registration acquire(callback_bridge::closure cb)
    {
        auto reg{ callback_bridge::acquire(std::move(cb)) };
        acquired_.push_back(reg.id);
        return reg;
    }

    template<class TFn>
    static TFn native(const callback_bridge::registration& reg)
    {
        return reinterpret_cast<TFn>(reg.native.fn);
    }

    size_t                                baseline_{ 0 };
    std::vector<callback_bridge::id_type> acquired_;
};

// ============================================================================
// Registration
// ============================================================================

TEST_F(CallbackBridgeTest, AcquireGivesIncreasingIds)
{
    auto first{ acquire(callback_bridge::TCbTimer{ [](long) { return 0; } }) };
    auto second{ acquire(callback_bridge::TCbTimer{ [](long) { return 0; } }) };

    EXPECT_LT(first.id, second.id);
    EXPECT_NE(first.native.userdata, second.native.userdata);
    EXPECT_EQ(callback_bridge::size(), baseline_ + 2);
}

TEST_F(CallbackBridgeTest, ReleaseIsIdempotent)
{
    auto reg{ acquire(callback_bridge::TCbTimer{ [](long) { return 0; } }) };

    callback_bridge::release(reg.id);
    EXPECT_EQ(callback_bridge::size(), baseline_);

    callback_bridge::release(reg.id);
    callback_bridge::release(0);
    EXPECT_EQ(callback_bridge::size(), baseline_);
}

TEST_F(CallbackBridgeTest, SignatureFollowsTheClosureType)
{
    using S = callback_bridge::signature;

    EXPECT_EQ(acquire(callback_bridge::TCbBuffer{ [](const char*, size_t sz) { return sz; } }).native.sig, S::buffer);
    EXPECT_EQ(acquire(callback_bridge::TCbRead{ [](char*, size_t) { return size_t{ 0 }; } }).native.sig, S::read);
    EXPECT_EQ(
      acquire(callback_bridge::TCbProgress{ [](int64_t, int64_t, int64_t, int64_t) { return 0; } }).native.sig,
      S::progress);
    EXPECT_EQ(acquire(callback_bridge::TCbDebug{ [](int, const char*, size_t) { return 0; } }).native.sig, S::debug);
    EXPECT_EQ(acquire(callback_bridge::TCbTimer{ [](long) { return 0; } }).native.sig, S::timer);
    EXPECT_EQ(acquire(callback_bridge::TCbSocket{ [](curl_socket_t, int, void*) { return 0; } }).native.sig,
              S::socket);
}

// ============================================================================
// Trampolines
// ============================================================================

TEST_F(CallbackBridgeTest, BufferTrampolineCallsTheClosure)
{
    std::string received;
    auto        reg{ acquire(callback_bridge::TCbBuffer{ [&received](const char* ptr, size_t sz) {
        received.append(ptr, sz);
        return sz;
    } }) };

    char data[]{ "hello" };
    EXPECT_EQ(native<curl_write_callback>(reg)(data, 1, 5, reg.native.userdata), 5u);
    EXPECT_EQ(received, "hello");
}

TEST_F(CallbackBridgeTest, TimerAndSocketTrampolinesForwardTheirArguments)
{
    long          ms{ -2 };
    curl_socket_t sock{ CURL_SOCKET_BAD };
    int           what{ 0 };

    auto timer{ acquire(callback_bridge::TCbTimer{ [&ms](long v) {
        ms = v;
        return 0;
    } }) };
    auto socket{ acquire(callback_bridge::TCbSocket{ [&](curl_socket_t s, int w, void*) {
        sock = s;
        what = w;
        return 0;
    } }) };

    EXPECT_EQ(native<curl_multi_timer_callback>(timer)(nullptr, 150, timer.native.userdata), 0);
    EXPECT_EQ(native<curl_socket_callback>(socket)(nullptr, 9, CURL_POLL_IN, socket.native.userdata, nullptr), 0);

    EXPECT_EQ(ms, 150);
    EXPECT_EQ(sock, 9);
    EXPECT_EQ(what, CURL_POLL_IN);
}

TEST_F(CallbackBridgeTest, ExceptionsBecomeSentinels)
{
    auto buffer{ acquire(callback_bridge::TCbBuffer{ [](const char*, size_t) -> size_t {
        throw std::runtime_error("write");
    } }) };
    auto read{ acquire(callback_bridge::TCbRead{ [](char*, size_t) -> size_t { throw std::runtime_error("read"); } }) };
    auto progress{ acquire(callback_bridge::TCbProgress{ [](int64_t, int64_t, int64_t, int64_t) -> int {
        throw std::runtime_error("progress");
    } }) };
    auto debug{ acquire(
      callback_bridge::TCbDebug{ [](int, const char*, size_t) -> int { throw std::runtime_error("debug"); } }) };
    auto timer{ acquire(callback_bridge::TCbTimer{ [](long) -> int { throw std::runtime_error("timer"); } }) };
    auto socket{ acquire(
      callback_bridge::TCbSocket{ [](curl_socket_t, int, void*) -> int { throw std::runtime_error("socket"); } }) };

    char data[]{ "x" };
    EXPECT_EQ(native<curl_write_callback>(buffer)(data, 1, 1, buffer.native.userdata), 0u);
    EXPECT_EQ(native<curl_read_callback>(read)(data, 1, 1, read.native.userdata), size_t{ CURL_READFUNC_ABORT });
    EXPECT_EQ(native<curl_xferinfo_callback>(progress)(progress.native.userdata, 0, 0, 0, 0), 1);
    EXPECT_EQ(native<curl_debug_callback>(debug)(nullptr, CURLINFO_TEXT, data, 1, debug.native.userdata), 0);
    EXPECT_EQ(native<curl_multi_timer_callback>(timer)(nullptr, 0, timer.native.userdata), -1);
    EXPECT_EQ(native<curl_socket_callback>(socket)(nullptr, 3, CURL_POLL_IN, socket.native.userdata, nullptr), -1);
}

TEST_F(CallbackBridgeTest, ReleasedClosureYieldsTheSentinel)
{
    int  calls{ 0 };
    auto reg{ acquire(callback_bridge::TCbTimer{ [&calls](long) {
        ++calls;
        return 0;
    } }) };

    callback_bridge::release(reg.id);

    EXPECT_EQ(native<curl_multi_timer_callback>(reg)(nullptr, 10, reg.native.userdata), -1);
    EXPECT_EQ(calls, 0);
}

} // namespace impcurl::test
