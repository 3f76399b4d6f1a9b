/*
 * test_async_mutex.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for AsyncMutex

**************************************************/

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include "async/async_mutex.hpp"
#include "common/asio_test_utils.hpp"

using namespace prism::async;
using namespace std::chrono_literals;
namespace net = boost::asio;

class AsyncMutexTest : public ::testing::Test {
protected:
    void drain() {
        ioc_.restart();
        ioc_.poll();
    }

    net::io_context ioc_;
    AsyncMutex mutex_;
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(AsyncMutexTest, TryLockAndUnlock) {
    EXPECT_FALSE(mutex_.isLocked());
    EXPECT_TRUE(mutex_.tryLock());
    EXPECT_TRUE(mutex_.isLocked());
    EXPECT_FALSE(mutex_.tryLock());

    mutex_.unlock();
    EXPECT_FALSE(mutex_.isLocked());
}

TEST_F(AsyncMutexTest, ScopedLockReleasesOnDestruction) {
    prism::test::runSync(ioc_, [this]() -> net::awaitable<void> {
        {
            auto guard = co_await mutex_.scopedLock();
            EXPECT_TRUE(guard.ownsLock());
            EXPECT_TRUE(mutex_.isLocked());
        }
        EXPECT_FALSE(mutex_.isLocked());
    }());
}

TEST_F(AsyncMutexTest, ScopedLockMoveTransfersOwnership) {
    prism::test::runSync(ioc_, [this]() -> net::awaitable<void> {
        auto first = co_await mutex_.scopedLock();
        AsyncMutex::ScopedLock second(std::move(first));

        EXPECT_FALSE(first.ownsLock());
        EXPECT_TRUE(second.ownsLock());

        second.release();
        EXPECT_FALSE(mutex_.isLocked());
    }());
}

// ============================================================================
// Contention
// ============================================================================

TEST_F(AsyncMutexTest, WaitersAcquireInArrivalOrder) {
    ASSERT_TRUE(mutex_.tryLock());
    std::vector<int> order;

    for (int id = 1; id <= 3; ++id) {
        net::co_spawn(
            ioc_,
            [this, &order, id]() -> net::awaitable<void> {
                co_await mutex_.lock();
                order.push_back(id);
                mutex_.unlock();
            },
            net::detached);
    }

    drain();
    EXPECT_TRUE(order.empty());

    mutex_.unlock();
    drain();

    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
    EXPECT_FALSE(mutex_.isLocked());
}

TEST_F(AsyncMutexTest, ExclusiveAcrossSuspensionPoints) {
    std::vector<std::string> trace;

    auto critical = [&](std::string name) -> net::awaitable<void> {
        auto guard = co_await mutex_.scopedLock();
        trace.push_back("enter " + name);
        co_await prism::test::sleepFor(20ms);
        trace.push_back("exit " + name);
    };

    net::co_spawn(ioc_, critical("a"), net::detached);
    net::co_spawn(ioc_, critical("b"), net::detached);
    ioc_.run();

    EXPECT_EQ(trace, (std::vector<std::string>{"enter a", "exit a", "enter b",
                                               "exit b"}));
}
