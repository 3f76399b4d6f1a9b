/*
 * test_future_batch.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Tests for FutureBatch concurrent collection

**************************************************/

#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

#include <utility>

#include <boost/asio/io_context.hpp>

#include "async/future_batch.hpp"
#include "common/asio_test_utils.hpp"

using namespace prism::async;
using namespace std::chrono_literals;
namespace net = boost::asio;

namespace {

auto delayedValue(int value, std::chrono::milliseconds delay)
    -> net::awaitable<int> {
    co_await prism::test::sleepFor(delay);
    co_return value;
}

auto delayedThrow(std::chrono::milliseconds delay) -> net::awaitable<int> {
    co_await prism::test::sleepFor(delay);
    throw std::runtime_error("submission failed");
}

}  // namespace

class FutureBatchTest : public ::testing::Test {
protected:
    net::io_context ioc_;
    FutureBatch<int> batch_;
};

// ============================================================================
// Collection
// ============================================================================

TEST_F(FutureBatchTest, EmptyBatchYieldsEmptyResult) {
    EXPECT_TRUE(batch_.empty());
    auto results = prism::test::runSync(ioc_, batch_.run());
    EXPECT_TRUE(results.empty());
}

TEST_F(FutureBatchTest, ResultsFollowSubmissionOrder) {
    batch_.push(delayedValue(1, 60ms));
    batch_.push(delayedValue(2, 10ms));
    batch_.push(delayedValue(3, 30ms));
    EXPECT_EQ(batch_.size(), 3u);

    auto results = prism::test::runSync(ioc_, batch_.run());

    EXPECT_EQ(results, (std::vector<int>{1, 2, 3}));
}

TEST_F(FutureBatchTest, RunConsumesSubmissions) {
    batch_.push(delayedValue(7, 0ms));
    auto first = prism::test::runSync(ioc_, batch_.run());
    EXPECT_EQ(first.size(), 1u);
    EXPECT_TRUE(batch_.empty());

    auto second = prism::test::runSync(ioc_, batch_.run());
    EXPECT_TRUE(second.empty());
}

TEST_F(FutureBatchTest, MoveOnlyResults) {
    FutureBatch<std::unique_ptr<std::string>> batch;
    batch.push([]() -> net::awaitable<std::unique_ptr<std::string>> {
        co_return std::make_unique<std::string>("lamp");
    }());

    auto results = prism::test::runSync(ioc_, batch.run());

    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(*results[0], "lamp");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(FutureBatchTest, SubmissionsRunConcurrently) {
    for (int i = 0; i < 3; ++i) {
        batch_.push(delayedValue(i, 300ms));
    }

    const auto started = std::chrono::steady_clock::now();
    auto results = prism::test::runSync(ioc_, batch_.run());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(results.size(), 3u);
    EXPECT_LT(elapsed, 800ms);
}

TEST_F(FutureBatchTest, ExceptionRethrownAfterAllComplete) {
    int completed = 0;
    auto counted = [&completed](int value) -> net::awaitable<int> {
        co_await prism::test::sleepFor(100ms);
        ++completed;
        co_return value;
    };

    batch_.push(delayedThrow(10ms));
    batch_.push(counted(1));
    batch_.push(counted(2));

    EXPECT_THROW(prism::test::runSync(ioc_, batch_.run()), std::runtime_error);
    EXPECT_EQ(completed, 2);
}
