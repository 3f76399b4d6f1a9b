/*
 * wait_group.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "wait_group.hpp"

#include <utility>

#include <boost/asio/async_result.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "detail/resumer.hpp"

namespace prism::async {

namespace net = boost::asio;

void WaitGroup::add(std::size_t count) {
    std::lock_guard<std::mutex> lock(mutex_);
    remaining_ += count;
}

void WaitGroup::done() {
    std::vector<std::function<void()>> resume;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (remaining_ == 0) {
            return;
        }
        if (--remaining_ == 0) {
            resume.swap(waiters_);
        }
    }
    for (auto& waiter : resume) {
        waiter();
    }
}

auto WaitGroup::pending() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return remaining_;
}

auto WaitGroup::wait() -> net::awaitable<void> {
    if (pending() == 0) {
        co_return;
    }

    co_await net::async_initiate<decltype(net::use_awaitable), void()>(
        [this](auto handler) {
            std::unique_lock<std::mutex> lock(mutex_);
            if (remaining_ == 0) {
                lock.unlock();
                detail::resumeLater(std::move(handler));
                return;
            }
            waiters_.push_back(detail::makeResumer(std::move(handler)));
        },
        net::use_awaitable);
}

}  // namespace prism::async
